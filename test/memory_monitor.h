/*
 * Memory leak monitoring and reporting for test programs
 *
 * Linking memory_monitor.cpp replaces operator new and delete. A test case
 * that leaves allocations behind after its objects are gone has leaked.
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */

void	start_recording_allocations();		// Allocations before this are not counted
int	allocation_growth_count();		// Unfreed allocations made since recording started
void	report_allocation_growth();		// Print them
