#if !defined(OG_GROUPS_H)
#define OG_GROUPS_H
/*
 * ogex: the table of capture groups of a pattern.
 *
 * Groups are numbered from 1 in the order their opening parentheses appear.
 * Named groups get a number too, but relative backreferences \g{-N} count
 * backwards over the unnamed groups only, so a separate list of those is kept.
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<string>
#include	<vector>
#include	<unordered_map>

class OgGroupTable
{
public:
	OgGroupTable() {}

	// Register the group whose parenthesis has just opened. An empty name means unnamed.
	// Returns false if the name is already in use.
	bool		add(const std::string& name, int& index);

	int		count() const { return (int)groups.size(); }
	int		numberedCount() const { return (int)numbered.size(); }
	bool		isNamed(int index) const;
	const std::string& name(int index) const;	// Empty for unnamed groups
	int		lookup(const std::string& name) const;	// Index, or -1 if there is no such name

	// Resolve \g{-n} against the groups registered so far. Returns 0 if unresolvable.
	int		relative(int n) const;

private:
	struct Group
	{
		std::string	name;
	};
	std::vector<Group>	groups;		// groups[i] is group i+1
	std::vector<int>	numbered;	// Indices of the unnamed groups, in order
	std::unordered_map<std::string, int>	names;
};

#endif	// OG_GROUPS_H
