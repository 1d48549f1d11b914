/*
 * ogex: capture group numbering and name resolution
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<og_groups.h>

bool
OgGroupTable::add(const std::string& name, int& index)
{
	if (!name.empty() && names.find(name) != names.end())
		return false;

	Group	group;
	group.name = name;
	groups.push_back(group);
	index = (int)groups.size();
	if (name.empty())
		numbered.push_back(index);
	else
		names[name] = index;
	return true;
}

bool
OgGroupTable::isNamed(int index) const
{
	return index >= 1 && index <= count() && !groups[index-1].name.empty();
}

const std::string&
OgGroupTable::name(int index) const
{
	static	const std::string	unnamed;
	if (index < 1 || index > count())
		return unnamed;
	return groups[index-1].name;
}

int
OgGroupTable::lookup(const std::string& name) const
{
	auto	iter = names.find(name);
	return iter == names.end() ? -1 : iter->second;
}

int
OgGroupTable::relative(int n) const
{
	if (n < 1 || n > numberedCount())
		return 0;
	return numbered[numbered.size() - n];
}
