/*
 * ogex: a cache of compiled programs, and compile-and-call conveniences
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<ogex.h>

OgCache::OgCache(size_t capacity)
: max_entries(capacity)
, hit_count(0)
, miss_count(0)
{
}

void
OgCache::clear()
{
	index.clear();
	entries.clear();
}

Error
OgCache::compile(const std::string& pattern, Ref<OgProgram>& program, OgFeature features)
{
	std::string	key = std::to_string((int32_t)features) + ":" + pattern;

	auto	found = index.find(key);
	if (found != index.end())
	{
		hit_count++;
		entries.splice(entries.begin(), entries, found->second);	// Now the most recently used
		program = entries.front().program;
		return Error();
	}

	miss_count++;
	OgCompiler	compiler(pattern, features);
	Ref<OgProgram>	compiled;
	if (!compiler.compile(compiled))
		return compiler.error();

	Entry	entry;
	entry.key = key;
	entry.program = compiled;
	entries.push_front(entry);
	index[key] = entries.begin();
	if (max_entries > 0 && entries.size() > max_entries)
	{
		index.erase(entries.back().key);
		entries.pop_back();
	}
	program = compiled;
	return Error();
}

Error
ogCompile(const std::string& pattern, Ref<OgProgram>& program, OgFeature features, OgCache* cache)
{
	if (cache)
		return cache->compile(pattern, program, features);

	OgCompiler	compiler(pattern, features);
	if (!compiler.compile(program))
		return compiler.error();
	return Error();
}

Error
ogMatch(const std::string& pattern, const OgSubject& subject, OgMatch& match, OgCache* cache)
{
	Ref<OgProgram>	program;
	Error		error = ogCompile(pattern, program, OgFeature::AllFeatures, cache);
	if (error)
		return error;
	match = program->match(subject);
	return match.error();
}

Error
ogSearch(const std::string& pattern, const OgSubject& subject, OgMatch& match, OgCache* cache)
{
	Ref<OgProgram>	program;
	Error		error = ogCompile(pattern, program, OgFeature::AllFeatures, cache);
	if (error)
		return error;
	match = program->search(subject);
	return match.error();
}

Error
ogFindAll(const std::string& pattern, const OgSubject& subject, std::vector<OgMatch>& matches, OgCache* cache)
{
	Ref<OgProgram>	program;
	Error		error = ogCompile(pattern, program, OgFeature::AllFeatures, cache);
	matches.clear();
	if (error)
		return error;
	return program->findAll(subject, matches);
}

Error
ogSub(const std::string& pattern, const std::string& tmpl, const OgSubject& subject, std::string& result, int count, OgCache* cache)
{
	Ref<OgProgram>	program;
	Error		error = ogCompile(pattern, program, OgFeature::AllFeatures, cache);
	result.clear();
	if (error)
		return error;
	return program->sub(tmpl, subject, result, count);
}
