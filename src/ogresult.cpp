/*
 * ogex: subject text, and the results of a match
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<ogex.h>

OgSubject::Body::Body(const std::string& _text)
: text(_text)
{
	const UTF8*	start = text.c_str();
	const UTF8*	cp = start;
	const UTF8*	ep = start + text.size();

	while (cp < ep)
	{
		offsets.push_back((int)(cp - start));
		chars.push_back(UTF8Get(cp));
	}
	offsets.push_back((int)text.size());
}

OgSubject::OgSubject()
: body(new Body(std::string()))
{
}

OgSubject::OgSubject(const std::string& text)
: body(new Body(text))
{
}

OgSubject::OgSubject(const char* text)
: body(new Body(text ? std::string(text) : std::string()))
{
}

int
OgSubject::byteOffset(int offset) const
{
	if (offset <= 0)
		return 0;
	if (offset >= length())
		return (int)body->text.size();
	return body->offsets[offset];
}

std::string
OgSubject::substr(int start, int end) const
{
	if (start < 0)
		start = 0;
	if (end > length())
		end = length();
	if (end <= start)
		return std::string();
	int	from = byteOffset(start);
	return body->text.substr(from, byteOffset(end) - from);
}

OgProgram::OgProgram()
: pattern_length(0)
, features_enabled(OgFeature::AllFeatures)
, step_limit(0)
, root_node(0)
, slot_count(0)
{
}

OgProgram::~OgProgram()
{
}

OgMatch::OgMatch()
{
}

OgMatch::OgMatch(const Error& abandoned)
: err(abandoned)
{
}

OgMatch::OgMatch(const OgProgram* _program, const OgSubject& subject, const std::vector<int>& _captures)
: program(_program)
, target(subject)
, captures(_captures)
{
}

bool
OgMatch::groupSet(int n) const
{
	return succeeded() && n >= 0 && n <= groupCount() && captures[2*n] >= 0 && captures[2*n+1] >= 0;
}

int
OgMatch::groupStart(int n) const
{
	return groupSet(n) ? captures[2*n] : -1;
}

int
OgMatch::groupEnd(int n) const
{
	return groupSet(n) ? captures[2*n+1] : -1;
}

std::string
OgMatch::group(int n) const
{
	if (!groupSet(n))
		return std::string();
	return target.substr(captures[2*n], captures[2*n+1]);
}

bool
OgMatch::namedGroupSet(const std::string& name) const
{
	return program && groupSet(program->groupIndex(name));
}

std::string
OgMatch::namedGroup(const std::string& name) const
{
	if (!program)
		return std::string();
	return group(program->groupIndex(name));
}
