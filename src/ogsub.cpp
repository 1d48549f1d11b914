/*
 * ogex: substitution templates
 *
 * A template is literal text with group insertions:
 *	\N		group N (decimal digits; \0 is the whole match)
 *	\g{N}		group N
 *	\g{name}	the named group
 *	\G		the whole match
 * Any other backslashed character stands for itself, and a trailing backslash is literal.
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<ogex.h>

namespace {
struct TemplatePart
{
	std::string	literal;
	int		group;		// -1 for literal text
};
}

/*
 * Split the template into parts, resolving every group reference against the
 * program's groups. An unknown group is an error even if it would never be used.
 */
static Error
parse_template(const OgProgram& program, const std::string& tmpl, std::vector<TemplatePart>& parts)
{
	size_t		i = 0;
	size_t		len = tmpl.size();
	std::string	literal;

	auto	flush =
		[&]()
		{
			if (literal.empty())
				return;
			TemplatePart	part;
			part.literal = literal;
			part.group = -1;
			parts.push_back(part);
			literal.clear();
		};
	auto	insert =
		[&](int group)
		{
			flush();
			TemplatePart	part;
			part.group = group;
			parts.push_back(part);
		};
	auto	is_digit = [](char c) -> bool { return c >= '0' && c <= '9'; };

	parts.clear();
	while (i < len)
	{
		char	c = tmpl[i++];
		if (c != '\\' || i == len)
		{
			literal += c;
			continue;
		}

		size_t	at = i-1;	// Offset of the backslash, for error reporting
		c = tmpl[i];
		if (is_digit(c))
		{
			int	group = 0;
			for (; i < len && is_digit(tmpl[i]); i++)
				if (group <= program.groupCount())
					group = group*10 + (tmpl[i]-'0');
			if (group > program.groupCount())
				return Error(OG_ERR_SUBSTITUTION, "Reference to undefined group in template", (int)at);
			insert(group);
		}
		else if (c == 'G')
		{
			i++;
			insert(0);
		}
		else if (c == 'g' && i+1 < len && tmpl[i+1] == '{')
		{
			size_t	close = tmpl.find('}', i+2);
			if (close == std::string::npos)
				return Error(OG_ERR_SUBSTITUTION, "Unterminated group reference in template", (int)at);
			std::string	ref = tmpl.substr(i+2, close-(i+2));
			int		group = -1;

			if (!ref.empty() && is_digit(ref[0]))
			{
				size_t	k;
				group = 0;
				for (k = 0; k < ref.size() && is_digit(ref[k]); k++)
					if (group <= program.groupCount())
						group = group*10 + (ref[k]-'0');
				if (k < ref.size() || group > program.groupCount())
					group = -1;
			}
			else
				group = program.groupIndex(ref);
			if (group < 0)
				return Error(OG_ERR_SUBSTITUTION, "Reference to undefined group in template", (int)at);
			i = close+1;
			insert(group);
		}
		else
		{
			literal += c;
			i++;
		}
	}
	flush();
	return Error();
}

static void
expand_parts(const OgMatch& match, const std::vector<TemplatePart>& parts, std::string& result)
{
	for (const TemplatePart& part: parts)
		if (part.group < 0)
			result += part.literal;
		else
			result += match.group(part.group);	// Empty if the group is unset
}

Error
OgMatch::expand(const std::string& tmpl, std::string& result) const
{
	std::vector<TemplatePart>	parts;

	result.clear();
	if (!program)
		return err;
	Error	error = parse_template(*program, tmpl, parts);
	if (error)
		return error;
	expand_parts(*this, parts, result);
	return Error();
}

/*
 * Replace successive matches, found as findAll finds them, copying the text
 * between them unchanged. The result is only valid if no error is returned.
 */
Error
OgProgram::sub(const std::string& tmpl, const OgSubject& subject, std::string& result, int count) const
{
	std::vector<TemplatePart>	parts;
	long	steps = 0;
	int	cursor = 0;		// Where to search next
	int	copied = 0;		// Subject text up to here is in the result
	int	replaced = 0;

	result.clear();
	Error	error = parse_template(*this, tmpl, parts);
	if (error)
		return error;

	while (cursor <= subject.length() && (count < 0 || replaced < count))
	{
		OgMatch	found = scan(subject, cursor, subject.length(), steps);
		if (!found)
		{
			if (found.error())
				return found.error();
			break;
		}
		result += subject.substr(copied, found.start());
		expand_parts(found, parts, result);
		copied = found.end();
		replaced++;
		cursor = found.length() > 0 ? found.end() : found.end()+1;
	}
	result += subject.substr(copied, subject.length());
	return Error();
}
