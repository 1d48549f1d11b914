/*
 * ogex command-line tool: test, convert, find, match and substitute
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<ogex.h>

#include	<cstdio>
#include	<cstdlib>
#include	<cstring>

static void
usage()
{
	fprintf(stderr,
		"Usage: ogex [-i] [-m] [-n] [-x] [-c] [-l steps] command args\n"
		"	test <pattern> <input> [-v]	Search, showing the match and its groups\n"
		"	convert <pattern> [-d]		Show the pattern in PCRE syntax\n"
		"	find <pattern> <input>		Show every match\n"
		"	match <pattern> <input>		Exit 0 if the input matches from the start, else 1\n"
		"	sub <pattern> <template> <input> [count]	Show the input with matches replaced\n"
		"Options:\n"
		"	-i	ignore case\n"
		"	-m	^ and $ match at line breaks\n"
		"	-n	. does not match newline\n"
		"	-x	extended syntax; whitespace and # comments are ignored\n"
		"	-c	C escapes \\n \\t \\r \\f \\v \\e\n"
		"	-l	abandon any search that takes more than this many steps\n"
	);
	exit(2);
}

static int
fail(const Error& error)
{
	if (error.offset() >= 0)
		fprintf(stderr, "Error: %s at offset %d\n", error.message(), error.offset());
	else
		fprintf(stderr, "Error: %s\n", error.message());
	return 1;
}

static void
show_match(const OgProgram& program, const OgMatch& match, bool groups)
{
	printf("Match at %d..%d: \"%s\"\n", match.start(), match.end(), match.text().c_str());
	if (!groups)
		return;
	for (int g = 1; g <= match.groupCount(); g++)
	{
		const std::string&	name = program.groupName(g);
		printf("  Group %d", g);
		if (!name.empty())
			printf(" (%s)", name.c_str());
		if (match.groupSet(g))
			printf(": %d..%d = \"%s\"\n", match.groupStart(g), match.groupEnd(g), match.group(g).c_str());
		else
			printf(": unset\n");
	}
}

int
main(int argc, const char** argv)
{
	OgFeature	features = OgFeature::AllFeatures;
	long		step_limit = 0;

	for (argc--, argv++; argc > 0 && argv[0][0] == '-'; argc--, argv++)
	{
		if (0 == strcmp("-i", argv[0]))
			features = features | OgFeature::CaseInsensitive;
		else if (0 == strcmp("-m", argv[0]))
			features = features | OgFeature::Multiline;
		else if (0 == strcmp("-n", argv[0]))
			features = features | OgFeature::AnyExcludesNL;
		else if (0 == strcmp("-x", argv[0]))
			features = features | OgFeature::ExtendedRE;
		else if (0 == strcmp("-c", argv[0]))
			features = features | OgFeature::CEscapes;
		else if (0 == strcmp("-l", argv[0]) && argc > 1)
		{
			argc--, argv++;
			step_limit = atol(argv[0]);
		}
		else
			usage();
	}
	if (argc < 2)
		usage();

	const char*	command = argv[0];
	const char*	pattern = argv[1];
	argc -= 2, argv += 2;

	OgCompiler	compiler(pattern, features);
	Ref<OgProgram>	program;
	compiler.setStepLimit(step_limit);
	if (!compiler.compile(program))
		return fail(compiler.error());

	if (0 == strcmp("convert", command))
	{
		bool	debug = argc > 0 && 0 == strcmp("-d", argv[0]);
		if (argc > (debug ? 1 : 0))
			usage();
		if (debug)
		{
			program->dump();
			program->dumpCode();
		}
		printf("%s\n", program->transpile().c_str());
		return 0;
	}

	if (0 == strcmp("test", command))
	{
		bool	verbose = argc == 2 && 0 == strcmp("-v", argv[1]);
		if (argc != (verbose ? 2 : 1))
			usage();
		if (verbose)
		{
			program->dump();
			program->dumpCode();
		}
		OgMatch	match = program->search(OgSubject(argv[0]));
		if (match.error())
			return fail(match.error());
		if (match)
			show_match(*program, match, true);
		else
			printf("No match\n");
		return 0;
	}

	if (0 == strcmp("find", command))
	{
		std::vector<OgMatch>	matches;
		if (argc != 1)
			usage();
		Error	error = program->findAll(OgSubject(argv[0]), matches);
		if (error)
			return fail(error);
		if (matches.empty())
			printf("No matches found\n");
		else
			printf("Found %d match%s\n", (int)matches.size(), matches.size() == 1 ? "" : "es");
		for (const OgMatch& match: matches)
			show_match(*program, match, false);
		return 0;
	}

	if (0 == strcmp("match", command))
	{
		if (argc != 1)
			usage();
		OgMatch	match = program->match(OgSubject(argv[0]));
		if (match.error())
			return fail(match.error());
		if (!match)
		{
			printf("No match\n");
			return 1;
		}
		show_match(*program, match, true);
		return 0;
	}

	if (0 == strcmp("sub", command))
	{
		std::string	result;
		int		count = -1;
		if (argc != 2 && argc != 3)
			usage();
		if (argc == 3)
			count = atoi(argv[2]);
		Error	error = program->sub(argv[0], OgSubject(argv[1]), result, count);
		if (error)
			return fail(error);
		printf("%s\n", result.c_str());
		return 0;
	}

	usage();
	return 2;
}
