/*
 * ogex: unit test driver for the pattern compiler.
 * Each pattern is compiled and converted back to PCRE syntax, or must fail with the expected message.
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<stdio.h>
#include	<string.h>

#include	<ogex.h>

#include	"memory_monitor.h"

bool	verbose = false;
int	automated_tests();

int
main(int argc, char** argv)
{
	while (argc > 1 && *argv[1] == '-')
	{
		if (0 == strcmp("-v", argv[1]))
			verbose = true;
		argc--; argv++;
	}

	if (argc == 1)
		return automated_tests();

	for (--argc, ++argv; argc > 0; argc--, argv++)
	{
		OgCompiler	compiler(*argv, OgFeature::AllFeatures | OgFeature::ExtendedRE);
		Ref<OgProgram>	program;

		printf("Compiling '%s'\n", *argv);
		if (!compiler.compile(program))
		{
			printf("Pattern compile failed at %d: %s\n", compiler.errorOffset(), compiler.errorMessage());
			continue;
		}
		program->dump();
		program->dumpCode();
		printf("PCRE: %s\n", program->transpile().c_str());
	}
	return 0;
}

struct	parse_test {
	const char*	pattern;		// The pattern to compile, or zero for a heading
	const char*	expected;		// The expected PCRE syntax, or zero if the compile must fail
	const char*	expected_message;	// The expected error message
	int		expected_offset;	// Where the error is reported
};
parse_test	parse_tests[] =
{
	{ 0,	"--- Literals ---", 0, 0 },
	{ "",			"",			0, 0 },
	{ "a",			"a",			0, 0 },
	{ "abc",		"abc",			0, 0 },
	{ "\\.",		"\\.",			0, 0 },
	{ "\\(\\)",		"\\(\\)",		0, 0 },
	{ "x{",			"x\\{",			0, 0 },
	{ "}",			"\\}",			0, 0 },
	{ "\\q",		"q",			0, 0 },
	{ "\\n",		"n",			0, 0 },

	{ 0,	"--- Classes and shorthands ---", 0, 0 },
	{ ".",			".",			0, 0 },
	{ "\\d\\w\\s",		"\\d\\w\\s",		0, 0 },
	{ "\\D\\W\\S",		"\\D\\W\\S",		0, 0 },
	{ "[a-c]",		"[a-c]",		0, 0 },
	{ "[a-c\\]]",		"[a-c\\]]",		0, 0 },
	{ "[^\\d_]",		"[^\\d_]",		0, 0 },
	{ "[-a]",		"[\\-a]",		0, 0 },
	{ "[]a]",		"[\\]a]",		0, 0 },
	{ "[a-]",		"[a\\-]",		0, 0 },

	{ 0,	"--- Anchors ---", 0, 0 },
	{ "^a$",		"^a$",			0, 0 },
	{ "\\bword\\b",		"\\bword\\b",		0, 0 },
	{ "\\Ba",		"\\Ba",			0, 0 },

	{ 0,	"--- Repetition ---", 0, 0 },
	{ "ab+",		"ab+",			0, 0 },
	{ "a*",			"a*",			0, 0 },
	{ "a?",			"a?",			0, 0 },
	{ "a{2}",		"a{2}",			0, 0 },
	{ "a{2,}",		"a{2,}",		0, 0 },
	{ "a{2,3}",		"a{2,3}",		0, 0 },
	{ "a{0,1}",		"a?",			0, 0 },
	{ "a*?",		"a*?",			0, 0 },
	{ "a+?b??",		"a+?b??",		0, 0 },
	{ "(?:ab)+",		"(?:ab)+",		0, 0 },
	{ "(ab)*",		"(ab)*",		0, 0 },

	{ 0,	"--- Alternates ---", 0, 0 },
	{ "a|b|c",		"a|b|c",		0, 0 },
	{ "(a|)",		"(a|)",			0, 0 },
	{ "ab|cd",		"ab|cd",		0, 0 },

	{ 0,	"--- Groups ---", 0, 0 },
	{ "(a)(b)",		"(a)(b)",		0, 0 },
	{ "(?:)",		"(?:)",			0, 0 },
	{ "(name:x)",		"(?<name>x)",		0, 0 },
	{ "(_n2:x)",		"(?<_n2>x)",		0, 0 },
	{ "(@>:a)",		"(?=a)",		0, 0 },
	{ "(@>~:a)",		"(?!a)",		0, 0 },
	{ "(@<:a)",		"(?<=a)",		0, 0 },
	{ "(@<~:a)",		"(?<!a)",		0, 0 },
	{ "(@*:a+)",		"(?>a+)",		0, 0 },
	{ "(@i:a)",		"(?i:a)",		0, 0 },
	{ "(@mis:a)",		"(?mis:a)",		0, 0 },

	{ 0,	"--- Backreferences ---", 0, 0 },
	{ "(a)\\1",		"(a)\\g{1}",		0, 0 },
	{ "(a)\\g{1}",		"(a)\\g{1}",		0, 0 },
	{ "(a)(b)\\g{-1}",	"(a)(b)\\g{2}",		0, 0 },
	{ "(a)(b)(c)\\g{-2}",	"(a)(b)(c)\\g{2}",	0, 0 },
	{ "(a)(name:x)(b)\\g{-2}", "(a)(?<name>x)(b)\\g{1}", 0, 0 },
	{ "(word:\\w+) is \\g{word}", "(?<word>\\w+) is \\k<word>", 0, 0 },

	{ 0,	"--- Errors ---", 0, 0 },
	{ "(unclosed",		0,	"Not all groups were closed",		9 },
	{ "a)",			0,	"Too many closing parentheses",		1 },
	{ "*",			0,	"Nothing to repeat",			0 },
	{ "a|*",		0,	"Nothing to repeat",			2 },
	{ "a**",		0,	"Repeating a repetition is disallowed",	2 },
	{ "a*??",		0,	"Repeating a repetition is disallowed",	3 },
	{ "(a)?+",		0,	"Repeating a repetition is disallowed",	4 },
	{ "[a-c",		0,	"Bad character class",			0 },
	{ "[\\",		0,	"Bad character class",			0 },
	{ "[z-a]",		0,	"Bad character class range",		0 },
	{ "a{2,1}",		0,	"Bad repetition count",			1 },
	{ "a{1,x}",		0,	"Bad repetition count",			1 },
	{ "a{1001}",		0,	"Repetition count too large",		1 },
	{ "\\",			0,	"Pattern ends with a backslash",	0 },
	{ "(a)\\2",		0,	"Backreference to undefined group",	3 },
	{ "\\1(a)",		0,	"Backreference to undefined group",	0 },
	{ "\\g{nope}",		0,	"Backreference to undefined group name",	0 },
	{ "\\g{-1}",		0,	"Relative backreference has no matching group",	0 },
	{ "(n:a)\\g{-1}",	0,	"Relative backreference has no matching group",	5 },
	{ "\\g{",		0,	"Bad group reference",			0 },
	{ "\\g{-x}",		0,	"Bad group reference",			0 },
	{ "\\g{}",		0,	"Bad group reference",			0 },
	{ "(name:a)(name:b)",	0,	"Duplicate name",			8 },
	{ "(?x)",		0,	"Illegal group type",			0 },
	{ "(@%:a)",		0,	"Illegal group type",			0 },
	{ "(@x:a)",		0,	"Illegal group type",			0 },
};

struct	feature_test {
	const char*	pattern;
	OgFeature	disabled;		// Features turned off; their characters are literal
	OgFeature	rejected;		// Features that must cause an error
	const char*	expected;		// PCRE syntax, or zero if the compile must fail
	const char*	expected_message;
};
feature_test	feature_tests[] =
{
	{ "a|b",	OgFeature::Alternates,	OgFeature::NoFeature,	"a\\|b",	0 },
	{ "a|b",	OgFeature::NoFeature,	OgFeature::Alternates,	0,		"Rejected feature" },
	{ "a+",		OgFeature::OneOrMore,	OgFeature::NoFeature,	"a\\+",		0 },
	{ "a*?",	OgFeature::LazyRepetition, OgFeature::NoFeature, 0,		"Repeating a repetition is disallowed" },
	{ "\\d",	OgFeature::Shorthand,	OgFeature::NoFeature,	"d",		0 },
	{ "[a]",	OgFeature::CharClasses,	OgFeature::NoFeature,	"\\[a\\]",	0 },
	{ "(n:a)",	OgFeature::NamedCapture, OgFeature::NoFeature,	"(n:a)",	0 },
	{ "(n:a)",	OgFeature::NoFeature,	OgFeature::NamedCapture, 0,		"Rejected feature" },
	{ "(@>:a)",	OgFeature::Lookaround,	OgFeature::NoFeature,	"(@>:a)",	0 },
	{ "(@*:a)",	OgFeature::NoFeature,	OgFeature::AtomicGroup,	0,		"Rejected feature" },
	{ "(a)\\1",	OgFeature::Backreference, OgFeature::NoFeature,	"(a)1",		0 },
	{ "\\bx",	OgFeature::WordBoundary, OgFeature::NoFeature,	"bx",		0 },
	{ "^a",		OgFeature::NoFeature,	OgFeature::BOS,		0,		"Rejected feature" },
	{ "a{2}",	OgFeature::CountRepetition, OgFeature::NoFeature, "a\\{2\\}",	0 },
};

int automated_tests()
{
	int		tests_run = 0;
	int		failures = 0;

	// Compile, and compare the result or the error with what's expected
	auto	check = [&](const char* pattern, OgFeature features, OgFeature rejected,
				const char* expected, const char* expected_message, int expected_offset) -> bool
	{
		bool		test_passed;
		std::string	pcre;
		std::string	message;
		int		offset = 0;

		start_recording_allocations();
		{
			OgCompiler	compiler(pattern, features, rejected);
			Ref<OgProgram>	program;
			bool		compiled_ok = compiler.compile(program);

			if (compiled_ok)
				pcre = program->transpile();
			else
			{
				message = compiler.errorMessage();
				offset = compiler.errorOffset();
				Error	error = compiler.error();
				if (error.num() != OG_ERR_COMPILE || message != error.message())
					message = "Error not packaged";
			}

			if (expected)
				test_passed = compiled_ok && pcre == expected;
			else
				test_passed = !compiled_ok
					&& message == expected_message
					&& (expected_offset < 0 || offset == expected_offset);

			printf("%s: /%s/", test_passed ? "Pass" : "Fail", pattern);
			if (compiled_ok)
				printf(" -> /%s/", pcre.c_str());
			else
				printf(" failed at %d: %s", offset, message.c_str());
			if (!test_passed)
			{
				if (expected)
					printf(", expected /%s/", expected);
				else
					printf(", expected error at %d: %s", expected_offset, expected_message);
			}
			printf("\n");
			if (verbose && compiled_ok)
			{
				program->dump();
				program->dumpCode();
			}
		}
		pcre.clear();
		pcre.shrink_to_fit();
		message.clear();
		message.shrink_to_fit();
		if (allocation_growth_count() > 0)
		{
			printf("Unfreed allocations after compiling \"%s\":\n", pattern);
			report_allocation_growth();
			test_passed = false;
		}
		return test_passed;
	};

	for (parse_test* test_case = parse_tests; test_case < parse_tests+sizeof(parse_tests)/sizeof(parse_tests[0]); test_case++)
	{
		if (!test_case->pattern)
		{
			printf("%s\n", test_case->expected);
			continue;
		}
		tests_run++;
		if (!check(test_case->pattern, OgFeature::AllFeatures, OgFeature::NoFeature,
				test_case->expected, test_case->expected_message, test_case->expected_offset))
			failures++;
	}

	printf("--- Nesting depth ---\n");
	{
		std::string	deep = std::string(OgMaxNesting, '(') + "a" + std::string(OgMaxNesting, ')');
		std::string	too_deep = "(" + deep + ")";
		tests_run += 2;
		if (!check(deep.c_str(), OgFeature::AllFeatures, OgFeature::NoFeature, deep.c_str(), 0, 0))
			failures++;
		if (!check(too_deep.c_str(), OgFeature::AllFeatures, OgFeature::NoFeature, 0, "Nesting too deep", OgMaxNesting))
			failures++;
	}

	printf("--- Extended syntax and C escapes ---\n");
	tests_run += 3;
	if (!check("a b # comment\n c", OgFeature::AllFeatures | OgFeature::ExtendedRE, OgFeature::NoFeature, "abc", 0, 0))
		failures++;
	if (!check("\\n\\t[\\n]", OgFeature::AllFeatures | OgFeature::CEscapes, OgFeature::NoFeature, "\\n\\t[\\n]", 0, 0))
		failures++;
	if (!check("a b", OgFeature::AllFeatures, OgFeature::NoFeature, "a b", 0, 0))
		failures++;

	printf("--- Disabled and rejected features ---\n");
	for (feature_test* test_case = feature_tests; test_case < feature_tests+sizeof(feature_tests)/sizeof(feature_tests[0]); test_case++)
	{
		OgFeature	features = (OgFeature)((int32_t)OgFeature::AllFeatures & ~(int32_t)test_case->disabled);
		tests_run++;
		if (!check(test_case->pattern, features, test_case->rejected,
				test_case->expected, test_case->expected_message, -1))
			failures++;
	}

	printf("\n%d tests run with %d failures\n", tests_run, failures);
	return failures > 0 ? 1 : 0;
}
