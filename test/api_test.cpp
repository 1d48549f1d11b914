/*
 * ogex: unit test driver for the library interface.
 * Convenience functions, the program cache, step limits, options, and error reporting.
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<stdio.h>
#include	<string.h>

#include	<ogex.h>

#include	"memory_monitor.h"

int	automated_tests();

int
main(int argc, char** argv)
{
	return automated_tests();
}

int	tests_run = 0;
int	failures = 0;

static bool
report(bool passed, const char* description)
{
	tests_run++;
	if (!passed)
		failures++;
	printf("%s: %s\n", passed ? "Pass" : "Fail", description);
	return passed;
}

// Search for the pattern with the given features, and return the matched text or "(no match)"
static std::string
search_with(const char* pattern, OgFeature features, const char* target)
{
	OgCompiler	compiler(pattern, features);
	Ref<OgProgram>	program;
	if (!compiler.compile(program))
		return std::string("(error) ") + compiler.errorMessage();
	OgMatch	match = program->search(OgSubject(target));
	return match ? match.text() : std::string("(no match)");
}

static void
convenience_tests()
{
	printf("--- Convenience functions ---\n");

	Ref<OgProgram>	program;
	Error		error = ogCompile("(unclosed", program);
	report(error.num() == OG_ERR_COMPILE && !program, "ogCompile reports a compile error");
	report(0 == strcmp(error.message(), "Not all groups were closed") && error.offset() == 9, "the error has its message and offset");
	report(error.num().set() == OG_ERRSET && error.num().msg() == 1, "the error number is in the ogex set");
	report((int32_t)error < 0, "an error number is negative");

	OgMatch		match;
	report(!ogMatch("hello", "hello world", match) && match.text() == "hello", "ogMatch matches at the start");
	report(!ogMatch("world", "hello world", match) && !match, "ogMatch is anchored, and no match is not an error");
	report(!ogSearch("world", "hello world", match) && match.start() == 6, "ogSearch finds the leftmost match");
	report(ogSearch("a)", "a", match).num() == OG_ERR_COMPILE, "ogSearch reports a compile error");

	std::vector<OgMatch>	matches;
	report(!ogFindAll("a+", "banana", matches) && matches.size() == 3, "ogFindAll finds every match");
	report(ogFindAll("[", "banana", matches).num() == OG_ERR_COMPILE && matches.empty(), "ogFindAll reports a compile error");

	std::string	result;
	report(!ogSub("a", "X", "banana", result) && result == "bXnXnX", "ogSub replaces every match");
	report(!ogSub("a", "X", "banana", result, 1) && result == "bXnana", "ogSub with a count");
	report(ogSub("(a", "X", "banana", result).num() == OG_ERR_COMPILE, "ogSub reports a compile error");
	report(ogSub("a", "\\3", "banana", result).num() == OG_ERR_SUBSTITUTION, "ogSub reports a template error");
}

static void
cache_tests()
{
	printf("--- Cache ---\n");

	OgCache		cache(2);
	Ref<OgProgram>	first;
	Ref<OgProgram>	again;
	OgMatch		match;

	report(!cache.compile("a", first) && first, "cache compiles a pattern");
	report(!cache.compile("a", again) && (OgProgram*)again == (OgProgram*)first, "the same pattern gets the same program");
	report(cache.hits() == 1 && cache.misses() == 1 && cache.size() == 1, "one hit and one miss");

	report(!ogSearch("a", "banana", match, &cache) && match.start() == 1, "convenience functions use the cache");
	report(cache.hits() == 2, "that was a hit");

	report(!cache.compile("a", again, OgFeature::AllFeatures | OgFeature::CaseInsensitive)
		&& (OgProgram*)again != (OgProgram*)first, "different features are a different entry");
	report(cache.size() == 2, "two entries");

	report(!cache.compile("b", again) && cache.size() == 2, "the capacity is not exceeded");
	report(!cache.compile("a", again) && (OgProgram*)again != (OgProgram*)first, "the least recently used entry was dropped");
	report(cache.misses() == 4, "that was a miss");

	report(cache.compile("(", again).num() == OG_ERR_COMPILE && cache.size() == 2, "errors are not cached");

	cache.clear();
	report(cache.size() == 0 && first && first->isMatch(OgSubject("a")), "programs outlive the cache");

	OgCache		unbounded;
	for (int i = 0; i < 10; i++)
		(void)unbounded.compile(std::string(i+1, 'x'), again);
	report(unbounded.size() == 10 && unbounded.capacity() == 0, "zero capacity is unbounded");
}

static void
step_limit_tests()
{
	printf("--- Step limit ---\n");

	OgCompiler	compiler("(a*)*b");
	Ref<OgProgram>	program;
	compiler.setStepLimit(1000);
	if (!report(compiler.compile(program) && program->stepLimit() == 1000, "step limit is set on the program"))
		return;

	OgSubject	runaway(std::string(30, 'a'));
	OgMatch		match = program->search(runaway);
	report(!match && match.error().num() == OG_ERR_STEP_LIMIT, "a runaway search is abandoned");

	Error		error;
	report(!program->isMatch(runaway, &error) && error.num() == OG_ERR_STEP_LIMIT, "isMatch reports the abandoned search");
	report(program->isMatch(OgSubject("ab"), &error) && !error, "isMatch clears the error on a match");

	std::vector<OgMatch>	matches;
	report(program->findAll(runaway, matches).num() == OG_ERR_STEP_LIMIT, "findAll reports the abandoned search");

	std::string	result;
	report(program->sub("x", runaway, result).num() == OG_ERR_STEP_LIMIT, "sub reports the abandoned search");

	match = program->search(OgSubject("xaab"));
	report(match && match.start() == 1 && !match.error(), "a short search is within the limit");
}

static void
option_tests()
{
	printf("--- Options ---\n");

	report(search_with("abc", OgFeature::AllFeatures | OgFeature::CaseInsensitive, "xAbC") == "AbC", "case-insensitive option");
	report(search_with("[a-c]+", OgFeature::AllFeatures | OgFeature::CaseInsensitive, "xBCA") == "BCA", "case-insensitive class");
	report(search_with("(a)\\1", OgFeature::AllFeatures | OgFeature::CaseInsensitive, "aA") == "aA", "case-insensitive backreference");
	report(search_with("ÉCOLE", OgFeature::AllFeatures | OgFeature::CaseInsensitive, "l'école") == "école", "case-insensitive Latin-1");
	report(search_with("ŸΣЖ", OgFeature::AllFeatures | OgFeature::CaseInsensitive, "xÿσж") == "ÿσж", "case-insensitive Greek and Cyrillic");
	report(search_with("abc", OgFeature::AllFeatures, "xAbC") == "(no match)", "case matters by default");

	report(search_with("^b$", OgFeature::AllFeatures | OgFeature::Multiline, "a\nb\nc") == "b", "multiline anchors");
	report(search_with("^b$", OgFeature::AllFeatures, "a\nb\nc") == "(no match)", "anchors are for the string by default");

	report(search_with("a.b", OgFeature::AllFeatures, "a\nb") == "a\nb", "dot matches newline by default");
	report(search_with("a.b", OgFeature::AllFeatures | OgFeature::AnyExcludesNL, "a\nb") == "(no match)", "dot excludes newline");
	report(search_with("(@s:a.b)", OgFeature::AllFeatures | OgFeature::AnyExcludesNL, "a\nb") == "a\nb", "the s mode lets dot match newline");

	report(search_with("a b c # letters", OgFeature::AllFeatures | OgFeature::ExtendedRE, "abc") == "abc", "extended syntax");
	report(search_with("a\\tb", OgFeature::AllFeatures | OgFeature::CEscapes, "a\tb") == "a\tb", "C escapes");
}

static void
lookaround_tests()
{
	printf("--- Lookaround and atomic groups ---\n");

	report(search_with("\\w+(@>:!)", OgFeature::AllFeatures, "hi there!") == "there", "lookahead is not part of the match");
	report(search_with("(@<:\\$)\\d+", OgFeature::AllFeatures, "cost 7 or $42") == "42", "lookbehind is not part of the match");
	report(search_with("\\b\\w+(@<~:s)\\b", OgFeature::AllFeatures, "cats dog") == "dog", "negative lookbehind");
	report(search_with("(@*:\\d+)\\d", OgFeature::AllFeatures, "123") == "(no match)", "atomic group does not give back");
	report(search_with("(@*:\\d+)x", OgFeature::AllFeatures, "12x") == "12x", "atomic group then more");
}

static void
sharing_tests()
{
	printf("--- Sharing ---\n");

	Ref<OgProgram>	program;
	if (!report(!ogCompile("(name:\\w+)", program), "pattern compiles"))
		return;
	OgMatch		match = program->search(OgSubject("  word  "));
	report(program.GetRefCount() == 2, "a match holds its program");
	program = 0;
	report(match.namedGroup("name") == "word", "a match outlives the caller's reference");

	OgSubject	subject("shared");
	OgSubject	copy = subject;
	report(copy.chars() == subject.chars() && copy.length() == 6, "copies of a subject share the decoded text");
	report(subject.substr(2, 4) == "ar" && subject.substr(4, 99) == "ed" && subject.substr(3, 1).empty(), "substr is clamped");

	OgSubject	accented("né");
	report(accented[0] == 'n' && accented[1] == 0xE9, "subject characters are decoded");
	report(accented[2] == UCS4_NONE && accented[-1] == UCS4_NONE, "characters outside the subject");

	Ref<OgProgram>	accented_program;
	report(!ogCompile("(n:é+)", accented_program) && accented_program->patternLength() == 6
		&& accented_program->pattern() == "(n:é+)", "pattern length is in characters");
}

int automated_tests()
{
	start_recording_allocations();
	convenience_tests();
	cache_tests();
	step_limit_tests();
	option_tests();
	lookaround_tests();
	sharing_tests();
	if (allocation_growth_count() > 0)
	{
		printf("Unfreed allocations after the interface tests:\n");
		report_allocation_growth();
		failures++;
	}

	printf("\n%d tests run with %d failures\n", tests_run, failures);
	return failures > 0 ? 1 : 0;
}
