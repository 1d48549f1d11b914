#if !defined(OGEX_H)
#define OGEX_H
/*
 * ogex: regular expressions with named groups and relative backreferences.
 * Pattern configuration, compiler, program, subject text, match results and cache.
 *
 * A pattern is compiled by OgCompiler into an OgProgram, which is immutable
 * and reference counted, so it may be shared by any number of threads.
 * Matching is by backtracking. All text offsets are character offsets.
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<char_encoding.h>
#include	<refcount.h>
#include	<error.h>
#include	<og_ast.h>
#include	<og_groups.h>

#include	<functional>
#include	<list>
#include	<string>
#include	<unordered_map>
#include	<vector>

/*
 * Configurable features. Normal things are default, but you can either
 * disable, or detect and reject specific features in the compiler.
 * A disabled feature's characters are taken literally.
 */
enum class OgFeature: int32_t
{
	NoFeature	= 0x0000000,
	// Kinds of characters or classes:
	Shorthand	= 0x0000001,	// \d \w \s \D \W \S
	CharClasses	= 0x0000002,	// [...], [^...]
	// Kinds of multiplicity:
	ZeroOrOneQuest	= 0x0000010,	// ?, zero or one
	ZeroOrMore	= 0x0000020,	// *, zero or more
	OneOrMore	= 0x0000040,	// +, one or more
	CountRepetition	= 0x0000080,	// {n}, {n,}, {n,m}
	LazyRepetition	= 0x0000100,	// *? +? ?? {n,m}?
	// Groups of regular expressions:
	Alternates	= 0x0001000,	// re1|re2
	Group		= 0x0002000,	// (re)
	NamedCapture	= 0x0004000,	// (name:re)
	NonCapture	= 0x0008000,	// (?:re)
	Backreference	= 0x0010000,	// \1 \g{name} \g{-1}
	Lookaround	= 0x0020000,	// (@>:re) (@>~:re) (@<:re) (@<~:re)
	AtomicGroup	= 0x0040000,	// (@*:re)
	ModeGroup	= 0x0080000,	// (@ims:re)
	// Assertions
	BOS		= 0x0100000,	// ^ start of string (or line)
	EOS		= 0x0200000,	// $ end of string (or line)
	WordBoundary	= 0x0400000,	// \b \B
	AllFeatures	= 0x0FFFFFF,
	// Options relevant to pattern interpretation
	CaseInsensitive	= 0x01000000,	// Perform case-insensitive match
	Multiline	= 0x02000000,	// ^ and $ also match at newlines
	AnyExcludesNL	= 0x04000000,	// . does not match newline
	ExtendedRE	= 0x08000000,	// Whitespace ignored, # comments
	CEscapes	= 0x10000000,	// \n \t \r \f \v \e
};

inline OgFeature
operator|(OgFeature a, OgFeature b)
{
	return (OgFeature)((int32_t)a | (int32_t)b);
}

// Error numbers in the ogex error set
#define	OG_ERRSET		0x4F47
#define	OG_ERR_COMPILE		ErrNum(OG_ERRSET, 1)	// The pattern is malformed
#define	OG_ERR_SUBSTITUTION	ErrNum(OG_ERRSET, 2)	// The template refers to a missing group
#define	OG_ERR_STEP_LIMIT	ErrNum(OG_ERRSET, 3)	// Matching was abandoned

#define	OgMaxNesting		64	// Maximum nesting depth for groups
#define	OgMaxRepetition		1000	// Maximum {n,m} count
#define	OgMaxCode		200000	// Maximum compiled program size in instructions

class	OgProgram;
class	OgMatch;

/*
 * OgCompiler compiles a pattern for the matcher to execute.
 * The same OgCompiler can be used multiple times.
 */
class OgCompiler
{
public:
	~OgCompiler();
	OgCompiler(const std::string& pattern, OgFeature features = OgFeature::AllFeatures, OgFeature reject_features = OgFeature::NoFeature);

	// Lexical scanner and compiler for a pattern. Return false if error_message gets set.
	bool		scanPattern(const std::function<bool(const OgToken& token)> func);
	bool		compile(Ref<OgProgram>& program);

	const char*	errorMessage() const { return error_message; }
	int		errorOffset() const { return error_offset; }
	Error		error() const;		// The error as an OG_ERR_COMPILE, or no error

	// Limit the number of matcher steps any one call may take. Zero means no limit.
	void		setStepLimit(long limit) { step_limit = limit; }

protected:
	std::string	source;			// The pattern as given
	std::vector<UCS4> re;			// The pattern decoded
	OgFeature	features_enabled;	// Features that are not enabled are normally ignored
	OgFeature	features_rejected;	// but these features cause an error if used
	const char*	error_message;		// An error from compiling
	int		error_offset;
	long		step_limit;

	bool		supported(OgFeature);	// Set error message and return false on rejected feature use
	bool		enabled(OgFeature) const; // Return true if the specified feature is enabled
	bool		generate(OgProgram& program);	// Lower the syntax tree to instructions
};

/*
 * Subject text, decoded once into characters and shared by every match taken from it.
 */
class OgSubject
{
public:
	OgSubject();
	OgSubject(const std::string& text);
	OgSubject(const char* text);

	int		length() const { return (int)body->chars.size(); }
	UCS4		operator[](int i) const { return i >= 0 && i < length() ? body->chars[i] : UCS4_NONE; }
	const UCS4*	chars() const { return body->chars.data(); }
	const std::string& text() const { return body->text; }
	std::string	substr(int start, int end) const;	// Characters start..end-1
	int		byteOffset(int offset) const;		// UTF-8 offset of a character offset

private:
	class Body
	: public RefCounted
	{
	public:
		Body(const std::string& text);
		std::string		text;
		std::vector<UCS4>	chars;
		std::vector<int>	offsets;	// Byte offset of each character, and of the end
	};
	Ref<const Body>	body;
};

/*
 * OgProgram wraps a compiled pattern: its syntax tree, group table and instructions.
 * Does not get modified after construction, so can run matches in multiple threads simultaneously.
 */
class OgProgram
: public RefCounted
{
public:
	~OgProgram();

	bool		isMatch(const OgSubject& subject, Error* error = 0) const;	// An abandoned search sets *error
	OgMatch		match(const OgSubject& subject) const;		// Anchored at the start
	OgMatch		matchAt(const OgSubject& subject, int offset) const;
	OgMatch		search(const OgSubject& subject, int from = 0) const;	// Leftmost match
	Error		findAll(const OgSubject& subject, std::vector<OgMatch>& matches) const;
	// Replace the first count matches (all if negative) with the expansion of tmpl:
	Error		sub(const std::string& tmpl, const OgSubject& subject, std::string& result, int count = -1) const;

	const std::string& pattern() const { return source; }
	int		patternLength() const { return pattern_length; }
	OgFeature	features() const { return features_enabled; }
	long		stepLimit() const { return step_limit; }

	int		groupCount() const { return groups.count(); }
	int		groupIndex(const std::string& name) const { return groups.lookup(name); }
	const std::string& groupName(int index) const { return groups.name(index); }
	const OgGroupTable& groupTable() const { return groups; }

	const std::vector<OgNode>& nodes() const { return node_arena; }
	OgNodeId	root() const { return root_node; }
	const std::vector<OgInstr>& code() const { return instructions; }
	int		slotCount() const { return slot_count; }

	std::string	transpile() const;		// The pattern in PCRE syntax
	void		dump() const;			// Dump the syntax tree to stdout
	void		dumpCode() const;		// Dump the instructions to stdout
	void		dumpInstruction(int pc) const;	// Disassemble one instruction to stdout

private:
	friend class	OgCompiler;
	OgProgram();

	OgMatch		scan(const OgSubject& subject, int from, int to, long& steps) const;

	std::string	source;
	int		pattern_length;
	OgFeature	features_enabled;
	long		step_limit;
	OgGroupTable	groups;
	std::vector<OgNode>	node_arena;
	OgNodeId	root_node;
	std::vector<OgInstr>	instructions;
	int		slot_count;
};

/*
 * The result from a match: success or failure, the span and the captures.
 * Group 0 is the whole match; capturing groups are numbered from 1.
 * A group that did not participate in the match is unset.
 */
class OgMatch
{
public:
	OgMatch();				// Construct a non-Match (failure)
	OgMatch(const Error& abandoned);	// Failure because the step limit was reached
	OgMatch(const OgProgram* program, const OgSubject& subject, const std::vector<int>& captures);

	bool		succeeded() const { return captures.size() > 0; }
	operator	bool() const { return succeeded(); }
	Error		error() const { return err; }

	int		start() const { return succeeded() ? captures[0] : -1; }
	int		end() const { return succeeded() ? captures[1] : -1; }
	int		length() const { return succeeded() ? captures[1]-captures[0] : 0; }
	std::string	text() const { return group(0); }
	const OgSubject& subject() const { return target; }

	int		groupCount() const { return succeeded() ? (int)captures.size()/2 - 1 : 0; }
	bool		groupSet(int n) const;
	int		groupStart(int n) const;	// -1 if unset
	int		groupEnd(int n) const;		// -1 if unset
	std::string	group(int n = 0) const;		// Empty if unset
	bool		namedGroupSet(const std::string& name) const;
	std::string	namedGroup(const std::string& name) const;

	// Expand a substitution template against this match
	Error		expand(const std::string& tmpl, std::string& result) const;

private:
	Ref<const OgProgram> program;
	OgSubject	target;
	std::vector<int> captures;	// Start and end of each group, -1 if unset
	Error		err;
};

/*
 * A cache of compiled programs, keyed by pattern and features.
 * It is owned by the caller and is not synchronised; use one per thread,
 * or lock around it. Least recently used entries are dropped when full.
 */
class OgCache
{
public:
	OgCache(size_t capacity = 0);		// Zero means unbounded

	Error		compile(const std::string& pattern, Ref<OgProgram>& program, OgFeature features = OgFeature::AllFeatures);

	size_t		size() const { return entries.size(); }
	size_t		capacity() const { return max_entries; }
	long		hits() const { return hit_count; }
	long		misses() const { return miss_count; }
	void		clear();

private:
	struct Entry
	{
		std::string	key;
		Ref<OgProgram>	program;
	};
	size_t		max_entries;
	long		hit_count;
	long		miss_count;
	std::list<Entry>	entries;	// Most recently used first
	std::unordered_map<std::string, std::list<Entry>::iterator>	index;
};

/*
 * Compile-and-call conveniences. Each compiles the pattern (through the
 * cache, if one is given) and reports a compile error, or any error from
 * matching. Finding no match is not an error.
 */
Error	ogCompile(const std::string& pattern, Ref<OgProgram>& program, OgFeature features = OgFeature::AllFeatures, OgCache* cache = 0);
Error	ogMatch(const std::string& pattern, const OgSubject& subject, OgMatch& match, OgCache* cache = 0);
Error	ogSearch(const std::string& pattern, const OgSubject& subject, OgMatch& match, OgCache* cache = 0);
Error	ogFindAll(const std::string& pattern, const OgSubject& subject, std::vector<OgMatch>& matches, OgCache* cache = 0);
Error	ogSub(const std::string& pattern, const std::string& tmpl, const OgSubject& subject, std::string& result, int count = -1, OgCache* cache = 0);

#endif	// OGEX_H
