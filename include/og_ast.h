#if !defined(OG_AST_H)
#define OG_AST_H
/*
 * ogex: the tokens passed from the pattern lexer to the parser, the syntax tree
 * the parser builds, and the instructions the tree is compiled into.
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<char_encoding.h>
#include	<string>
#include	<vector>

typedef	int	OgNodeId;	// Index of a node in the program's node arena

enum class OgAnchor: char
{
	StartOfString = 'A',	// ^
	EndOfString = 'z',	// $
	StartOfLine = '^',	// ^ in multiline mode
	EndOfLine = '$',	// $ in multiline mode
	WordBoundary = 'b',	// \b
	NonWordBoundary = 'B',	// \B
};

enum class OgGroupKind: char
{
	Capture = '(',		// (...)
	Named = 'N',		// (name:...)
	NonCapture = ':',	// (?:...)
	Mode = 'M',		// (@ims:...)
	LookAhead = '=',	// (@>:...)
	NegLookAhead = '!',	// (@>~:...)
	LookBehind = '<',	// (@<:...)
	NegLookBehind = '~',	// (@<~:...)
	Atomic = '>',		// (@*:...)
};

enum class OgRefKind: char
{
	Numbered = 'N',		// \1, \g{1}
	Named = 'n',		// \g{name}
	Relative = 'R',		// \g{-1}, counting only unnamed groups
};

/*
 * A character class item is an inclusive range of characters (a single
 * character has low == high), or one of the shorthand classes d w s D W S.
 */
struct OgClassItem
{
	UCS4		low;
	UCS4		high;
	char		shorthand;	// Zero for a range

	OgClassItem(UCS4 l, UCS4 h) : low(l), high(h), shorthand(0) {}
	OgClassItem(char s) : low(0), high(0), shorthand(s) {}
};

// Lexical tokens
enum class OgTok: char
{
	Start = 'S',		// Start of the pattern
	Accept = '#',		// End of the pattern
	Literal = 'C',		// A single character
	Any = '.',		// .
	Shorthand = '\\',	// \d \w \s \D \W \S
	CharClass = 'L',	// [...] or [^...]
	Anchor = '^',		// ^ $ \b \B
	Group = '(',		// Start of any kind of group
	EndGroup = ')',		// )
	Alternate = '|',	// |
	Repetition = '*',	// * + ? {n,m}, greedy or lazy
	Backreference = 'B',	// \1 \g{name} \g{-1}
};

class OgToken
{
public:
	OgTok		op;
	int		offset;		// Character offset in the pattern
	UCS4		ch;		// Literal, Shorthand letter
	OgAnchor	anchor;
	OgGroupKind	kind;		// Group
	OgRefKind	ref_kind;	// Backreference
	int		number;		// Backreference number, or N of \g{-N}
	int		min, max;	// Repetition; max < 0 means no maximum
	bool		greedy;		// Repetition
	bool		negated;	// CharClass
	std::string	name;		// Named group or backreference, Mode flags
	std::vector<OgClassItem> items;	// CharClass

	OgToken(OgTok _op)
			: op(_op), offset(0), ch(0)
			, anchor(OgAnchor::StartOfString), kind(OgGroupKind::Capture), ref_kind(OgRefKind::Numbered)
			, number(0), min(0), max(0), greedy(true), negated(false) {}
};

enum class OgNodeType: char
{
	Empty = 'E',
	Literal = 'C',
	Any = '.',
	Shorthand = '\\',
	CharClass = 'L',
	Anchor = '^',
	Concat = '&',
	Alternation = '|',
	Repeat = '*',
	Group = '(',
	Backreference = 'B',
};

/*
 * A node in the syntax tree. Children are held by index in the program's
 * node arena, so the tree is immutable and cheap to share.
 * The mode flags of inline mode groups and compile options are already
 * applied to each node (fold, dotall, and the anchor kind).
 */
struct OgNode
{
	OgNodeType	type;
	bool		fold;		// Literal, CharClass, Backreference: ignore case
	bool		dotall;		// Any: also matches newline
	bool		greedy;		// Repeat
	bool		negated;	// CharClass
	UCS4		ch;		// Literal; Shorthand letter
	OgAnchor	anchor;		// Anchor
	OgGroupKind	kind;		// Group
	OgRefKind	ref_kind;	// Backreference, as written
	int		min, max;	// Repeat; max < 0 means no maximum
	int		group;		// Group: capture index or 0; Backreference: resolved group
	int		number;		// Backreference number as written
	std::string	name;		// Named group or backreference name, or Mode flags
	std::vector<OgClassItem> items;	// CharClass
	std::vector<OgNodeId> children;

	OgNode(OgNodeType t)
			: type(t), fold(false), dotall(true), greedy(true), negated(false), ch(0)
			, anchor(OgAnchor::StartOfString), kind(OgGroupKind::Capture), ref_kind(OgRefKind::Numbered)
			, min(0), max(0), group(0), number(0) {}
};

/*
 * Instructions of the compiled program.
 *
 * Slots hold text offsets: for group g, slot 2g is the start and 2g+1 the end of
 * the last completed capture. Then follow one pending-start slot per group, and
 * one iteration-start slot per unbounded loop. All slot writes are undone on
 * backtracking.
 *
 * Look and Atomic are followed by their sub-program, which ends in Match.
 */
enum class OgOp: char
{
	OgoMatch = '#',		// Success, if this is at the required end position
	OgoChar = 'C',		// x: the character
	OgoAny = '.',		// x: non-zero if newline matches
	OgoShorthand = '\\',	// x: shorthand letter
	OgoClass = 'L',		// x: OgNodeId of the character class
	OgoAssert = '^',	// x: OgAnchor
	OgoOpen = '(',		// x: group. Save the pending start
	OgoClose = ')',		// x: group. Commit the capture
	OgoMark = 'M',		// x: slot. Record where an iteration started
	OgoProgress = 'P',	// x: slot, y: loop exit. Leave a loop after an empty iteration
	OgoSplit = 'A',		// Continue at x, on failure backtrack to y
	OgoJump = 'J',		// Continue at x
	OgoBackref = 'B',	// x: group
	OgoLook = '?',		// x: OgGroupKind, y: continuation
	OgoAtomic = '>',	// y: continuation
};

struct OgInstr
{
	OgOp		op;
	bool		fold;		// Char, Class, Backref
	int		x;
	int		y;
};

#endif	// OG_AST_H
