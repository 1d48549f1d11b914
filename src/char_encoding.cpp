/*
 * UCS4 (aka UTF-32, Rune) classification and case conversion
 *
 * The shorthand character classes of a pattern (\d \w \s) are ASCII-only.
 * Case conversion is simple one-to-one folding covering ASCII, Latin-1 (with the
 * Y diaeresis pair U+00FF/U+0178), basic Greek and basic Cyrillic. There is no
 * locale-aware or multi-character folding.
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<atomic>
#include	<char_encoding.h>

struct case_range {
	UCS4	firstchar;
	UCS4	lastchar;
	int	delta;
};

// Sorted by firstchar, non-overlapping
static const struct case_range	UnicodeToLower[] =
{
	{ 0x0041, 0x005A,  32 },	// A-Z
	{ 0x00C0, 0x00D6,  32 },	// Latin-1 capitals
	{ 0x00D8, 0x00DE,  32 },
	{ 0x0178, 0x0178, -121 },	// Y with diaeresis
	{ 0x0391, 0x03A1,  32 },	// Greek capitals
	{ 0x03A3, 0x03AB,  32 },
	{ 0x0400, 0x040F,  80 },	// Cyrillic capitals
	{ 0x0410, 0x042F,  32 },
};
#define	UCS4NumToLowerChars	(sizeof(UnicodeToLower)/sizeof(UnicodeToLower[0]))

static const struct case_range	UnicodeToUpper[] =
{
	{ 0x0061, 0x007A, -32 },	// a-z
	{ 0x00E0, 0x00F6, -32 },	// Latin-1 small letters
	{ 0x00F8, 0x00FE, -32 },
	{ 0x00FF, 0x00FF, 121 },	// y with diaeresis
	{ 0x03B1, 0x03C1, -32 },	// Greek small letters
	{ 0x03C2, 0x03C2, -31 },	// final sigma
	{ 0x03C3, 0x03CB, -32 },
	{ 0x0430, 0x044F, -32 },	// Cyrillic small letters
	{ 0x0450, 0x045F, -80 },
};
#define	UCS4NumToUpperChars	(sizeof(UnicodeToUpper)/sizeof(UnicodeToUpper[0]))

bool
UCS4IsDecimal(UCS4 ch)
{
	return ch >= '0' && ch <= '9';
}

bool
UCS4IsWord(UCS4 ch)
{
	return (ch >= 'a' && ch <= 'z')
	    || (ch >= 'A' && ch <= 'Z')
	    || (ch >= '0' && ch <= '9')
	    || ch == '_';
}

// Digit value 0-9, -1 if not digit
int
UCS4Digit(UCS4 ch)
{
	return UCS4IsDecimal(ch) ? (int)(ch - '0') : -1;
}

static UCS4
convert_case(UCS4 ch, const struct case_range* table, int table_size, std::atomic<int>& last_memo)
{
	// Adjacent characters will often be from the same set. Memoize that set.
	// This memo is thread- and SMP-safe as long as we read it only once:
	int	last = last_memo;

	if (ch >= table[last].firstchar
	 && ch <= table[last].lastchar)
		return ch + table[last].delta;

	int	hi, lo, mid;
	lo = 0;
	hi = table_size-1;
	while (hi >= lo)
	{
		mid = (lo+hi)/2;
		if (ch < table[mid].firstchar)
			hi = mid-1;
		else if (ch > table[mid].firstchar)
			lo = mid+1;
		else
		{
			last_memo = mid;
			return ch + table[mid].delta;
		}
	}

	// hi is now the last range starting below ch
	if (hi >= 0
	 && ch <= table[hi].lastchar)
	{
		last_memo = hi;
		return ch + table[hi].delta;
	}
	return ch;
}

/*
 * Convert to upper case
 */
UCS4
UCS4ToUpper(UCS4 ch)
{
	static	std::atomic<int> last_memo(0);
	if (ch < 'a')
		return ch;
	return convert_case(ch, UnicodeToUpper, UCS4NumToUpperChars, last_memo);
}

/*
 * Convert to lower case
 */
UCS4
UCS4ToLower(UCS4 ch)
{
	static	std::atomic<int> last_memo(0);
	if (ch < 'A')
		return ch;
	return convert_case(ch, UnicodeToLower, UCS4NumToLowerChars, last_memo);
}
