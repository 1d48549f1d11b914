#if !defined(CHAR_ENCODING_H)
#define CHAR_ENCODING_H
/*
 * Encode/decode characters between UTF-8 and UCS4, and classify them.
 *
 * UCS4 (AKA UTF-32, Rune) is the ISO/IEC 10646 32-bit character encoding.
 * Truncation of 24 zero bits yields Latin 1 (ISO-8859-1)
 * Truncation of 25 zero bits yields ASCII
 *
 * A UTF8 character is represented as 1-4 bytes.
 * A first byte with a most significant bit of zero is a single ASCII byte.
 * The bytes after the first always have most significant two bits == "10",
 * which never occurs in the first byte - thus it's possible to jump into
 * the middle of a UTF8 string and reliably find the start of a character.
 *
 * Illegal UTF-8 handing:
 * A byte which does not start a UTF-8 character is returned as a 32-bit value
 * with the high order bit set, as in, 0x800000yy. Such a value is written back
 * as the single original byte, so text that is not valid UTF-8 survives a
 * decode/encode round trip unchanged.
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<cstdint>

typedef char		UTF8;		// We don't assume un/signed
typedef	char32_t	UCS4;		// A UCS4 character, aka UTF-32, aka Rune

#define	UCS4_NONE	((UCS4)0xFFFFFFFF)	// Marker indicating no UCS4 character

/*
 * UCS4 classification and conversion.
 * The shorthand classes are ASCII-only; case conversion covers ASCII, Latin-1
 * (with the Y diaeresis pair), basic Greek and basic Cyrillic.
 */
bool		UCS4IsDecimal(UCS4 ch);		// Decimal digits only
bool		UCS4IsWord(UCS4 ch);		// Letter, digit or underscore
int		UCS4Digit(UCS4 ch);		// Digit value 0-9 or -1 if not digit
UCS4		UCS4ToUpper(UCS4 ch);		// To upper case
UCS4		UCS4ToLower(UCS4 ch);		// To lower case
inline bool	UCS4IsWhite(UCS4 ch)
		{
			return ch == ' '
				|| ch == '\t' || ch == '\n' || ch == '\r'
				|| ch == '\f' || ch == '\v';
		}

inline bool
UCS4IsIllegal(UCS4 ucs4)	// Does this UCS4 character encode an illegal utf-8 byte?
{
	return (ucs4 & 0xFFFFFF00) == 0x80000000 || ucs4 == UCS4_NONE;
}

inline UCS4
UTF8EncodeIllegal(UTF8 illegal)	// Encode an illegal UTF8 byte as a UCS4 replacement
{
	return 0x80000000 | (illegal&0xFF);
}

inline bool
UTF8Is1st(UTF8 ch)
{
	return (ch & 0xC0) != 0x80;	// A non-1st byte is always 0b10xx_xxxx
}

// Get length of UTF8 from UCS4
inline int
UTF8Len(UCS4 ch)
{
	if (UCS4IsIllegal(ch))
		return 1;
	if (ch < (1<<7))	// 7 bits:
		return 1;	// ASCII
	if (ch < (1<<11))	// 11 bits:
		return 2;	// two bytes
	if (ch < (1<<16))	// 16 bits
		return 3;	// three bytes
	return 4;		// four bytes, up to 21 bits
}

// From a candidate UTF8 first byte, return the correct length of the UTF8 sequence it introduces:
inline int
UTF8CorrectLen(UTF8 c)
{
	if ((unsigned char)c < 0x80) return 1;		// 0b0xxx_xxxx (7 literal bits, no extension characters)
	if ((unsigned char)c < 0xC0) return 0;		// 0b10xx_xxxx (6 literal extension bits, not valid 1st character)
	if ((unsigned char)c < 0xE0) return 2;		// 0b110x_xxxx (5 literal and 1x6 extension character = 11 bits)
	if ((unsigned char)c < 0xF0) return 3;		// 0b1110_xxxx (4 literal and 2x6 extension character = 16 bits)
	if ((unsigned char)c < 0xF8) return 4;		// 0b1111_0xxx (3 literal and 3x6 extension character = 21 bits)
	return 0;					// Longer forms are not Unicode
}

/*
 * Decode one character and advance cp past it. The caller guarantees that
 * the text is NUL-terminated, so a truncated sequence stops at the NUL.
 */
inline UCS4
UTF8Get(const UTF8*& cp)
{
	const	UTF8*	sp = cp;
	static	const unsigned char	masks[] = { 0xFF, 0x7F, 0x1F, 0x0F, 0x07 };

	int		len = UTF8CorrectLen(*cp);
	UCS4		ch = (unsigned char)*cp & masks[len];
	switch (len)
	{
	case 4:	cp++;
		if (UTF8Is1st(*cp)) goto illegal;
		ch = (ch << 6) | (*cp&0x3F);
		// Fall through
	case 3:	cp++;
		if (UTF8Is1st(*cp)) goto illegal;
		ch = (ch << 6) | (*cp&0x3F);
		// Fall through
	case 2:	cp++;
		if (UTF8Is1st(*cp)) goto illegal;
		ch = (ch << 6) | (*cp&0x3F);
		// Fall through
	case 1:	cp++;
		return ch;

	case 0:
	default:
	illegal:
		cp = sp+1;
		return UTF8EncodeIllegal(*sp);
	}
}

// Store UTF8 from UCS4
inline void
UTF8Put(UTF8*& cp, UCS4 ch)
{
	if (UCS4IsIllegal(ch))
	{
		*cp++ = (UTF8)(ch & 0xFF);	// Restore the original byte
		return;
	}
	switch (UTF8Len(ch))
	{
	case 1:			// Single byte
		*cp++ = (UTF8)ch;
		return;

	case 2:		// 5 data bits in 1st byte, 6 in next
		*cp++ = 0xC0 | (UTF8)((ch >>  6) & 0x1F);
		*cp++ = 0x80 | (UTF8)((ch >>  0) & 0x3F);
		return;

	case 3:		// 4 data bits in 1st byte, 6 in each of 2 more
		*cp++ = 0xE0 | (UTF8)((ch >> 12) & 0x0F);
		*cp++ = 0x80 | (UTF8)((ch >>  6) & 0x3F);
		*cp++ = 0x80 | (UTF8)((ch >>  0) & 0x3F);
		return;

	default:	// 3 data bits in 1st byte, 6 in each of 3 more
		*cp++ = 0xF0 | (UTF8)((ch >> 18) & 0x07);
		*cp++ = 0x80 | (UTF8)((ch >> 12) & 0x3F);
		*cp++ = 0x80 | (UTF8)((ch >>  6) & 0x3F);
		*cp++ = 0x80 | (UTF8)((ch >>  0) & 0x3F);
		return;
	}
}

#endif	// CHAR_ENCODING_H
