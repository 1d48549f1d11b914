#if !defined(ERROR_H)
#define	ERROR_H
/*
 * Error numbering system.
 *
 * Each subsystem is statically allocated a 16-bit subsystem "set" number.
 * Each set contains up to 16384 messages indicated by a 14-bit code.
 * The set number 0 corresponds to the system errno, and the msg codes are the errno codes.
 *
 * The high-order (sign) bit is always set on an error number, so a quick
 * check for an error is a test for negative. The second-top bit is also set,
 * to keep clear of collisions with Microsoft subsystem codes.
 *
 * A returned Error carries its ErrNum, the message text (already formatted
 * with any parameters) and the character offset it applies to, if any.
 * A default-constructed Error means success, and costs no allocation.
 *
 * (c) Copyright Clifford Heath 2023. See LICENSE file for usage rights.
 */
#include	<stdint.h>
#include	<string>

#include	<refcount.h>

class ErrNum
{
public:
	static const int32_t	ERR_FLAG = (int32_t)0x80000000;	// Sign bit is used to indicate an error, allowing quick checks
	static const int32_t	ERR_CUST = 0x40000000;	// Including this bit guarantees no collision with Microsoft subsystem codes

	constexpr ErrNum()
			: errnum(0) {}
	constexpr ErrNum(int set, int msg)
			: errnum(ERR_FLAG | ERR_CUST | ((set & 0xFFFF) << 14) | (msg & 0x3FFF)) {}
	constexpr int	set() const
			{ return (errnum >> 14) & 0xFFFF; }
	constexpr int	msg() const
			{ return errnum & 0x3FFF; }
	bool		operator==(ErrNum x) const
			{ return errnum == x.errnum; }
	bool		operator!=(ErrNum x) const
			{ return errnum != x.errnum; }
	constexpr operator int32_t() const		// Allows use in switch statements
			{ return errnum; }
private:
	int32_t		errnum;
};

class	Error
{
	class Body;
public:
	Error()
			: body(0) {}
	Error(ErrNum n, const std::string& message, int offset = -1)
			: body(new Body(n, message, offset)) {}
	Error&		operator=(const Error& e)
			{ body = e.body;  return *this; }
	Error(const Error& e)
			: body(e.body) {}

	ErrNum		num() const
			{ return body ? body->error_num() : ErrNum(); }
	const char*	message() const
			{ return body ? body->message().c_str() : ""; }
	int		offset() const			// Character offset, or -1 if not applicable
			{ return body ? body->offset() : -1; }
	operator int32_t() const { return body ? (int32_t)body->error_num() : 0; }

private:
	Ref<const Body>	body;

	class Body
	: public RefCounted
	{
	public:
		Body(ErrNum n, const std::string& m, int o)
		: num(n), text(m), off(o)
		{}
		ErrNum		error_num() const { return num; }
		const std::string& message() const { return text; }
		int		offset() const { return off; }

	protected:
		ErrNum		num;
		std::string	text;
		int		off;
	};
};

#endif	// ERROR_H
