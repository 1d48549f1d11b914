/*
 * ogex: the matcher, and the match driver
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<ogex.h>
#include	<stdio.h>

#ifdef	TRACK_RESULTS
#define	TRACK(arglist)	printf arglist
#else
#define	TRACK(arglist)
#endif

#define	UNSET	(-1)

/*
 * The matcher runs a program against a subject by backtracking.
 *
 * The only recursion is for the sub-programs of lookaround and atomic groups,
 * so the depth of the C++ stack is bounded by the nesting of those in the
 * pattern. Everything else is an explicit stack of choice points. Each choice
 * point records the instruction and text offset to resume from, and the height
 * of the undo log, which records every slot write so it can be reverted.
 *
 * A matcher is used by one thread for one call, and may be reused for
 * successive start offsets.
 */
class OgMatcher
{
public:
	OgMatcher(const OgProgram& program, const OgSubject& subject, long& steps);

	bool		matchAt(int offset);
	bool		abandoned() const { return gave_up; }
	std::vector<int> captures() const;	// Group slots of the last successful match

private:
	struct Choice {
		int		pc;
		int		pos;
		size_t		undo_mark;
	};
	struct Undo {
		int		slot;
		int		value;
	};

	const OgProgram& program;
	const std::vector<OgInstr>& code;
	const UCS4*	text;
	int		length;
	int		group_slots;	// Slots holding completed captures
	long&		steps;		// Shared by every attempt in one call
	long		step_limit;
	bool		gave_up;

	std::vector<int>	slots;
	std::vector<Undo>	undo_log;
	std::vector<Choice>	choices;

	bool		run(int pc, int pos, int required_end, int& end);
	void		set(int slot, int value);
	void		rollback(size_t mark);
	bool		sameChar(UCS4 c1, UCS4 c2, bool fold) const;
	bool		inClass(const OgNode& cls, UCS4 ch, bool fold) const;
	bool		assertion(OgAnchor anchor, int pos) const;
	bool		isWordAt(int pos) const { return pos >= 0 && pos < length && UCS4IsWord(text[pos]); }
};

static bool
shorthand_matches(UCS4 letter, UCS4 ch)
{
	switch (letter)
	{
	case 'd':	return UCS4IsDecimal(ch);
	case 'D':	return !UCS4IsDecimal(ch);
	case 'w':	return UCS4IsWord(ch);
	case 'W':	return !UCS4IsWord(ch);
	case 's':	return UCS4IsWhite(ch);
	case 'S':	return !UCS4IsWhite(ch);
	default:	return false;
	}
}

OgMatcher::OgMatcher(const OgProgram& _program, const OgSubject& subject, long& _steps)
: program(_program)
, code(_program.code())
, text(subject.chars())
, length(subject.length())
, group_slots(2*(_program.groupCount()+1))
, steps(_steps)
, step_limit(_program.stepLimit())
, gave_up(false)
{
}

bool
OgMatcher::matchAt(int offset)
{
	int		end;

	slots.assign(program.slotCount(), UNSET);
	undo_log.clear();
	choices.clear();
	TRACK(("Attempt at %d\n", offset));
	if (!run(0, offset, UNSET, end))
		return false;
	slots[0] = offset;
	slots[1] = end;
	return true;
}

std::vector<int>
OgMatcher::captures() const
{
	return std::vector<int>(slots.begin(), slots.begin()+group_slots);
}

void
OgMatcher::set(int slot, int value)
{
	Undo	undo;
	undo.slot = slot;
	undo.value = slots[slot];
	undo_log.push_back(undo);
	slots[slot] = value;
}

void
OgMatcher::rollback(size_t mark)
{
	while (undo_log.size() > mark)
	{
		slots[undo_log.back().slot] = undo_log.back().value;
		undo_log.pop_back();
	}
}

bool
OgMatcher::sameChar(UCS4 c1, UCS4 c2, bool fold) const
{
	if (c1 == c2)
		return true;
	return fold
		&& (UCS4ToLower(c1) == UCS4ToLower(c2) || UCS4ToUpper(c1) == UCS4ToUpper(c2));
}

bool
OgMatcher::inClass(const OgNode& cls, UCS4 ch, bool fold) const
{
	UCS4	lower = fold ? UCS4ToLower(ch) : ch;
	UCS4	upper = fold ? UCS4ToUpper(ch) : ch;
	bool	found = false;

	for (const OgClassItem& item: cls.items)
	{
		if (item.shorthand)
			found = shorthand_matches(item.shorthand, ch);
		else
			found = (ch >= item.low && ch <= item.high)
				|| (lower >= item.low && lower <= item.high)
				|| (upper >= item.low && upper <= item.high);
		if (found)
			break;
	}
	return found != cls.negated;
}

bool
OgMatcher::assertion(OgAnchor anchor, int pos) const
{
	switch (anchor)
	{
	case OgAnchor::StartOfString:	return pos == 0;
	case OgAnchor::EndOfString:	return pos == length;
	case OgAnchor::StartOfLine:	return pos == 0 || text[pos-1] == '\n';
	case OgAnchor::EndOfLine:	return pos == length || text[pos] == '\n';
	case OgAnchor::WordBoundary:	return isWordAt(pos-1) != isWordAt(pos);
	case OgAnchor::NonWordBoundary:	return isWordAt(pos-1) == isWordAt(pos);
	}
	return false;
}

/*
 * Run the program from pc at text offset pos until a Match instruction succeeds
 * (at required_end, if that is not UNSET), or all choices made here are exhausted.
 * On success, the choice points made here are discarded but slot writes are kept,
 * so a caller's backtracking will still revert them.
 */
bool
OgMatcher::run(int pc, int pos, int required_end, int& end)
{
	size_t		base = choices.size();

	for (;;)
	{
		if (step_limit > 0 && ++steps > step_limit)
		{
			TRACK(("Step limit reached at pc %d, offset %d\n", pc, pos));
			gave_up = true;
			choices.resize(base);
			return false;
		}

		const OgInstr&	instr = code[pc];
		TRACK(("%5d @%d\t%c %d %d\n", pc, pos, (char)instr.op, instr.x, instr.y));
		switch (instr.op)
		{
		case OgOp::OgoMatch:
			if (required_end != UNSET && pos != required_end)
				break;
			end = pos;
			choices.resize(base);
			return true;

		case OgOp::OgoChar:
			if (pos < length && sameChar(text[pos], (UCS4)instr.x, instr.fold))
			{
				pos++;
				pc++;
				continue;
			}
			break;

		case OgOp::OgoAny:
			if (pos < length && (instr.x || text[pos] != '\n'))
			{
				pos++;
				pc++;
				continue;
			}
			break;

		case OgOp::OgoShorthand:
			if (pos < length && shorthand_matches((UCS4)instr.x, text[pos]))
			{
				pos++;
				pc++;
				continue;
			}
			break;

		case OgOp::OgoClass:
			if (pos < length && inClass(program.nodes()[instr.x], text[pos], instr.fold))
			{
				pos++;
				pc++;
				continue;
			}
			break;

		case OgOp::OgoAssert:
			if (!assertion((OgAnchor)instr.x, pos))
				break;
			pc++;
			continue;

		case OgOp::OgoOpen:		// Remember where the group started
			set(group_slots + instr.x-1, pos);
			pc++;
			continue;

		case OgOp::OgoClose:		// The group is complete, so its capture can be used
			set(2*instr.x, slots[group_slots + instr.x-1]);
			set(2*instr.x+1, pos);
			pc++;
			continue;

		case OgOp::OgoMark:
			set(instr.x, pos);
			pc++;
			continue;

		case OgOp::OgoProgress:
			if (slots[instr.x] == pos)
				pc = instr.y;	// An empty iteration; don't go around again
			else
				pc++;
			continue;

		case OgOp::OgoSplit:
			{
				Choice	choice;
				choice.pc = instr.y;
				choice.pos = pos;
				choice.undo_mark = undo_log.size();
				choices.push_back(choice);
			}
			pc = instr.x;
			continue;

		case OgOp::OgoJump:
			pc = instr.x;
			continue;

		case OgOp::OgoBackref:
			{
				int	start = slots[2*instr.x];
				int	finish = slots[2*instr.x+1];
				if (start == UNSET || finish == UNSET)
					break;		// A reference to an unset group never matches
				int	len = finish - start;
				if (pos + len > length)
					break;
				int	i;
				for (i = 0; i < len; i++)
					if (!sameChar(text[pos+i], text[start+i], instr.fold))
						break;
				if (i < len)
					break;
				pos += len;
			}
			pc++;
			continue;

		case OgOp::OgoLook:
			{
				OgGroupKind	kind = (OgGroupKind)instr.x;
				bool		negative = kind == OgGroupKind::NegLookAhead || kind == OgGroupKind::NegLookBehind;
				size_t		mark = undo_log.size();
				bool		found = false;
				int		sub_end;

				if (kind == OgGroupKind::LookAhead || kind == OgGroupKind::NegLookAhead)
					found = run(pc+1, pos, UNSET, sub_end);
				else		// Find a start from which the body matches up to here
					for (int from = pos; !found && !gave_up && from >= 0; from--)
					{
						rollback(mark);		// Discard any captures of the last attempt
						found = run(pc+1, from, pos, sub_end);
					}
				if (gave_up)
				{
					choices.resize(base);
					return false;
				}
				if (!found || negative)
					rollback(mark);		// Captures survive only a successful positive look
				if (found == negative)
					break;
			}
			pc = instr.y;
			continue;

		case OgOp::OgoAtomic:
			{
				size_t		mark = undo_log.size();
				int		sub_end;
				if (!run(pc+1, pos, UNSET, sub_end))
				{
					if (gave_up)
					{
						choices.resize(base);
						return false;
					}
					rollback(mark);
					break;
				}
				pos = sub_end;	// Committed: the body's other choices are gone
			}
			pc = instr.y;
			continue;
		}

		// Failure: resume from the most recent choice point
		if (choices.size() == base)
			return false;
		Choice	choice = choices.back();
		choices.pop_back();
		rollback(choice.undo_mark);
		pc = choice.pc;
		pos = choice.pos;
		TRACK(("Backtrack to %d @%d\n", pc, pos));
	}
}

OgMatch
OgProgram::scan(const OgSubject& subject, int from, int to, long& steps) const
{
	if (from < 0)
		from = 0;
	if (to > subject.length())
		to = subject.length();

	OgMatcher	matcher(*this, subject, steps);
	for (int offset = from; offset <= to; offset++)
	{
		if (matcher.matchAt(offset))
			return OgMatch(this, subject, matcher.captures());
		if (matcher.abandoned())
			return OgMatch(Error(OG_ERR_STEP_LIMIT, "Step limit exceeded", offset));
	}
	return OgMatch();
}

bool
OgProgram::isMatch(const OgSubject& subject, Error* error) const
{
	OgMatch	found = search(subject);
	if (error)
		*error = found.error();
	return found.succeeded();
}

OgMatch
OgProgram::match(const OgSubject& subject) const
{
	return matchAt(subject, 0);
}

OgMatch
OgProgram::matchAt(const OgSubject& subject, int offset) const
{
	long	steps = 0;
	if (offset < 0 || offset > subject.length())
		return OgMatch();
	return scan(subject, offset, offset, steps);
}

OgMatch
OgProgram::search(const OgSubject& subject, int from) const
{
	long	steps = 0;
	return scan(subject, from, subject.length(), steps);
}

/*
 * Successive non-overlapping matches, left to right. After an empty match
 * the search resumes one character further on, so there is always progress.
 */
Error
OgProgram::findAll(const OgSubject& subject, std::vector<OgMatch>& matches) const
{
	long	steps = 0;
	int	cursor = 0;

	matches.clear();
	while (cursor <= subject.length())
	{
		OgMatch	found = scan(subject, cursor, subject.length(), steps);
		if (!found)
			return found.error();
		matches.push_back(found);
		cursor = found.length() > 0 ? found.end() : found.end()+1;
	}
	return Error();
}
