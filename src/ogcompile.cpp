/*
 * ogex: pattern compiler
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<ogex.h>

#define	ShorthandLetter(ch)	((ch) == 'd' || (ch) == 'w' || (ch) == 's' || (ch) == 'D' || (ch) == 'W' || (ch) == 'S')
#define	IdentifierStart(ch)	(((ch) >= 'a' && (ch) <= 'z') || ((ch) >= 'A' && (ch) <= 'Z') || (ch) == '_')

OgCompiler::OgCompiler(const std::string& pattern, OgFeature features, OgFeature reject_features)
: source(pattern)
, features_enabled((OgFeature)((int32_t)features & ~(int32_t)reject_features))
, features_rejected(reject_features)
, error_message(0)
, error_offset(0)
, step_limit(0)
{
	const UTF8*	cp = source.c_str();
	const UTF8*	ep = cp + source.size();
	while (cp < ep)
		re.push_back(UTF8Get(cp));
}

OgCompiler::~OgCompiler()
{
}

bool OgCompiler::supported(OgFeature feat)
{
	if (((int32_t)features_rejected & (int32_t)feat) != 0)
	{
		error_message = "Rejected feature";
		return false;
	}
	return enabled(feat);
}

bool OgCompiler::enabled(OgFeature feat) const
{
	return ((int32_t)features_enabled & (int32_t)feat) != 0;
}

Error OgCompiler::error() const
{
	if (!error_message)
		return Error();
	return Error(OG_ERR_COMPILE, error_message, error_offset);
}

/*
 * The lexer makes one pass over the pattern, calling func with each token.
 * Features that are not enabled leave their characters to be taken literally.
 * The mode-dependent meaning of anchors, case and dot is left to the parser,
 * which knows which mode groups are open.
 */
bool OgCompiler::scanPattern(const std::function<bool(const OgToken& token)> func)
{
	int		len = (int)re.size();
	int		i = 0;		// Pattern character offset
	int		start;		// Offset of the current token
	UCS4		ch;		// A single character to match
	bool		ok = true;
	auto		at = [&](int j) -> UCS4 { return j >= 0 && j < len ? re[j] : UCS4_NONE; };
	auto		emit =
			[&](OgToken& token) -> bool
			{
				token.offset = start;
				return func(token);
			};
	auto		c_escape =	// Map a C escape letter to its control character, or zero
			[&](UCS4 c) -> UCS4
			{
				if (!enabled(OgFeature::CEscapes))
					return 0;
				switch (c)
				{
				case 'n':	return '\n';
				case 't':	return '\t';
				case 'r':	return '\r';
				case 'f':	return '\f';
				case 'v':	return '\v';
				case 'e':	return '\033';
				default:	return 0;
				}
			};
	auto		number =	// Scan decimal digits at i, leaving i on the last. -1 on overflow
			[&](int& value) -> bool
			{
				value = 0;
				if (!UCS4IsDecimal(at(i)))
					return false;
				for (;;)
				{
					if (value <= 100000)
						value = value*10 + UCS4Digit(at(i));
					if (!UCS4IsDecimal(at(i+1)))
						break;
					i++;
				}
				if (value > 100000)
					value = -1;
				return true;
			};

	error_message = 0;
	error_offset = 0;
	start = 0;
	{
		OgToken	token(OgTok::Start);
		ok = emit(token);
	}
	for (; ok && !error_message && i < len; i++)
	{
		OgToken		token(OgTok::Literal);
		start = i;
		switch (ch = re[i])
		{
		case '^':
			if (!supported(OgFeature::BOS))
				goto simple_char;
			token.op = OgTok::Anchor;
			token.anchor = OgAnchor::StartOfString;
			ok = emit(token);
			break;

		case '$':
			if (!supported(OgFeature::EOS))
				goto simple_char;
			token.op = OgTok::Anchor;
			token.anchor = OgAnchor::EndOfString;
			ok = emit(token);
			break;

		case '.':
			token.op = OgTok::Any;
			ok = emit(token);
			break;

		case '?':
			if (!supported(OgFeature::ZeroOrOneQuest))
				goto simple_char;
			token.min = 0;
			token.max = 1;
			goto repetition;

		case '*':
			if (!supported(OgFeature::ZeroOrMore))
				goto simple_char;
			token.min = 0;
			token.max = -1;
			goto repetition;

		case '+':
			if (!supported(OgFeature::OneOrMore))
				goto simple_char;
			token.min = 1;
			token.max = -1;
			goto repetition;

		case '{':
			if (!supported(OgFeature::CountRepetition)
			 || !UCS4IsDecimal(at(i+1)))	// Not a repetition, so just a brace
				goto simple_char;
			i++;
			(void)number(token.min);
			i++;
			if (at(i) == '}')
				token.max = token.min;	// Exact repetition count
			else if (at(i) == ',')
			{
				i++;
				if (at(i) == '}')
					token.max = -1;
				else if (!number(token.max) || at(++i) != '}')
				{
		bad_repetition:		error_message = "Bad repetition count";
					break;
				}
			}
			else
				goto bad_repetition;
			if (token.min < 0 || token.min > OgMaxRepetition || token.max > OgMaxRepetition
			 || (token.max < 0 && at(i-1) != ','))
			{
				error_message = "Repetition count too large";
				break;
			}
			if (token.max >= 0 && token.max < token.min)
				goto bad_repetition;

		repetition:
			token.op = OgTok::Repetition;
			if (at(i+1) == '?' && supported(OgFeature::LazyRepetition))
			{
				token.greedy = false;
				i++;
			}
			if (error_message)
				break;
			ok = emit(token);
			break;

		case '\\':		// Escape sequence
			switch (ch = at(++i))
			{
			case UCS4_NONE:
				error_message = "Pattern ends with a backslash";
				break;

			case 'd': case 'w': case 's':
			case 'D': case 'W': case 'S':
				if (!supported(OgFeature::Shorthand))
					goto simple_escape;
				token.op = OgTok::Shorthand;
				token.ch = ch;
				ok = emit(token);
				break;

			case 'b': case 'B':
				if (!supported(OgFeature::WordBoundary))
					goto simple_escape;
				token.op = OgTok::Anchor;
				token.anchor = ch == 'b' ? OgAnchor::WordBoundary : OgAnchor::NonWordBoundary;
				ok = emit(token);
				break;

			case '1': case '2': case '3': case '4': case '5':
			case '6': case '7': case '8': case '9':
				if (!supported(OgFeature::Backreference))
					goto simple_escape;
				token.op = OgTok::Backreference;
				token.ref_kind = OgRefKind::Numbered;
				(void)number(token.number);
				ok = emit(token);
				break;

			case 'g':
				if (at(i+1) != '{' || !supported(OgFeature::Backreference))
					goto simple_escape;
				{
					int	close = i+2;
					while (close < len && at(close) != '}')
						close++;
					if (close >= len || close == i+2)
					{
		bad_reference:			error_message = "Bad group reference";
						break;
					}

					token.op = OgTok::Backreference;
					i += 2;		// Point at the first character inside the braces
					if (at(i) == '-')
					{		// Relative reference
						i++;
						token.ref_kind = OgRefKind::Relative;
						if (!number(token.number) || i+1 != close || token.number < 1)
							goto bad_reference;
					}
					else if (UCS4IsDecimal(at(i)))
					{
						token.ref_kind = OgRefKind::Numbered;
						if (!number(token.number) || i+1 != close)
							goto bad_reference;
					}
					else if (IdentifierStart(at(i)))
					{
						token.ref_kind = OgRefKind::Named;
						for (; i < close; i++)
						{
							if (!UCS4IsWord(at(i)))
								goto bad_reference;
							token.name += (char)at(i);
						}
					}
					else
						goto bad_reference;
					i = close;
					ok = emit(token);
				}
				break;

			default:
		simple_escape:
				if (error_message)
					break;
				ch = at(i);
				if (c_escape(ch))
					ch = c_escape(ch);
				token.ch = ch;
				ok = emit(token);
				break;
			}
			break;

		case '[':		// Character class
			if (!supported(OgFeature::CharClasses))
				goto simple_char;

			token.op = OgTok::CharClass;
			token.negated = at(++i) == '^';
			if (token.negated)
				i++;

			// A class that starts with - or ] means those literally:
			ch = at(i);
			if (ch == '-' || ch == ']')
			{
				token.items.push_back(OgClassItem(ch, ch));
				ch = at(++i);
			}
			while (ch != UCS4_NONE && ch != ']')
			{
				UCS4	low = ch;
				UCS4	high;
				if (ch == '\\')
				{
					if ((ch = at(++i)) == UCS4_NONE)
						goto bad_class;		// Pattern ends with the backslash
					if (ShorthandLetter(ch) && enabled(OgFeature::Shorthand))
					{
						token.items.push_back(OgClassItem((char)ch));
						ch = at(++i);
						continue;
					}
					low = c_escape(ch) ? c_escape(ch) : ch;
				}

				high = low;
				if (at(i+1) == '-' && at(i+2) != ']' && at(i+2) != UCS4_NONE)
				{		// Character range
					i += 2;
					high = at(i);
					if (high == '\\')
					{
						if ((high = at(++i)) == UCS4_NONE)
							goto bad_class;
						if (ShorthandLetter(high) && enabled(OgFeature::Shorthand))
							goto bad_range;
						if (c_escape(high))
							high = c_escape(high);
					}
					if (high < low)
					{
		bad_range:			error_message = "Bad character class range";
						break;
					}
				}
				token.items.push_back(OgClassItem(low, high));
				ch = at(++i);
			}
			if (error_message)
				break;
			if (ch == UCS4_NONE)
			{
		bad_class:	error_message = "Bad character class";
				break;
			}
			ok = emit(token);
			break;

		case '|':
			if (!supported(OgFeature::Alternates))
				goto simple_char;
			token.op = OgTok::Alternate;
			ok = emit(token);
			break;

		case '(':
			if (!supported(OgFeature::Group))
				goto simple_char;
			token.op = OgTok::Group;
			if (at(i+1) == '?')
			{
				if (at(i+2) == ':' && supported(OgFeature::NonCapture))
				{
					i += 2;
					token.kind = OgGroupKind::NonCapture;
					ok = emit(token);
					break;
				}
		illegal_group:	if (!error_message)
					error_message = "Illegal group type";
				break;
			}

			if (at(i+1) == '@')
			{
				int		j = i+2;
				OgFeature	feature = OgFeature::Lookaround;
				switch (at(j))
				{
				case '>':
				case '<':
					if (at(j+1) == '~')
					{
						token.kind = at(j) == '>' ? OgGroupKind::NegLookAhead : OgGroupKind::NegLookBehind;
						j++;
					}
					else
						token.kind = at(j) == '>' ? OgGroupKind::LookAhead : OgGroupKind::LookBehind;
					j++;
					break;

				case '*':
					feature = OgFeature::AtomicGroup;
					token.kind = OgGroupKind::Atomic;
					j++;
					break;

				default:
					feature = OgFeature::ModeGroup;
					token.kind = OgGroupKind::Mode;
					for (; at(j) == 'i' || at(j) == 'm' || at(j) == 's'; j++)
						if (token.name.find((char)at(j)) == std::string::npos)
							token.name += (char)at(j);
					if (token.name.empty())
						goto illegal_group;
					break;
				}
				if (at(j) != ':')
					goto illegal_group;
				if (!supported(feature))
				{
					if (error_message)
						break;
					token.kind = OgGroupKind::Capture;	// Treat the rest as literal text
					token.name.clear();
					ok = emit(token);
					break;
				}
				i = j;
				ok = emit(token);
				break;
			}

			if (IdentifierStart(at(i+1)))
			{		// Possibly a named group
				int	j = i+1;
				while (UCS4IsWord(at(j)))
					j++;
				if (at(j) == ':' && supported(OgFeature::NamedCapture))
				{
					token.kind = OgGroupKind::Named;
					for (int k = i+1; k < j; k++)
						token.name += (char)at(k);
					i = j;
					ok = emit(token);
					break;
				}
			}

			if (error_message)
				break;
			token.kind = OgGroupKind::Capture;
			ok = emit(token);
			break;

		case ')':
			if (!enabled(OgFeature::Group))
				goto simple_char;
			token.op = OgTok::EndGroup;
			ok = emit(token);
			break;

		case '#':
			if (!enabled(OgFeature::ExtendedRE))
				goto simple_char;
			while (i+1 < len && at(i+1) != '\n')	// Comment to end of line
				i++;
			break;

		case ' ': case '\t': case '\n': case '\r': case '\f': case '\v':
			if (!enabled(OgFeature::ExtendedRE))
				goto simple_char;
			break;

		default:
		simple_char:
			if (error_message)
				break;
			token.op = OgTok::Literal;
			token.ch = re[i];
			ok = emit(token);
			break;
		}
		if (ok && error_message)
			error_offset = start;
	}
	if (!ok || error_message)
		return false;

	OgToken	token(OgTok::Accept);
	start = len;
	return emit(token);
}

/*
 * Compilation strategy is as follows:
 * - Scan the pattern once, building the syntax tree bottom-up as the tokens arrive.
 *   Each open group has a frame holding the alternatives completed so far and the
 *   sequence of items in the current alternative. A repetition wraps the last item.
 * - Groups are registered in the group table as their parenthesis opens, so
 *   backreferences can be resolved immediately, to groups on their left.
 * - The mode in effect (case, multiline, dot) is held on each frame and applied
 *   to nodes as they are made.
 * - Finally, generate instructions from the tree.
 */
bool
OgCompiler::compile(Ref<OgProgram>& result)
{
	struct Frame {
		OgNodeId	group;		// The Group node being built, or -1 for the whole pattern
		int		offset;		// Where the group opened
		bool		fold;		// Modes in effect inside this group
		bool		multiline;
		bool		dotall;
		std::vector<OgNodeId>	alternates;	// Alternatives completed so far
		std::vector<OgNodeId>	sequence;	// The current alternative
	};
	std::vector<Frame>	stack;
	Ref<OgProgram>		program = new OgProgram();
	std::vector<OgNode>&	nodes = program->node_arena;
	OgGroupTable&		groups = program->groups;

	auto	tos = [&]() -> Frame& { return stack.back(); };
	auto	node =
		[&](OgNodeType type) -> OgNodeId
		{
			nodes.push_back(OgNode(type));
			return (OgNodeId)nodes.size()-1;
		};
	auto	finish_sequence =
		[&](Frame& frame) -> OgNodeId
		{
			OgNodeId	id;
			if (frame.sequence.size() == 1)
				id = frame.sequence[0];
			else if (frame.sequence.empty())
				id = node(OgNodeType::Empty);
			else
			{
				id = node(OgNodeType::Concat);
				nodes[id].children = frame.sequence;
			}
			frame.sequence.clear();
			return id;
		};
	auto	finish_frame =
		[&](Frame& frame) -> OgNodeId
		{
			OgNodeId	last = finish_sequence(frame);
			if (frame.alternates.empty())
				return last;
			OgNodeId	id = node(OgNodeType::Alternation);
			nodes[id].children = frame.alternates;
			nodes[id].children.push_back(last);
			return id;
		};
	auto	fail =
		[&](const OgToken& token, const char* message) -> bool
		{
			error_message = message;
			error_offset = token.offset;
			return false;
		};

	auto	parse =
		[&](const OgToken& token) -> bool
		{
			OgNodeId	id;

			switch (token.op)
			{
			case OgTok::Start:
				{
					Frame	frame;
					frame.group = -1;
					frame.offset = 0;
					frame.fold = enabled(OgFeature::CaseInsensitive);
					frame.multiline = enabled(OgFeature::Multiline);
					frame.dotall = !enabled(OgFeature::AnyExcludesNL);
					stack.push_back(frame);
				}
				return true;

			case OgTok::Accept:
				if (stack.size() > 1)
					return fail(token, "Not all groups were closed");
				program->root_node = finish_frame(tos());
				stack.pop_back();
				return true;

			case OgTok::Literal:
				id = node(OgNodeType::Literal);
				nodes[id].ch = token.ch;
				nodes[id].fold = tos().fold;
				break;

			case OgTok::Any:
				id = node(OgNodeType::Any);
				nodes[id].dotall = tos().dotall;
				break;

			case OgTok::Shorthand:
				id = node(OgNodeType::Shorthand);
				nodes[id].ch = token.ch;
				break;

			case OgTok::CharClass:
				id = node(OgNodeType::CharClass);
				nodes[id].items = token.items;
				nodes[id].negated = token.negated;
				nodes[id].fold = tos().fold;
				break;

			case OgTok::Anchor:
				id = node(OgNodeType::Anchor);
				nodes[id].anchor = token.anchor;
				if (tos().multiline && token.anchor == OgAnchor::StartOfString)
					nodes[id].anchor = OgAnchor::StartOfLine;
				else if (tos().multiline && token.anchor == OgAnchor::EndOfString)
					nodes[id].anchor = OgAnchor::EndOfLine;
				break;

			case OgTok::Backreference:
				id = node(OgNodeType::Backreference);
				nodes[id].ref_kind = token.ref_kind;
				nodes[id].number = token.number;
				nodes[id].name = token.name;
				nodes[id].fold = tos().fold;
				switch (token.ref_kind)
				{
				case OgRefKind::Numbered:
					if (token.number < 1 || token.number > groups.count())
						return fail(token, "Backreference to undefined group");
					nodes[id].group = token.number;
					break;
				case OgRefKind::Named:
					if ((nodes[id].group = groups.lookup(token.name)) < 0)
						return fail(token, "Backreference to undefined group name");
					break;
				case OgRefKind::Relative:
					if ((nodes[id].group = groups.relative(token.number)) == 0)
						return fail(token, "Relative backreference has no matching group");
					break;
				}
				break;

			case OgTok::Group:
				{
					if (stack.size() > OgMaxNesting)
						return fail(token, "Nesting too deep");

					Frame	frame;
					frame.offset = token.offset;
					frame.fold = tos().fold;
					frame.multiline = tos().multiline;
					frame.dotall = tos().dotall;
					frame.group = node(OgNodeType::Group);
					nodes[frame.group].kind = token.kind;
					nodes[frame.group].name = token.name;
					switch (token.kind)
					{
					case OgGroupKind::Capture:
					case OgGroupKind::Named:
						if (!groups.add(token.name, nodes[frame.group].group))
							return fail(token, "Duplicate name");
						break;
					case OgGroupKind::Mode:
						if (token.name.find('i') != std::string::npos)
							frame.fold = true;
						if (token.name.find('m') != std::string::npos)
							frame.multiline = true;
						if (token.name.find('s') != std::string::npos)
							frame.dotall = true;
						break;
					default:
						break;
					}
					stack.push_back(frame);
				}
				return true;

			case OgTok::EndGroup:
				if (stack.size() <= 1)
					return fail(token, "Too many closing parentheses");
				id = tos().group;
				{
					OgNodeId	body = finish_frame(tos());
					nodes[id].children.push_back(body);
				}
				stack.pop_back();
				break;

			case OgTok::Alternate:
				{
					OgNodeId	alternate = finish_sequence(tos());
					tos().alternates.push_back(alternate);
				}
				return true;

			case OgTok::Repetition:
				if (tos().sequence.empty())
					return fail(token, "Nothing to repeat");
				if (nodes[tos().sequence.back()].type == OgNodeType::Repeat)
					return fail(token, "Repeating a repetition is disallowed");
				id = node(OgNodeType::Repeat);
				nodes[id].min = token.min;
				nodes[id].max = token.max;
				nodes[id].greedy = token.greedy;
				nodes[id].children.push_back(tos().sequence.back());
				tos().sequence.back() = id;
				return true;

			default:
				return fail(token, "Internal error: unknown token");
			}
			tos().sequence.push_back(id);
			return true;
		};

	error_message = 0;
	error_offset = 0;
	if (!scanPattern(parse))
		return false;

	program->source = source;
	program->pattern_length = (int)re.size();
	program->features_enabled = features_enabled;
	program->step_limit = step_limit;
	if (!generate(*program))
		return false;

	result = program;
	return true;
}

/*
 * Code generation.
 *
 * Alternation:	Split L1, N1; L1: alt1; Jump End; N1: Split L2, N2; ... altN; End:
 * Repeat:	the child min times, then either
 *		max-min times: Split Body, Exit; Body: child	(nested, all exiting to Exit)
 *		or unbounded:	Loop: Split Body, Exit; Body: Mark k; child; Progress k, Exit; Jump Loop; Exit:
 *		Lazy repetition reverses the Split preferences.
 * Capture:	Open g; child; Close g
 * Look:	Look kind, Cont; child; Match; Cont:
 * Atomic:	Atomic Cont; child; Match; Cont:
 */
bool
OgCompiler::generate(OgProgram& program)
{
	const std::vector<OgNode>&	nodes = program.node_arena;
	std::vector<OgInstr>&		code = program.instructions;
	int		group_slots = 2*(program.groups.count()+1);
	int		next_loop_slot = group_slots + program.groups.count();	// Loop slots follow the pending-start slots
	bool		too_large = false;

	auto	emit =
		[&](OgOp op, int x = 0, int y = 0, bool fold = false) -> int
		{
			if (code.size() >= OgMaxCode)
			{
				too_large = true;
				return 0;
			}
			OgInstr	instr;
			instr.op = op;
			instr.x = x;
			instr.y = y;
			instr.fold = fold;
			code.push_back(instr);
			return (int)code.size()-1;
		};
	auto	here = [&]() -> int { return (int)code.size(); };
	auto	split_to =		// Point a split at its body and exit, in order of preference
		[&](int split, int body, int exit, bool greedy)
		{
			if (too_large)
				return;
			code[split].x = greedy ? body : exit;
			code[split].y = greedy ? exit : body;
		};

	std::function<void(OgNodeId)>	generate_node =
		[&](OgNodeId id)
		{
			const OgNode&	n = nodes[id];
			int		at;

			if (too_large)
				return;
			switch (n.type)
			{
			case OgNodeType::Empty:
				break;

			case OgNodeType::Literal:
				emit(OgOp::OgoChar, (int)n.ch, 0, n.fold);
				break;

			case OgNodeType::Any:
				emit(OgOp::OgoAny, n.dotall ? 1 : 0);
				break;

			case OgNodeType::Shorthand:
				emit(OgOp::OgoShorthand, (int)n.ch);
				break;

			case OgNodeType::CharClass:
				emit(OgOp::OgoClass, id, 0, n.fold);
				break;

			case OgNodeType::Anchor:
				emit(OgOp::OgoAssert, (int)n.anchor);
				break;

			case OgNodeType::Concat:
				for (OgNodeId child: n.children)
					generate_node(child);
				break;

			case OgNodeType::Alternation:
				{
					std::vector<int>	jumps;
					for (size_t k = 0; k < n.children.size(); k++)
					{
						bool	last = k+1 == n.children.size();
						int	split = 0;
						if (!last)
							split = emit(OgOp::OgoSplit);
						generate_node(n.children[k]);
						if (!last)
						{
							jumps.push_back(emit(OgOp::OgoJump));
							split_to(split, split+1, here(), true);
						}
					}
					if (!too_large)
						for (int jump: jumps)
							code[jump].x = here();
				}
				break;

			case OgNodeType::Repeat:
				for (int k = 0; k < n.min; k++)
					generate_node(n.children[0]);
				if (n.max < 0)
				{
					int	slot = next_loop_slot++;
					int	loop = emit(OgOp::OgoSplit);
					emit(OgOp::OgoMark, slot);
					generate_node(n.children[0]);
					int	progress = emit(OgOp::OgoProgress, slot);
					emit(OgOp::OgoJump, loop);
					split_to(loop, loop+1, here(), n.greedy);
					if (!too_large)
						code[progress].y = here();
				}
				else
				{
					std::vector<int>	splits;
					for (int k = n.min; k < n.max && !too_large; k++)
					{
						splits.push_back(emit(OgOp::OgoSplit));
						generate_node(n.children[0]);
					}
					for (int split: splits)
						split_to(split, split+1, here(), n.greedy);
				}
				break;

			case OgNodeType::Group:
				switch (n.kind)
				{
				case OgGroupKind::Capture:
				case OgGroupKind::Named:
					emit(OgOp::OgoOpen, n.group);
					generate_node(n.children[0]);
					emit(OgOp::OgoClose, n.group);
					break;

				case OgGroupKind::NonCapture:
				case OgGroupKind::Mode:
					generate_node(n.children[0]);
					break;

				case OgGroupKind::LookAhead:
				case OgGroupKind::NegLookAhead:
				case OgGroupKind::LookBehind:
				case OgGroupKind::NegLookBehind:
				case OgGroupKind::Atomic:
					at = n.kind == OgGroupKind::Atomic
						? emit(OgOp::OgoAtomic)
						: emit(OgOp::OgoLook, (int)n.kind);
					generate_node(n.children[0]);
					emit(OgOp::OgoMatch);
					if (!too_large)
						code[at].y = here();
					break;
				}
				break;

			case OgNodeType::Backreference:
				emit(OgOp::OgoBackref, n.group, 0, n.fold);
				break;
			}
		};

	generate_node(program.root_node);
	emit(OgOp::OgoMatch);
	if (too_large)
	{
		error_message = "Pattern is too large";
		error_offset = 0;
		return false;
	}
	program.slot_count = next_loop_slot;
	return true;
}
