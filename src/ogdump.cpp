/*
 * ogex: diagnostic dump functions, and conversion to PCRE syntax.
 *
 * (c) Copyright Clifford Heath 2022. See LICENSE file for usage rights.
 */
#include	<ogex.h>
#include	<stdio.h>

static std::string
utf8(UCS4 ch)
{
	UTF8	buf[5];
	UTF8*	cp = buf;
	UTF8Put(cp, ch);
	return std::string(buf, cp-buf);
}

// A character as it must be written outside a character class
static std::string
pcre_char(UCS4 ch)
{
	switch (ch)
	{
	case '\n':	return "\\n";
	case '\t':	return "\\t";
	case '\r':	return "\\r";
	case '\f':	return "\\f";
	case '\v':	return "\\v";
	case '\033':	return "\\e";
	case '\\': case '.': case '^': case '$': case '|': case '?':
	case '*': case '+': case '(': case ')': case '[': case ']':
	case '{': case '}':
		return std::string("\\") + (char)ch;
	default:
		return utf8(ch);
	}
}

// A character as it must be written inside a character class
static std::string
pcre_class_char(UCS4 ch)
{
	switch (ch)
	{
	case ']': case '\\': case '^': case '-':
		return std::string("\\") + (char)ch;
	case '\n':	return "\\n";
	case '\t':	return "\\t";
	default:
		return utf8(ch);
	}
}

static std::string
anchor_text(OgAnchor anchor)
{
	switch (anchor)
	{
	case OgAnchor::StartOfString:	return "^";
	case OgAnchor::EndOfString:	return "$";
	case OgAnchor::StartOfLine:	return "(?m:^)";
	case OgAnchor::EndOfLine:	return "(?m:$)";
	case OgAnchor::WordBoundary:	return "\\b";
	case OgAnchor::NonWordBoundary:	return "\\B";
	}
	return "";
}

std::string
OgProgram::transpile() const
{
	std::function<std::string(OgNodeId)>	render =
		[&](OgNodeId id) -> std::string
		{
			const OgNode&	n = node_arena[id];
			std::string	out;

			switch (n.type)
			{
			case OgNodeType::Empty:
				break;

			case OgNodeType::Literal:
				out = pcre_char(n.ch);
				break;

			case OgNodeType::Any:
				out = ".";
				break;

			case OgNodeType::Shorthand:
				out = std::string("\\") + (char)n.ch;
				break;

			case OgNodeType::CharClass:
				out = n.negated ? "[^" : "[";
				for (const OgClassItem& item: n.items)
				{
					if (item.shorthand)
						out += std::string("\\") + item.shorthand;
					else
					{
						out += pcre_class_char(item.low);
						if (item.high != item.low)
							out += "-" + pcre_class_char(item.high);
					}
				}
				out += "]";
				break;

			case OgNodeType::Anchor:
				out = anchor_text(n.anchor);
				break;

			case OgNodeType::Concat:
				for (OgNodeId child: n.children)
					out += render(child);
				break;

			case OgNodeType::Alternation:
				for (size_t k = 0; k < n.children.size(); k++)
				{
					if (k > 0)
						out += "|";
					out += render(n.children[k]);
				}
				break;

			case OgNodeType::Repeat:
				{
					OgNodeType	child_type = node_arena[n.children[0]].type;
					if (child_type == OgNodeType::Concat || child_type == OgNodeType::Alternation)
						out = "(?:" + render(n.children[0]) + ")";
					else
						out = render(n.children[0]);

					if (n.min == 0 && n.max < 0)
						out += "*";
					else if (n.min == 1 && n.max < 0)
						out += "+";
					else if (n.min == 0 && n.max == 1)
						out += "?";
					else if (n.max == n.min)
						out += "{" + std::to_string(n.min) + "}";
					else if (n.max < 0)
						out += "{" + std::to_string(n.min) + ",}";
					else
						out += "{" + std::to_string(n.min) + "," + std::to_string(n.max) + "}";
					if (!n.greedy)
						out += "?";
				}
				break;

			case OgNodeType::Group:
				switch (n.kind)
				{
				case OgGroupKind::Capture:	out = "(";	break;
				case OgGroupKind::Named:	out = "(?<" + n.name + ">";	break;
				case OgGroupKind::NonCapture:	out = "(?:";	break;
				case OgGroupKind::Mode:		out = "(?" + n.name + ":";	break;
				case OgGroupKind::LookAhead:	out = "(?=";	break;
				case OgGroupKind::NegLookAhead:	out = "(?!";	break;
				case OgGroupKind::LookBehind:	out = "(?<=";	break;
				case OgGroupKind::NegLookBehind: out = "(?<!";	break;
				case OgGroupKind::Atomic:	out = "(?>";	break;
				}
				out += render(n.children[0]) + ")";
				break;

			case OgNodeType::Backreference:
				if (n.ref_kind == OgRefKind::Named)
					out = "\\k<" + n.name + ">";
				else
					out = "\\g{" + std::to_string(n.group) + "}";
				break;
			}
			return out;
		};

	return render(root_node);
}

void
OgProgram::dump() const
{
	std::function<void(OgNodeId, int)>	dump_node =
		[&](OgNodeId id, int depth)
		{
			const OgNode&	n = node_arena[id];

			printf("%*s", depth*2, "");
			switch (n.type)
			{
			case OgNodeType::Empty:
				printf("Empty\n");
				break;
			case OgNodeType::Literal:
				printf("Literal %d='%s'%s\n", (int)n.ch, utf8(n.ch).c_str(), n.fold ? " (fold)" : "");
				break;
			case OgNodeType::Any:
				printf("Any%s\n", n.dotall ? "" : " (not newline)");
				break;
			case OgNodeType::Shorthand:
				printf("Shorthand \\%c\n", (char)n.ch);
				break;
			case OgNodeType::CharClass:
				printf("CharClass%s %d items%s\n", n.negated ? " negated" : "", (int)n.items.size(), n.fold ? " (fold)" : "");
				break;
			case OgNodeType::Anchor:
				printf("Anchor %s\n", anchor_text(n.anchor).c_str());
				break;
			case OgNodeType::Concat:
				printf("Concat\n");
				break;
			case OgNodeType::Alternation:
				printf("Alternation\n");
				break;
			case OgNodeType::Repeat:
				printf("Repeat {%d,%d}%s\n", n.min, n.max, n.greedy ? "" : " lazy");
				break;
			case OgNodeType::Group:
				printf("Group '%c'", (char)n.kind);
				if (n.group)
					printf(" %d", n.group);
				if (!n.name.empty())
					printf(" %s", n.name.c_str());
				printf("\n");
				break;
			case OgNodeType::Backreference:
				printf("Backreference to %d", n.group);
				if (n.ref_kind == OgRefKind::Relative)
					printf(" (written -%d)", n.number);
				else if (n.ref_kind == OgRefKind::Named)
					printf(" (written %s)", n.name.c_str());
				printf("\n");
				break;
			}
			for (OgNodeId child: n.children)
				dump_node(child, depth+1);
		};

	printf("Pattern '%s', %d groups\n", source.c_str(), groups.count());
	dump_node(root_node, 1);
}

void
OgProgram::dumpCode() const
{
	printf("%d instructions, %d slots\n", (int)instructions.size(), slot_count);
	for (int pc = 0; pc < (int)instructions.size(); pc++)
		dumpInstruction(pc);
}

void
OgProgram::dumpInstruction(int pc) const		// Disassemble one instruction to stdout
{
	if (pc < 0 || pc >= (int)instructions.size())
	{
		printf("%d\tIllegal instruction address\n", pc);
		return;
	}

	const OgInstr&	instr = instructions[pc];
	const char*	fold = instr.fold ? " (fold)" : "";

	printf("%d\t", pc);
	switch (instr.op)
	{
	case OgOp::OgoMatch:
		printf("Match\n");
		break;

	case OgOp::OgoChar:
		printf("Char %d='%s'%s\n", instr.x, utf8((UCS4)instr.x).c_str(), fold);
		break;

	case OgOp::OgoAny:
		printf("Any%s\n", instr.x ? "" : " (not newline)");
		break;

	case OgOp::OgoShorthand:
		printf("Shorthand \\%c\n", (char)instr.x);
		break;

	case OgOp::OgoClass:
		printf("Class node %d%s\n", instr.x, fold);
		break;

	case OgOp::OgoAssert:
		printf("Assert %s\n", anchor_text((OgAnchor)instr.x).c_str());
		break;

	case OgOp::OgoOpen:
		printf("Open group %d '%s'\n", instr.x, groups.name(instr.x).c_str());
		break;

	case OgOp::OgoClose:
		printf("Close group %d '%s'\n", instr.x, groups.name(instr.x).c_str());
		break;

	case OgOp::OgoMark:
		printf("Mark slot %d\n", instr.x);
		break;

	case OgOp::OgoProgress:
		printf("Progress slot %d, exit->%d\n", instr.x, instr.y);
		break;

	case OgOp::OgoSplit:
		printf("Split ->%d, else ->%d\n", instr.x, instr.y);
		break;

	case OgOp::OgoJump:
		printf("Jump ->%d\n", instr.x);
		break;

	case OgOp::OgoBackref:
		printf("Backref group %d%s\n", instr.x, fold);
		break;

	case OgOp::OgoLook:
		printf("Look '%c', continue->%d\n", (char)instr.x, instr.y);
		break;

	case OgOp::OgoAtomic:
		printf("Atomic, continue->%d\n", instr.y);
		break;
	}
}
