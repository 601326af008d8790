
#include "Decompile.h"
#include "Util/utils.h"

#include <QtDebug>

#include <cstdio>
#include <sstream>

namespace Rex {
namespace {

void decompile_tokens(const std::vector<Token> &tokens, size_t depth, std::vector<Instruction> &results);

// Emits the instructions for a single token.
struct TokenDecompiler : boost::static_visitor<void> {
	TokenDecompiler(const Token &t, size_t d, std::vector<Instruction> &r)
		: token(t), depth(d), results(r) {
	}

	void operator()(const Literal &literal) const {
		results.emplace_back(LiteralInstruction{depth, token.quant, literal.ch});
	}

	void operator()(const AnyByte &) const {
		results.emplace_back(AnyInstruction{depth, token.quant});
	}

	void operator()(const CharClass &cls) const {
		std::string set;
		for (size_t ch = 0; ch < cls.table.size(); ++ch) {
			if (cls.table[ch]) {
				set.push_back(static_cast<char>(ch));
			}
		}

		results.emplace_back(ClassInstruction{depth, token.quant, set, cls.negated});
	}

	void operator()(const Group &group) const {
		const size_t index = token.groupIndex.value_or(0);
		results.emplace_back(OpenInstruction{depth, token.quant, index});
		decompile_tokens(group.tokens, depth + 1, results);
		results.emplace_back(CloseInstruction{depth, index});
	}

	const Token &token;
	size_t depth;
	std::vector<Instruction> &results;
};

void decompile_tokens(const std::vector<Token> &tokens, size_t depth, std::vector<Instruction> &results) {
	for (const Token &token : tokens) {
		boost::apply_visitor(TokenDecompiler(token, depth, results), token.atom);
	}
}

std::string format_byte(uint8_t ch) {
	if (safe_isprint(ch) && ch != '\\' && ch != '\'') {
		return std::string(1, static_cast<char>(ch));
	}

	char buf[8];
	std::snprintf(buf, sizeof(buf), "\\x%02x", ch);
	return buf;
}

std::string format_quantifier(const Quantifier &quant) {
	if (quant.min == 1 && quant.max == std::optional<size_t>(1)) {
		return std::string();
	}

	std::ostringstream ss;
	ss << " {" << quant.min << ',';
	if (quant.max) {
		ss << *quant.max;
	} else {
		ss << "inf";
	}
	ss << '}';
	return ss.str();
}

std::string format_set_byte(uint8_t ch) {
	if (ch == '-' || ch == ']') {
		char buf[8];
		std::snprintf(buf, sizeof(buf), "\\x%02x", ch);
		return buf;
	}

	return format_byte(ch);
}

// Writes a class set with runs of three or more bytes shortened to X-Y.
std::string format_set(const std::string &set) {
	std::string out;

	size_t i = 0;
	while (i < set.size()) {
		size_t j = i;
		while (j + 1 < set.size() && static_cast<uint8_t>(set[j + 1]) == static_cast<uint8_t>(set[j]) + 1) {
			++j;
		}

		if (j - i >= 2) {
			out += format_set_byte(static_cast<uint8_t>(set[i]));
			out += '-';
			out += format_set_byte(static_cast<uint8_t>(set[j]));
		} else {
			for (size_t k = i; k <= j; ++k) {
				out += format_set_byte(static_cast<uint8_t>(set[k]));
			}
		}

		i = j + 1;
	}

	return out;
}

// Renders one instruction as a line of text.
struct InstructionFormatter : boost::static_visitor<std::string> {
	static std::string indent(size_t depth) {
		return std::string(depth * 2, ' ');
	}

	std::string operator()(const AnchorInstruction &insn) const {
		return (insn.anchor == Anchor::Start) ? "BOL" : "EOL";
	}

	std::string operator()(const LiteralInstruction &insn) const {
		return indent(insn.depth) + "EXACTLY '" + format_byte(insn.ch) + "'" + format_quantifier(insn.quant);
	}

	std::string operator()(const AnyInstruction &insn) const {
		return indent(insn.depth) + "ANY" + format_quantifier(insn.quant);
	}

	std::string operator()(const ClassInstruction &insn) const {
		return indent(insn.depth) + (insn.negated ? "ANY_BUT [" : "ANY_OF [") + format_set(insn.set) + "]" + format_quantifier(insn.quant);
	}

	std::string operator()(const OpenInstruction &insn) const {
		return indent(insn.depth) + "OPEN " + std::to_string(insn.index) + format_quantifier(insn.quant);
	}

	std::string operator()(const CloseInstruction &insn) const {
		return indent(insn.depth) + "CLOSE " + std::to_string(insn.index);
	}
};

}

/**
 * @brief Flattens a parsed pattern into a list of instructions, groups
 * becoming OPEN/CLOSE pairs around their contents.
 *
 * @param pattern The parsed pattern.
 * @return The instructions, in pattern order.
 */
std::vector<Instruction> decompilePattern(const Pattern &pattern) {
	std::vector<Instruction> results;

	if (pattern.anchorStart) {
		results.emplace_back(AnchorInstruction{Anchor::Start});
	}

	decompile_tokens(pattern.tokens, 0, results);

	if (pattern.anchorEnd) {
		results.emplace_back(AnchorInstruction{Anchor::End});
	}

	return results;
}

/**
 * @brief Produces a readable listing of a parsed pattern, one instruction
 * per line.
 *
 * @param pattern The parsed pattern.
 * @return The listing.
 */
std::string describePattern(const Pattern &pattern) {
	std::string listing;

	for (const Instruction &insn : decompilePattern(pattern)) {
		listing += boost::apply_visitor(InstructionFormatter(), insn);
		listing += '\n';
	}

	return listing;
}

/**
 * @brief Writes the listing of a parsed pattern to the debug log.
 *
 * @param pattern The parsed pattern.
 */
void dumpPattern(const Pattern &pattern) {
	qDebug("Rex: pattern with %zu group(s)\n%s", pattern.groupCount, describePattern(pattern).c_str());
}

}
