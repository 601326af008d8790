
#include "Compile.h"
#include "CharClass.h"
#include "Constants.h"
#include "Reader.h"
#include "RegexError.h"
#include "Util/Raise.h"
#include "Util/utils.h"

#include <optional>
#include <utility>

namespace Rex {
namespace {

// Work variables for one call to 'compilePattern'.
struct ParseContext {
	Reader Reg_Parse;      // Input scan ptr (scans user's regex)
	size_t Total_Paren = 0; // Parentheses, (),  counter.
};

std::vector<Token> sequence(ParseContext &ctx, bool in_group);

/**
 * @brief Looks up the class for a shortcut escape such as \d.
 *
 * @param ch The character following the backslash.
 * @return The shared class, or nullptr if `ch` is not a shortcut escape.
 */
const CharClass *shortcut_escape(char ch) {
	switch (ch) {
	case 'd':
		return &digitClass();
	case 'w':
		return &wordClass();
	case 's':
		return &spaceClass();
	default:
		return nullptr;
	}
}

/**
 * @brief Determines if the final '$' of a pattern is an anchor. A '$'
 * preceded by an odd number of backslashes is an escaped literal.
 *
 * @param exp The pattern, with any leading '^' already removed.
 * @return `true` if the pattern ends with an unescaped '$'.
 */
bool ends_with_anchor(std::string_view exp) noexcept {
	if (exp.empty() || exp.back() != '$') {
		return false;
	}

	size_t backslashes = 0;
	for (size_t i = exp.size() - 1; i > 0 && exp[i - 1] == '\\'; --i) {
		++backslashes;
	}

	return (backslashes % 2) == 0;
}

/*----------------------------------------------------------------------*
 * char_class
 *
 * Parses the body of a [...] construct; the opening '[' has already
 * been consumed. A ']' directly after the '[' (or '[^') is a member,
 * not the end of the class. Ranges are written X-Y; an escape can not
 * start a range, and a '-' next to the closing ']' is a literal.
 *----------------------------------------------------------------------*/
CharClass char_class(ParseContext &ctx) {

	CharClass cls;
	cls.negated = ctx.Reg_Parse.match('^');

	bool first = true;
	std::optional<uint8_t> range_start; // Last plain member, may begin a range.

	for (;;) {
		if (ctx.Reg_Parse.eof()) {
			Raise<InvalidPattern>("missing ']' for character class");
		}

		const char ch = ctx.Reg_Parse.read();

		if (ch == ']' && !first) {
			return cls;
		}

		first = false;

		if (ch == '\\') {
			if (ctx.Reg_Parse.eof()) {
				Raise<InvalidPattern>("'\\' at end of character class");
			}

			const char esc = ctx.Reg_Parse.read();
			if (const CharClass *shortcut = shortcut_escape(esc)) {
				cls.addClass(*shortcut);
			} else {
				cls.table[static_cast<uint8_t>(esc)] = true;
			}

			range_start.reset();
			continue;
		}

		if (ch == '-' && range_start && !ctx.Reg_Parse.eof() && !ctx.Reg_Parse.next_is(']')) {
			const auto last = static_cast<uint8_t>(ctx.Reg_Parse.read());
			if (last < *range_start) {
				Raise<InvalidPattern>("invalid range %c-%c in character class", *range_start, last);
			}

			cls.addRange(*range_start, last);
			range_start.reset();
			continue;
		}

		const auto member = static_cast<uint8_t>(ch);
		cls.table[member] = true;
		range_start       = member;
	}
}

/*----------------------------------------------------------------------*
 * atom - the lowest level
 *
 * Parses a literal byte, '.', a character class, an escape or a
 * parenthesized group. Groups are numbered in the order of their
 * opening parenthesis.
 *----------------------------------------------------------------------*/
Token atom(ParseContext &ctx) {

	Token token;
	const char ch = ctx.Reg_Parse.read();

	switch (ch) {
	case '(': {
		const size_t index = ++ctx.Total_Paren;

		Group group;
		group.tokens = sequence(ctx, true);

		if (!ctx.Reg_Parse.match(')')) {
			Raise<InvalidPattern>("missing ')' for group %zu", index);
		}

		token.atom       = std::move(group);
		token.groupIndex = index;
		break;
	}
	case '[':
		token.atom = char_class(ctx);
		break;
	case '.':
		token.atom = AnyByte{};
		break;
	case '\\': {
		if (ctx.Reg_Parse.eof()) {
			Raise<InvalidPattern>("'\\' at end of pattern");
		}

		const char esc = ctx.Reg_Parse.read();
		if (const CharClass *shortcut = shortcut_escape(esc)) {
			token.atom = *shortcut;
		} else {
			token.atom = Literal{static_cast<uint8_t>(esc)};
		}
		break;
	}
	default:
		token.atom = Literal{static_cast<uint8_t>(ch)};
		break;
	}

	return token;
}

/*----------------------------------------------------------------------*
 * quantifier
 *
 * Applies a trailing '*', '+', '?' or '{n}' to the token just parsed.
 * Only the exact count form of braces is supported.
 *----------------------------------------------------------------------*/
void quantifier(ParseContext &ctx, Token &token) {

	if (ctx.Reg_Parse.match('*')) {
		token.quant = Quantifier{0, std::nullopt};
	} else if (ctx.Reg_Parse.match('+')) {
		token.quant = Quantifier{1, std::nullopt};
	} else if (ctx.Reg_Parse.match('?')) {
		token.quant = Quantifier{0, 1};
	} else if (ctx.Reg_Parse.match('{')) {

		const std::string_view digits = ctx.Reg_Parse.match_while([](char c) {
			return safe_isdigit(c) != 0;
		});

		if (digits.empty()) {
			Raise<InvalidPattern>("expected a repeat count after '{'");
		}

		if (!ctx.Reg_Parse.match('}')) {
			Raise<InvalidPattern>("missing '}' after repeat count");
		}

		size_t count = 0;
		for (char digit : digits) {
			count = (count * 10) + digit_value(digit);
			if (count > MaxRepeatCount) {
				Raise<InvalidPattern>("repeat count {%.*s} > %zu", static_cast<int>(digits.size()), digits.data(), MaxRepeatCount);
			}
		}

		token.quant = Quantifier{count, count};
	}
}

/*----------------------------------------------------------------------*
 * sequence
 *
 * Parses atoms and their quantifiers until the end of input or, inside
 * a group, until the closing ')' (which is left for the caller).
 *----------------------------------------------------------------------*/
std::vector<Token> sequence(ParseContext &ctx, bool in_group) {

	std::vector<Token> tokens;

	while (!ctx.Reg_Parse.eof()) {
		const char ch = ctx.Reg_Parse.peek();

		if (ch == ')') {
			if (in_group) {
				break;
			}

			Raise<InvalidPattern>("unmatched ')' at offset %zu", ctx.Reg_Parse.index());
		}

		if (ch == '|') {
			Raise<UnsupportedPattern>("alternation '|' is not supported");
		}

		Token token = atom(ctx);
		quantifier(ctx, token);
		tokens.push_back(std::move(token));
	}

	return tokens;
}

}

/**
 * @brief Parses a pattern into its token tree.
 *
 * @param exp The pattern text.
 * @return The parsed pattern.
 *
 * @throws InvalidPattern if the pattern is malformed.
 * @throws UnsupportedPattern if the pattern uses alternation.
 */
Pattern compilePattern(std::string_view exp) {

	Pattern pattern;

	if (!exp.empty() && exp.front() == '^') {
		pattern.anchorStart = true;
		exp.remove_prefix(1);
	}

	if (ends_with_anchor(exp)) {
		pattern.anchorEnd = true;
		exp.remove_suffix(1);
	}

	ParseContext ctx;
	ctx.Reg_Parse = Reader(exp);

	pattern.tokens     = sequence(ctx, false);
	pattern.groupCount = ctx.Total_Paren;
	return pattern;
}

}
