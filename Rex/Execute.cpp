
#include "Execute.h"
#include "Constants.h"
#include "RegexError.h"
#include "Util/Compiler.h"
#include "Util/Raise.h"

#include <QtDebug>

#include <algorithm>
#include <utility>

namespace Rex {
namespace {

// Work variables for one call to 'execMatch'.
struct ExecuteContext {
	std::string_view Text;   // The subject; offsets are relative to its start.
	int Recursion_Count = 0; // Current depth of 'match_from'.
};

/* Counts one level of 'match_from' for as long as the frame is alive. The
 * recursion limit is an engine failure, not a failed match, so it aborts
 * the entire search. */
class RecursionGuard {
public:
	explicit RecursionGuard(ExecuteContext &ctx)
		: ctx_(ctx) {
		if (++ctx_.Recursion_Count > RecursionLimit) {
			--ctx_.Recursion_Count;
			qWarning("Rex: recursion limit of %d exceeded", RecursionLimit);
			ReportError("recursion limit exceeded");
			Raise<RegexError>("recursion limit exceeded, please respecify expression");
		}
	}

	~RecursionGuard() {
		--ctx_.Recursion_Count;
	}

	RecursionGuard(const RecursionGuard &)            = delete;
	RecursionGuard &operator=(const RecursionGuard &) = delete;

private:
	ExecuteContext &ctx_;
};

// Tests a single byte against a non-group atom.
struct ByteMatcher : boost::static_visitor<bool> {
	explicit ByteMatcher(uint8_t c)
		: ch(c) {
	}

	bool operator()(const Literal &literal) const { return literal.ch == ch; }
	bool operator()(const AnyByte &) const { return true; }
	bool operator()(const CharClass &cls) const { return cls.matches(ch); }
	bool operator()(const Group &) const { return false; }

	uint8_t ch;
};

std::optional<size_t> match_from(ExecuteContext &ctx, const std::vector<Token> &tokens, size_t index, size_t pos, GroupSpans &groups);

FORCE_INLINE bool byte_matches(const Atom &atom, char ch) {
	return boost::apply_visitor(ByteMatcher(static_cast<uint8_t>(ch)), atom);
}

/*----------------------------------------------------------------------*
 * max_repeat_single
 *
 * Counts how many consecutive bytes starting at 'pos' a single byte
 * atom matches, stopping early at 'max' if one is given. This is the
 * greedy upper bound for the repeat count. Groups always yield zero.
 *----------------------------------------------------------------------*/
size_t max_repeat_single(const ExecuteContext &ctx, const Atom &atom, size_t pos, std::optional<size_t> max) {

	size_t count        = 0;
	const size_t limit  = max ? *max : ctx.Text.size();

	while (count < limit && pos + count < ctx.Text.size() && byte_matches(atom, ctx.Text[pos + count])) {
		++count;
	}

	return count;
}

/*----------------------------------------------------------------------*
 * match_once
 *
 * Matches one repetition of a token at 'pos'. A group runs its own
 * token list in place against the subject and, on success, records its
 * span in 'groups'.
 *----------------------------------------------------------------------*/
std::optional<size_t> match_once(ExecuteContext &ctx, const Token &token, size_t pos, GroupSpans &groups) {

	if (const Group *group = asGroup(token.atom)) {
		if (!token.groupIndex || *token.groupIndex >= groups.size()) {
			ReportError("group without a valid index");
			Raise<RegexError>("internal error, group without a valid index");
		}

		const std::optional<size_t> end = match_from(ctx, group->tokens, 0, pos, groups);
		if (!end) {
			return {};
		}

		groups[*token.groupIndex] = GroupSpan{pos, *end, true};
		return end;
	}

	if (pos >= ctx.Text.size() || !byte_matches(token.atom, ctx.Text[pos])) {
		return {};
	}

	return pos + 1;
}

/*----------------------------------------------------------------------*
 * match_repeat
 *
 * Consumes exactly 'count' repetitions of a token starting at 'pos'.
 * The first 'known' repetitions were already verified by the forward
 * scan; any beyond that must each match individually.
 *----------------------------------------------------------------------*/
std::optional<size_t> match_repeat(ExecuteContext &ctx, const Token &token, size_t count, size_t known, size_t pos, GroupSpans &groups) {

	const size_t verified = std::min(count, known);
	size_t cursor         = pos + verified;

	for (size_t i = verified; i < count; ++i) {
		const std::optional<size_t> next = match_once(ctx, token, cursor, groups);
		if (!next) {
			return {};
		}

		cursor = *next;
	}

	return cursor;
}

/*----------------------------------------------------------------------*
 * match_from - main matching routine
 *
 * Tries to match tokens[index...] at 'pos'. Each token tries its repeat
 * counts from the highest possible down to its minimum, and for each
 * count the rest of the token list is matched recursively. The first
 * (largest) count for which the remainder also succeeds wins.
 *
 * Every count is attempted on a private copy of 'groups' so a failed
 * alternative can not leave spans behind; the caller's spans are only
 * updated on success. Returns the end offset of the match, or nothing.
 *----------------------------------------------------------------------*/
std::optional<size_t> match_from(ExecuteContext &ctx, const std::vector<Token> &tokens, size_t index, size_t pos, GroupSpans &groups) {

	RecursionGuard guard(ctx);

	if (index >= tokens.size()) {
		return pos;
	}

	const Token &token = tokens[index];
	const Quantifier &quant = token.quant;

	size_t known     = 0;
	size_t max_count = 1;

	if (asGroup(token.atom)) {
		if (quant.min != 1 || quant.max != std::optional<size_t>(1)) {
			Raise<UnsupportedPattern>("quantifiers on group %zu are not supported", token.groupIndex.value_or(0));
		}
	} else {
		known     = max_repeat_single(ctx, token.atom, pos, quant.max);
		max_count = std::max(known, quant.min);
	}

	for (size_t count = max_count;; --count) {
		GroupSpans attempt = groups;

		if (const std::optional<size_t> next = match_repeat(ctx, token, count, known, pos, attempt)) {
			if (const std::optional<size_t> end = match_from(ctx, tokens, index + 1, *next, attempt)) {
				groups = std::move(attempt);
				return end;
			}
		}

		if (count == quant.min) {
			break;
		}
	}

	return {};
}

}

/**
 * @brief Runs a pattern against a subject.
 *
 * @param pattern The parsed pattern.
 * @param text The subject. All offsets are relative to its start.
 * @param search If `false`, only position 0 is tried, otherwise every
 * position up to the end of `text` inclusive.
 * @return The group spans of the first match found, or nothing.
 *
 * @throws UnsupportedPattern if a quantified group is reached.
 * @throws RegexError if the recursion limit is exceeded.
 */
std::optional<GroupSpans> execMatch(const Pattern &pattern, std::string_view text, bool search) {

	ExecuteContext ctx;
	ctx.Text = text;

	const size_t last = search ? text.size() : 0;

	for (size_t pos = 0; pos <= last; ++pos) {

		// '^' only ever matches at the start of 'text'.
		if (pattern.anchorStart && pos != 0) {
			break;
		}

		GroupSpans groups(pattern.groupCount + 1);

		const std::optional<size_t> end = match_from(ctx, pattern.tokens, 0, pos, groups);
		if (!end) {
			continue;
		}

		// '$' is checked against the greedy result only; a candidate that
		// stops short of the end is rejected outright.
		if (pattern.anchorEnd && *end != text.size()) {
			continue;
		}

		groups[0] = GroupSpan{pos, *end, true};
		return groups;
	}

	return {};
}

}
