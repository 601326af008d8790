
#include "Regex.h"
#include "Compile.h"
#include "Execute.h"
#include "Substitute.h"

#include <algorithm>

namespace Rex {
namespace {

/**
 * @brief Returns the text of a span, or an empty string if the group did
 * not participate.
 */
std::string span_text(std::string_view text, const GroupSpan &span) {
	if (!span.matched) {
		return std::string();
	}

	return std::string(text.substr(span.start, span.end - span.start));
}

/*----------------------------------------------------------------------*
 * for_each_match
 *
 * Finds successive matches in 'text', left to right, calling 'func'
 * with the spans of each one, for at most 'limit' matches. Each match is
 * searched for in the suffix of 'text' that remains, so anchors apply to
 * the start and end of that suffix. After a match the scan resumes at
 * its end, or one past its start if it was empty, so the scan always
 * moves forward. The spans passed to 'func' are relative to the start
 * of 'text'. Returns the number of matches found.
 *----------------------------------------------------------------------*/
template <class Func>
size_t for_each_match(const Pattern &pattern, std::string_view text, std::optional<size_t> limit, Func func) {

	size_t pos   = 0;
	size_t found = 0;

	while (pos <= text.size() && (!limit || found < *limit)) {
		std::optional<GroupSpans> groups = execMatch(pattern, text.substr(pos), true);
		if (!groups) {
			break;
		}

		for (GroupSpan &span : *groups) {
			if (span.matched) {
				span.start += pos;
				span.end += pos;
			}
		}

		func(*groups);
		++found;

		const GroupSpan &whole = (*groups)[0];
		pos                    = std::max(whole.end, whole.start + 1);
	}

	return found;
}

}

/**
 * @brief Matches a pattern at the start of a string.
 *
 * @param pattern The pattern.
 * @param text The string to match against.
 * @return The match, or nothing if the pattern does not match at offset 0.
 *
 * @throws InvalidPattern, UnsupportedPattern
 */
std::optional<Match> match(std::string_view pattern, std::string_view text) {
	const Pattern compiled = compilePattern(pattern);

	std::optional<GroupSpans> groups = execMatch(compiled, text, false);
	if (!groups) {
		return {};
	}

	return Match(std::string(text), std::move(*groups));
}

/**
 * @brief Finds the first position where a pattern matches.
 *
 * @param pattern The pattern.
 * @param text The string to search.
 * @return The leftmost match, or nothing.
 *
 * @throws InvalidPattern, UnsupportedPattern
 */
std::optional<Match> search(std::string_view pattern, std::string_view text) {
	const Pattern compiled = compilePattern(pattern);

	std::optional<GroupSpans> groups = execMatch(compiled, text, true);
	if (!groups) {
		return {};
	}

	return Match(std::string(text), std::move(*groups));
}

/**
 * @brief Finds every non-overlapping match of a pattern.
 *
 * Groups that did not participate in a hit contribute empty strings.
 *
 * @param pattern The pattern.
 * @param text The string to search.
 * @return One entry per match, shaped by the number of groups.
 */
std::vector<FindResult> findall(std::string_view pattern, std::string_view text) {
	const Pattern compiled = compilePattern(pattern);

	std::vector<FindResult> results;

	for_each_match(compiled, text, std::nullopt, [&](const GroupSpans &groups) {
		switch (compiled.groupCount) {
		case 0:
			results.emplace_back(span_text(text, groups[0]));
			break;
		case 1:
			results.emplace_back(span_text(text, groups[1]));
			break;
		default: {
			std::vector<std::string> tuple;
			tuple.reserve(compiled.groupCount);
			for (size_t i = 1; i < groups.size(); ++i) {
				tuple.push_back(span_text(text, groups[i]));
			}
			results.emplace_back(std::move(tuple));
			break;
		}
		}
	});

	return results;
}

/**
 * @brief Replaces matches of a pattern and counts the replacements.
 *
 * @param pattern The pattern.
 * @param repl The replacement template, see 'expandTemplate'.
 * @param text The string to operate on.
 * @param count The largest number of matches to replace; all if empty.
 * @return The new string and the number of replacements made.
 */
std::pair<std::string, size_t> subn(std::string_view pattern, std::string_view repl, std::string_view text, std::optional<size_t> count) {
	const Pattern compiled = compilePattern(pattern);

	std::string dest;
	size_t last = 0;

	const size_t replaced = for_each_match(compiled, text, count, [&](const GroupSpans &groups) {
		const GroupSpan &whole = groups[0];
		dest.append(text.substr(last, whole.start - last));
		dest.append(expandTemplate(repl, text, groups));
		last = whole.end;
	});

	dest.append(text.substr(last));
	return {std::move(dest), replaced};
}

/**
 * @brief Replaces matches of a pattern.
 *
 * @param pattern The pattern.
 * @param repl The replacement template, see 'expandTemplate'.
 * @param text The string to operate on.
 * @param count The largest number of matches to replace; all if empty.
 * @return The new string.
 */
std::string sub(std::string_view pattern, std::string_view repl, std::string_view text, std::optional<size_t> count) {
	return subn(pattern, repl, text, count).first;
}

/**
 * @brief Splits a string at the matches of a pattern.
 *
 * @param pattern The pattern.
 * @param text The string to split.
 * @param maxsplit The largest number of splits to make; all if empty.
 * @return The pieces between the matches, followed by the remaining tail.
 * There is always one more piece than there were splits.
 */
std::vector<std::string> split(std::string_view pattern, std::string_view text, std::optional<size_t> maxsplit) {
	const Pattern compiled = compilePattern(pattern);

	std::vector<std::string> pieces;
	size_t last = 0;

	for_each_match(compiled, text, maxsplit, [&](const GroupSpans &groups) {
		const GroupSpan &whole = groups[0];
		pieces.emplace_back(text.substr(last, whole.start - last));
		last = whole.end;
	});

	pieces.emplace_back(text.substr(last));
	return pieces;
}

/**
 * @brief Regex constructor. The pattern is parsed once here so errors are
 * reported immediately.
 *
 * @param pattern The pattern text.
 *
 * @throws InvalidPattern, UnsupportedPattern
 */
Regex::Regex(std::string_view pattern)
	: pattern_(pattern) {
	(void)compilePattern(pattern_);
}

std::optional<Match> Regex::match(std::string_view text) const {
	return Rex::match(pattern_, text);
}

std::optional<Match> Regex::search(std::string_view text) const {
	return Rex::search(pattern_, text);
}

std::vector<FindResult> Regex::findall(std::string_view text) const {
	return Rex::findall(pattern_, text);
}

std::string Regex::sub(std::string_view repl, std::string_view text, std::optional<size_t> count) const {
	return Rex::sub(pattern_, repl, text, count);
}

std::pair<std::string, size_t> Regex::subn(std::string_view repl, std::string_view text, std::optional<size_t> count) const {
	return Rex::subn(pattern_, repl, text, count);
}

std::vector<std::string> Regex::split(std::string_view text, std::optional<size_t> maxsplit) const {
	return Rex::split(pattern_, text, maxsplit);
}

/**
 * @brief Returns the number of capture groups in the pattern.
 */
size_t Regex::groups() const {
	return compilePattern(pattern_).groupCount;
}

/**
 * @brief Validates a pattern and wraps it in a Regex.
 *
 * @param pattern The pattern text.
 * @return The Regex.
 *
 * @throws InvalidPattern, UnsupportedPattern
 */
Regex compile(std::string_view pattern) {
	return Regex(pattern);
}

}
