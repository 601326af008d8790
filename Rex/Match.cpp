
#include "Match.h"
#include "Substitute.h"
#include "Util/Raise.h"

#include <gsl/gsl>

#include <stdexcept>

namespace Rex {

/**
 * @brief Match constructor.
 *
 * @param subject The string that was searched.
 * @param spans The spans found, whole match first.
 */
Match::Match(std::string subject, GroupSpans spans)
	: subject_(std::move(subject)), spans_(std::move(spans)) {
}

/**
 * @brief Returns the span of a group after checking the index.
 *
 * @param index The group index, 0 for the whole match.
 * @return The span.
 *
 * @throws std::out_of_range if there is no such group.
 */
const GroupSpan &Match::spanAt(size_t index) const {
	if (index >= spans_.size()) {
		Raise<std::out_of_range>("no such group");
	}

	return spans_[index];
}

/**
 * @brief Returns the text matched by a group.
 *
 * @param index The group index, 0 for the whole match.
 * @return The matched text, or nothing if the group did not participate.
 */
std::optional<std::string> Match::group(size_t index) const {
	const GroupSpan &span = spanAt(index);
	if (!span.matched) {
		return {};
	}

	return subject_.substr(span.start, span.end - span.start);
}

/**
 * @brief Returns the text of every capture group, starting with group 1.
 */
std::vector<std::optional<std::string>> Match::groups() const {
	std::vector<std::optional<std::string>> result;
	result.reserve(groupCount());

	for (size_t i = 1; i < spans_.size(); ++i) {
		result.push_back(group(i));
	}

	return result;
}

/**
 * @brief Returns the start and end offsets of a group, or (-1, -1) if the
 * group did not participate.
 *
 * @param index The group index, 0 for the whole match.
 */
std::pair<std::ptrdiff_t, std::ptrdiff_t> Match::span(size_t index) const {
	const GroupSpan &span = spanAt(index);
	if (!span.matched) {
		return {-1, -1};
	}

	return {gsl::narrow<std::ptrdiff_t>(span.start), gsl::narrow<std::ptrdiff_t>(span.end)};
}

std::ptrdiff_t Match::start(size_t index) const {
	return span(index).first;
}

std::ptrdiff_t Match::end(size_t index) const {
	return span(index).second;
}

/**
 * @brief Expands a replacement template against this match, as 'sub' does.
 *
 * @param repl The template; \0 through \9 refer to groups.
 * @return The expanded text.
 */
std::string Match::expand(std::string_view repl) const {
	return expandTemplate(repl, subject_, spans_);
}

}
