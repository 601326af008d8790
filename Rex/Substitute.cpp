
#include "Substitute.h"
#include "Reader.h"
#include "Util/utils.h"

#include <algorithm>
#include <iterator>

namespace Rex {

/**
 * @brief Expands a replacement template for one match.
 *
 * A backslash followed by a digit N is replaced by the text of group N,
 * or by nothing if that group does not exist or did not take part in
 * the match. Every other character, including any other backslash, is
 * copied as is.
 *
 * @param repl The replacement template.
 * @param text The subject the group spans refer to.
 * @param groups The spans of the match.
 * @return The expanded replacement.
 */
std::string expandTemplate(std::string_view repl, std::string_view text, const GroupSpans &groups) {

	std::string dest;
	dest.reserve(repl.size());

	auto out = std::back_inserter(dest);
	Reader in(repl);

	while (!in.eof()) {
		const char ch = in.read();

		if (ch == '\\') {
			if (const char digit = in.match_if([](char c) { return safe_isdigit(c) != 0; })) {
				const size_t paren_no = digit_value(digit);

				if (paren_no < groups.size() && groups[paren_no].matched) {
					const GroupSpan &span = groups[paren_no];
					std::copy(text.begin() + span.start, text.begin() + span.end, out);
				}

				continue;
			}
		}

		*out++ = ch;
	}

	return dest;
}

}
