
#ifndef REX_EXECUTE_H_
#define REX_EXECUTE_H_

#include "Pattern.h"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace Rex {

struct GroupSpan {
	size_t start = 0;
	size_t end   = 0;
	bool matched = false; // false if the group did not take part in the match
};

// Index 0 is the whole match, index N is capture group N.
using GroupSpans = std::vector<GroupSpan>;

std::optional<GroupSpans> execMatch(const Pattern &pattern, std::string_view text, bool search);

}

#endif
