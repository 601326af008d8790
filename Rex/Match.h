
#ifndef REX_MATCH_H_
#define REX_MATCH_H_

#include "Execute.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Rex {

/* The result of a successful match or search. Holds its own copy of the
 * subject, so it stays valid after the searched string goes away. */
class Match {
public:
	Match(std::string subject, GroupSpans spans);
	Match(const Match &)            = default;
	Match(Match &&)                 = default;
	Match &operator=(const Match &) = default;
	Match &operator=(Match &&)      = default;
	~Match()                        = default;

public:
	std::optional<std::string> group(size_t index = 0) const;
	std::vector<std::optional<std::string>> groups() const;
	std::pair<std::ptrdiff_t, std::ptrdiff_t> span(size_t index = 0) const;
	std::ptrdiff_t start(size_t index = 0) const;
	std::ptrdiff_t end(size_t index = 0) const;
	std::string expand(std::string_view repl) const;

public:
	const std::string &string() const noexcept { return subject_; }
	size_t groupCount() const noexcept { return spans_.size() - 1; }

private:
	const GroupSpan &spanAt(size_t index) const;

private:
	std::string subject_;
	GroupSpans spans_;
};

}

#endif
