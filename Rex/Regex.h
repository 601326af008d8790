
#ifndef REX_REGEX_H_
#define REX_REGEX_H_

#include "Match.h"
#include "RegexError.h"

#include <boost/variant.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Rex {

/* One 'findall' hit: the matched text when the pattern has no groups, the
 * text of group 1 when it has one, and the text of every group otherwise. */
using FindResult = boost::variant<std::string, std::vector<std::string>>;

std::optional<Match> match(std::string_view pattern, std::string_view text);
std::optional<Match> search(std::string_view pattern, std::string_view text);
std::vector<FindResult> findall(std::string_view pattern, std::string_view text);
std::string sub(std::string_view pattern, std::string_view repl, std::string_view text, std::optional<size_t> count = {});
std::pair<std::string, size_t> subn(std::string_view pattern, std::string_view repl, std::string_view text, std::optional<size_t> count = {});
std::vector<std::string> split(std::string_view pattern, std::string_view text, std::optional<size_t> maxsplit = {});

/* A validated pattern. Only the pattern text is kept; every operation
 * parses it again. */
class Regex {
public:
	explicit Regex(std::string_view pattern);
	Regex(const Regex &)            = default;
	Regex(Regex &&)                 = default;
	Regex &operator=(const Regex &) = default;
	Regex &operator=(Regex &&)      = default;
	~Regex()                        = default;

public:
	std::optional<Match> match(std::string_view text) const;
	std::optional<Match> search(std::string_view text) const;
	std::vector<FindResult> findall(std::string_view text) const;
	std::string sub(std::string_view repl, std::string_view text, std::optional<size_t> count = {}) const;
	std::pair<std::string, size_t> subn(std::string_view repl, std::string_view text, std::optional<size_t> count = {}) const;
	std::vector<std::string> split(std::string_view text, std::optional<size_t> maxsplit = {}) const;

public:
	const std::string &pattern() const noexcept { return pattern_; }
	size_t groups() const;

private:
	std::string pattern_;
};

Regex compile(std::string_view pattern);

}

#endif
