
#ifndef UTIL_UTILS_H_
#define UTIL_UTILS_H_

#include <cctype>
#include <type_traits>

template <class Integer>
using IsInteger = std::enable_if_t<std::is_integral<Integer>::value>;

template <class Ch, class = IsInteger<Ch>>
int safe_isdigit(Ch ch) noexcept {
	return std::isdigit(static_cast<unsigned char>(ch));
}

template <class Ch, class = IsInteger<Ch>>
int safe_isprint(Ch ch) noexcept {
	return std::isprint(static_cast<unsigned char>(ch));
}

/**
 * @brief Converts a decimal digit character to its value.
 *
 * @param ch A character for which `safe_isdigit` is true.
 * @return The value of the digit, 0 through 9.
 */
template <class Ch, class = IsInteger<Ch>>
constexpr unsigned int digit_value(Ch ch) noexcept {
	return static_cast<unsigned int>(static_cast<unsigned char>(ch) - '0');
}

#endif
