
#include "CharClass.h"

#include <initializer_list>
#include <utility>

namespace Rex {
namespace {

CharClass makeClass(std::initializer_list<std::pair<uint8_t, uint8_t>> ranges) {
	CharClass cls;
	for (const auto &range : ranges) {
		cls.addRange(range.first, range.second);
	}
	return cls;
}

}

/**
 * @brief Adds every byte in the inclusive range [first, last] to the class.
 * An inverted range adds nothing.
 *
 * @param first The lowest byte of the range.
 * @param last The highest byte of the range.
 */
void CharClass::addRange(uint8_t first, uint8_t last) noexcept {
	for (unsigned int ch = first; ch <= last; ++ch) {
		table[ch] = true;
	}
}

/**
 * @brief Unions the members of `other` into this class. The negation
 * flag of `other` is ignored; the shorthand classes are never negated.
 *
 * @param other The class to merge in.
 */
void CharClass::addClass(const CharClass &other) noexcept {
	table |= other.table;
}

// \d
const CharClass &digitClass() {
	static const CharClass cls = makeClass({{'0', '9'}});
	return cls;
}

// \w
const CharClass &wordClass() {
	static const CharClass cls = makeClass({{'0', '9'}, {'A', 'Z'}, {'a', 'z'}, {'_', '_'}});
	return cls;
}

// \s
const CharClass &spaceClass() {
	static const CharClass cls = makeClass({{' ', ' '}, {'\t', '\r'}});
	return cls;
}

}
