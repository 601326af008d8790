
#ifndef REX_CHAR_CLASS_H_
#define REX_CHAR_CLASS_H_

#include "Constants.h"

#include <bitset>
#include <cstdint>

namespace Rex {

/* A set of bytes. Negation is applied when testing membership, never by
 * flipping the table, so the shorthand classes can be shared constants. */
struct CharClass {
	std::bitset<ByteRange> table;
	bool negated = false;

	bool matches(uint8_t ch) const noexcept {
		return table[ch] != negated;
	}

	void addRange(uint8_t first, uint8_t last) noexcept;
	void addClass(const CharClass &other) noexcept;
};

const CharClass &digitClass();
const CharClass &wordClass();
const CharClass &spaceClass();

}

#endif
