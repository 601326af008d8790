
#ifndef REX_CONSTANTS_H_
#define REX_CONSTANTS_H_

#include <cstddef>

namespace Rex {

/*
 * The matcher recurses once per token it visits and once more per nested
 * group, so its depth is bounded by the size of the pattern rather than the
 * size of the subject. Linux default stacks survive well past 40 000 frames
 * of this size, so 10 000 ought to be safe.
 */
constexpr int RecursionLimit = 10000;

// Largest count accepted by the {n} quantifier.
constexpr size_t MaxRepeatCount = 65535;

// Number of bytes a CharClass table covers.
constexpr size_t ByteRange = 256;

}

#endif
