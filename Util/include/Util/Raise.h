
#ifndef UTIL_RAISE_H_
#define UTIL_RAISE_H_

#include "Compiler.h"
#include <utility>

/**
 * @brief Throws an exception of type `E`, constructed from `args`.
 * Keeps the throw site out of the hot path of the caller.
 *
 * @param args The constructor arguments of the exception.
 */
template <class E, class... Args>
[[noreturn]] COLD_CODE void Raise(Args &&...args) {
	throw E(std::forward<Args>(args)...);
}

#endif
