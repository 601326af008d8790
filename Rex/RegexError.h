
#ifndef REX_REGEX_ERROR_H_
#define REX_REGEX_ERROR_H_

#include "Util/Compiler.h"

#include <exception>
#include <string>

namespace Rex {

class RegexError : public std::exception {
public:
	explicit RegexError(const char *fmt, ...);

public:
	const char *what() const noexcept override;

protected:
	RegexError() = default;

protected:
	std::string error_;
};

// The pattern is syntactically malformed.
class InvalidPattern final : public RegexError {
public:
	explicit InvalidPattern(const char *fmt, ...);
};

// The pattern is well formed but uses a construct the engine does not support.
class UnsupportedPattern final : public RegexError {
public:
	explicit UnsupportedPattern(const char *fmt, ...);
};

COLD_CODE
void ReportError(const char *str);

}

#endif
