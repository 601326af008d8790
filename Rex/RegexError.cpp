
#include "RegexError.h"

#include <QtDebug>
#include <QtGlobal>

#include <cstdarg>
#include <cstdio>

namespace Rex {
namespace {

/**
 * @brief Formats a printf style message into a string.
 *
 * @param fmt Format string for the message.
 * @param ap The arguments for the format string.
 * @return The formatted message.
 */
std::string formatMessage(const char *fmt, va_list ap) {
	char buf[1024];
	QT_WARNING_PUSH
	QT_WARNING_DISABLE_GCC("-Wformat-security")
	QT_WARNING_DISABLE_GCC("-Wformat-nonliteral")
	QT_WARNING_DISABLE_CLANG("-Wformat-security")
	QT_WARNING_DISABLE_CLANG("-Wformat-nonliteral")
	vsnprintf(buf, sizeof(buf), fmt, ap);
	QT_WARNING_POP
	// NOTE: every format string that reaches here is a string constant
	// in the engine itself, never user input.
	return buf;
}

}

/**
 * @brief RegexError constructor.
 *
 * @param fmt Format string for the error message.
 * @param ... Variable arguments for the format string.
 */
RegexError::RegexError(const char *fmt, ...) {
	va_list ap;
	va_start(ap, fmt);
	error_ = formatMessage(fmt, ap);
	va_end(ap);
}

/**
 * @brief Returns the error message.
 *
 * @return The error message string.
 */
const char *RegexError::what() const noexcept {
	return error_.c_str();
}

InvalidPattern::InvalidPattern(const char *fmt, ...) {
	va_list ap;
	va_start(ap, fmt);
	error_ = formatMessage(fmt, ap);
	va_end(ap);
}

UnsupportedPattern::UnsupportedPattern(const char *fmt, ...) {
	va_list ap;
	va_start(ap, fmt);
	error_ = formatMessage(fmt, ap);
	va_end(ap);
}

/**
 * @brief Logs an internal error message for regular expressions.
 *
 * @param str The error message string.
 */
void ReportError(const char *str) {
	qCritical("Rex: Internal error processing regular expression (%s)", str);
}

}
