
#ifndef REX_READER_H_
#define REX_READER_H_

#include <cstddef>
#include <string_view>

namespace Rex {

/**
 * @brief A forward cursor over a string, used for lexing patterns and
 * replacement templates.
 *
 * @note The string must remain valid for the lifetime of the reader.
 */
template <class Ch>
class BasicReader {
public:
	explicit BasicReader(std::basic_string_view<Ch> input) noexcept
		: input_(input) {
	}

	BasicReader()                                  = default;
	BasicReader(const BasicReader &other)          = default;
	BasicReader &operator=(const BasicReader &rhs) = default;
	~BasicReader()                                 = default;

public:
	/**
	 * @brief Determines if the reader has reached the end of the input string.
	 *
	 * @return `true` if the end of the input string has been reached, `false` otherwise.
	 */
	bool eof() const noexcept {
		return index_ == input_.size();
	}

	/**
	 * @brief Returns the next character in the string without advancing the position.
	 *
	 * @return The next character in the string, or '\0' if at the end of the string.
	 */
	Ch peek() const noexcept {
		if (eof()) {
			return '\0';
		}

		return input_[index_];
	}

	/**
	 * @brief Determines if the next character in the string matches `ch`.
	 * Always `false` at the end of the input, even for '\0'.
	 *
	 * @return `true` if the next character matches `ch`, `false` otherwise.
	 */
	bool next_is(Ch ch) const noexcept {
		return !eof() && input_[index_] == ch;
	}

	/**
	 * @brief Reads the next character in the string and advances the position.
	 *
	 * @return The next character in the string, or '\0' if at the end of the string.
	 */
	Ch read() noexcept {
		if (eof()) {
			return '\0';
		}

		return input_[index_++];
	}

	/**
	 * @brief If `ch` matches the character at the current position, consume it.
	 *
	 * @param ch The character to match.
	 * @return `true` if the next character matched `ch`, `false` otherwise.
	 */
	bool match(Ch ch) noexcept {
		if (!next_is(ch)) {
			return false;
		}

		++index_;
		return true;
	}

	/**
	 * @brief Matches a single character if it satisfies the given predicate.
	 *
	 * @param pred A predicate function that takes a character.
	 * @return The matched character, or '\0' if it does not match.
	 */
	template <class Pred>
	Ch match_if(Pred pred) {
		if (eof()) {
			return '\0';
		}

		const Ch ch = input_[index_];
		if (pred(ch)) {
			++index_;
			return ch;
		}

		return '\0';
	}

	/**
	 * @brief Consumes while a given predicate returns `true`.
	 *
	 * @param pred A predicate function that takes a character.
	 * @return The consumed characters, possibly empty.
	 */
	template <class Pred>
	std::basic_string_view<Ch> match_while(Pred pred) {
		const size_t start = index_;
		while (!eof() && pred(input_[index_])) {
			++index_;
		}

		return input_.substr(start, index_ - start);
	}

	/**
	 * @brief Get the current position in the string
	 *
	 * @return The current index in the string.
	 */
	size_t index() const noexcept {
		return index_;
	}

private:
	std::basic_string_view<Ch> input_;
	size_t index_ = 0;
};

using Reader = BasicReader<char>;

}

#endif
