
#ifndef REX_PATTERN_H_
#define REX_PATTERN_H_

#include "CharClass.h"

#include <boost/variant.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace Rex {

struct Group;

struct Literal {
	uint8_t ch;
};

struct AnyByte {};

using Atom = boost::variant<Literal, AnyByte, CharClass, boost::recursive_wrapper<Group>>;

struct Quantifier {
	size_t min                = 1;
	std::optional<size_t> max = 1; // empty means unbounded
};

struct Token {
	Atom atom;
	Quantifier quant;
	std::optional<size_t> groupIndex; // 1-based, only set for groups
};

/* A parenthesized sub-pattern. The contents are parsed once and never
 * modified, so the token tree has no cycles. */
struct Group {
	std::vector<Token> tokens;
};

/**
 * @brief Returns the group held by an atom.
 *
 * @param atom The atom to inspect.
 * @return The group, or nullptr if the atom is a single byte matcher.
 */
inline const Group *asGroup(const Atom &atom) {

	struct Visitor : boost::static_visitor<const Group *> {
		const Group *operator()(const Group &group) const { return &group; }
		const Group *operator()(const Literal &) const { return nullptr; }
		const Group *operator()(const AnyByte &) const { return nullptr; }
		const Group *operator()(const CharClass &) const { return nullptr; }
	};

	return boost::apply_visitor(Visitor(), atom);
}

struct Pattern {
	std::vector<Token> tokens;
	bool anchorStart  = false;
	bool anchorEnd    = false;
	size_t groupCount = 0;
};

}

#endif
