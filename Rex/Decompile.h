
#ifndef REX_DECOMPILE_H_
#define REX_DECOMPILE_H_

#include "Pattern.h"

#include <boost/variant.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Rex {

enum class Anchor {
	Start,
	End
};

struct AnchorInstruction {
	Anchor anchor;
};

struct LiteralInstruction {
	size_t depth;
	Quantifier quant;
	uint8_t ch;
};

struct AnyInstruction {
	size_t depth;
	Quantifier quant;
};

struct ClassInstruction {
	size_t depth;
	Quantifier quant;
	std::string set; // members in ascending order
	bool negated;
};

struct OpenInstruction {
	size_t depth;
	Quantifier quant;
	size_t index;
};

struct CloseInstruction {
	size_t depth;
	size_t index;
};

using Instruction = boost::variant<AnchorInstruction, LiteralInstruction, AnyInstruction, ClassInstruction, OpenInstruction, CloseInstruction>;

std::vector<Instruction> decompilePattern(const Pattern &pattern);
std::string describePattern(const Pattern &pattern);
void dumpPattern(const Pattern &pattern);

}

#endif
