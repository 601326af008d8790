
#include "Compile.h"
#include "Decompile.h"

#include <gtest/gtest.h>

#include <boost/variant/get.hpp>

using namespace Rex;

namespace {

std::string describe(std::string_view pattern) {
	return describePattern(compilePattern(pattern));
}

}

TEST(Decompile, Literals) {
	EXPECT_EQ(describe("ab"), "EXACTLY 'a'\nEXACTLY 'b'\n");
	EXPECT_EQ(describe(""), "");
}

TEST(Decompile, AnchorsAndQuantifiers) {
	EXPECT_EQ(describe("^a*.?x{3}$"),
			  "BOL\n"
			  "EXACTLY 'a' {0,inf}\n"
			  "ANY {0,1}\n"
			  "EXACTLY 'x' {3,3}\n"
			  "EOL\n");
}

TEST(Decompile, NestedGroups) {
	EXPECT_EQ(describe("a(b(\\d)+)*"),
			  "EXACTLY 'a'\n"
			  "OPEN 1 {0,inf}\n"
			  "  EXACTLY 'b'\n"
			  "  OPEN 2 {1,inf}\n"
			  "    ANY_OF [0-9]\n"
			  "  CLOSE 2\n"
			  "CLOSE 1\n");
}

TEST(Decompile, ClassSets) {
	EXPECT_EQ(describe("\\w"), "ANY_OF [0-9A-Z_a-z]\n");
	EXPECT_EQ(describe("[abx]"), "ANY_OF [abx]\n");
	EXPECT_EQ(describe("[^-a]"), "ANY_BUT [\\x2da]\n");
	EXPECT_EQ(describe("[]]"), "ANY_OF [\\x5d]\n");
}

TEST(Decompile, UnprintableBytes) {
	EXPECT_EQ(describe("\\\\\t'"), "EXACTLY '\\x5c'\nEXACTLY '\\x09'\nEXACTLY '\\x27'\n");
}

TEST(Decompile, Instructions) {
	const std::vector<Instruction> program = decompilePattern(compilePattern("^(a)$"));
	ASSERT_EQ(program.size(), 5u);

	const AnchorInstruction *bol = boost::get<AnchorInstruction>(&program[0]);
	ASSERT_NE(bol, nullptr);
	EXPECT_EQ(bol->anchor, Anchor::Start);

	const OpenInstruction *open = boost::get<OpenInstruction>(&program[1]);
	ASSERT_NE(open, nullptr);
	EXPECT_EQ(open->index, 1u);
	EXPECT_EQ(open->depth, 0u);

	const LiteralInstruction *literal = boost::get<LiteralInstruction>(&program[2]);
	ASSERT_NE(literal, nullptr);
	EXPECT_EQ(literal->ch, 'a');
	EXPECT_EQ(literal->depth, 1u);

	const CloseInstruction *close = boost::get<CloseInstruction>(&program[3]);
	ASSERT_NE(close, nullptr);
	EXPECT_EQ(close->index, 1u);

	const AnchorInstruction *eol = boost::get<AnchorInstruction>(&program[4]);
	ASSERT_NE(eol, nullptr);
	EXPECT_EQ(eol->anchor, Anchor::End);
}

TEST(Decompile, DumpDoesNotThrow) {
	EXPECT_NO_THROW(dumpPattern(compilePattern("(a)[b-d]+")));
}
