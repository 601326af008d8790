
#include "Regex.h"

#include <gtest/gtest.h>

#include <boost/variant/get.hpp>

using namespace Rex;

namespace {

std::vector<std::string> strings_of(const std::vector<FindResult> &results) {
	std::vector<std::string> out;
	for (const FindResult &result : results) {
		const std::string *s = boost::get<std::string>(&result);
		if (!s) {
			ADD_FAILURE() << "expected a string result";
			continue;
		}
		out.push_back(*s);
	}
	return out;
}

using Strings = std::vector<std::string>;

}

TEST(Regex, MatchIsAnchoredAtStart) {
	const std::optional<Match> m = Rex::match("\\w+", "hello world");
	ASSERT_TRUE(m);
	EXPECT_EQ(m->group(), std::optional<std::string>("hello"));

	EXPECT_FALSE(Rex::match("a+", "baa"));
	EXPECT_TRUE(Rex::match("", "abc"));
}

TEST(Regex, SearchScans) {
	const std::optional<Match> m = search("a+", "baa");
	ASSERT_TRUE(m);
	EXPECT_EQ(m->span(), std::make_pair(std::ptrdiff_t{1}, std::ptrdiff_t{3}));

	EXPECT_FALSE(search("z", "abc"));
}

TEST(Regex, EscapedMetacharacters) {
	const std::optional<Match> m = search("a\\$", "xa$");
	ASSERT_TRUE(m);
	EXPECT_EQ(m->start(), 1);

	EXPECT_TRUE(search("1\\.5", "v1.5"));
	EXPECT_FALSE(search("1\\.5", "v105"));
	EXPECT_TRUE(search("[]]", "a]"));
}

TEST(Regex, FindallWithoutGroups) {
	EXPECT_EQ(strings_of(findall("\\d+", "a1b22c333")), (Strings{"1", "22", "333"}));
	EXPECT_TRUE(findall("\\d", "abc").empty());
}

TEST(Regex, FindallEmptyMatchesAdvance) {
	EXPECT_EQ(strings_of(findall("x*", "ab")), (Strings{"", "", ""}));
	EXPECT_EQ(strings_of(findall("a*", "baa")), (Strings{"", "aa", ""}));
}

TEST(Regex, ScansAnchorToEachRemainingSuffix) {
	EXPECT_EQ(strings_of(findall("^a", "aaa")), (Strings{"a", "a", "a"}));
	EXPECT_EQ(strings_of(findall("^a", "aba")), (Strings{"a"}));
	EXPECT_EQ(sub("^a", "x", "aaa"), "xxx");
	EXPECT_EQ(split("^a", "aaa"), (Strings{"", "", "", ""}));
	EXPECT_EQ(strings_of(findall("a$", "aa")), (Strings{"a"}));
}

TEST(Regex, ScannedSpansAreRelativeToSubject) {
	EXPECT_EQ(sub("(b)", "[\\1]", "abab"), "a[b]a[b]");
	EXPECT_EQ(strings_of(findall("(\\d)x", "1x2x")), (Strings{"1", "2"}));
}

TEST(Regex, FindallWithOneGroup) {
	EXPECT_EQ(strings_of(findall("(\\w)=\\d", "a=1 b=2")), (Strings{"a", "b"}));
}

TEST(Regex, FindallWithGroupsGivesTuples) {
	const std::vector<FindResult> results = findall("(\\w)=(\\d)", "a=1 b=2");
	ASSERT_EQ(results.size(), 2u);

	const Strings *first = boost::get<Strings>(&results[0]);
	const Strings *second = boost::get<Strings>(&results[1]);
	ASSERT_NE(first, nullptr);
	ASSERT_NE(second, nullptr);
	EXPECT_EQ(*first, (Strings{"a", "1"}));
	EXPECT_EQ(*second, (Strings{"b", "2"}));
}

TEST(Regex, Sub) {
	EXPECT_EQ(sub("\\d+", "#", "a1b22c"), "a#b#c");
	EXPECT_EQ(sub("z", "#", "abc"), "abc");
	EXPECT_EQ(sub("(a)(b)", "\\2\\1", "abab"), "baba");
	EXPECT_EQ(sub("b", "[\\0]", "abc"), "a[b]c");
}

TEST(Regex, SubEmptyMatches) {
	EXPECT_EQ(sub("a*", "-", "baac"), "-b--c-");
	EXPECT_EQ(sub("x*", "-", ""), "-");
}

TEST(Regex, SubCount) {
	EXPECT_EQ(sub("a", "x", "aaa", 2), "xxa");
	EXPECT_EQ(sub("a", "x", "aaa", 0), "aaa");
	EXPECT_EQ(sub("a", "x", "aaa", std::nullopt), "xxx");
}

TEST(Regex, Subn) {
	EXPECT_EQ(subn("\\d", "#", "a1b2"), std::make_pair(std::string("a#b#"), size_t{2}));
	EXPECT_EQ(subn("\\d", "#", "a1b2", 1), std::make_pair(std::string("a#b2"), size_t{1}));
	EXPECT_EQ(subn("\\d", "#", "ab"), std::make_pair(std::string("ab"), size_t{0}));
}

TEST(Regex, Split) {
	EXPECT_EQ(split(",", "a,b,,c"), (Strings{"a", "b", "", "c"}));
	EXPECT_EQ(split(",", "abc"), (Strings{"abc"}));
	EXPECT_EQ(split(",", ""), (Strings{""}));
	EXPECT_EQ(split(",", ",a,"), (Strings{"", "a", ""}));
}

TEST(Regex, SplitMaxsplit) {
	EXPECT_EQ(split(",", "a,b,c", 1), (Strings{"a", "b,c"}));
	EXPECT_EQ(split(",", "a,b,c", 0), (Strings{"a,b,c"}));
	EXPECT_EQ(split("\\s+", "one  two\tthree"), (Strings{"one", "two", "three"}));
}

TEST(Regex, SplitEmptyMatches) {
	EXPECT_EQ(split("x*", "ab"), (Strings{"", "a", "b", ""}));
}

TEST(Regex, SplitPiecesRejoin) {
	const std::string text = "k1=v1;;k2=v2;";
	const Strings pieces = split(";", text);

	std::string joined;
	for (size_t i = 0; i < pieces.size(); ++i) {
		if (i != 0) {
			joined += ';';
		}
		joined += pieces[i];
	}

	EXPECT_EQ(joined, text);
}

TEST(Regex, CompiledPattern) {
	const Regex re = compile("(\\d)(\\d)?");
	EXPECT_EQ(re.pattern(), "(\\d)(\\d)?");

	const Regex plain = compile("x");
	EXPECT_EQ(plain.groups(), 0u);
	EXPECT_EQ(compile("(a)(b(c))").groups(), 3u);
}

TEST(Regex, CompiledPatternOperations) {
	const Regex re = compile("(\\w+)=(\\d+)");

	const std::optional<Match> m = re.search("x a=10");
	ASSERT_TRUE(m);
	EXPECT_EQ(m->group(2), std::optional<std::string>("10"));

	EXPECT_FALSE(re.match("x a=10"));
	EXPECT_TRUE(re.match("a=10"));
	EXPECT_EQ(re.findall("a=1 b=2").size(), 2u);
	EXPECT_EQ(re.sub("\\2=\\1", "a=1 b=2"), "1=a 2=b");
	EXPECT_EQ(re.sub("-", "a=1 b=2", 1), "- b=2");
	EXPECT_EQ(re.subn("-", "a=1 b=2").second, 2u);
	EXPECT_EQ(re.split("a=1,b=2"), (Strings{"", ",", ""}));
	EXPECT_EQ(re.split("a=1,b=2", 1), (Strings{"", ",b=2"}));
}

TEST(Regex, CompileErrors) {
	EXPECT_THROW(compile("(abc"), InvalidPattern);
	EXPECT_THROW(compile("a|b"), UnsupportedPattern);
	EXPECT_THROW(search("[a", "a"), InvalidPattern);
	EXPECT_THROW(findall("a|b", "a"), UnsupportedPattern);
}

TEST(Regex, QuantifiedGroupFailsWhenMatched) {
	Regex re = compile("x");
	EXPECT_NO_THROW(re = compile("(a)*"));
	EXPECT_THROW(re.match("a"), UnsupportedPattern);
	EXPECT_THROW(re.search("a"), UnsupportedPattern);
	EXPECT_THROW(sub("(a)+", "", "a"), UnsupportedPattern);
}
