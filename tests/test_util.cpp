/**
 * @file test_util.cpp
 * @brief Tests for utility functions
 */

#include <gtest/gtest.h>
#include "patcher/Util.hpp"

using namespace patcher;

TEST(CaseMapping, Keywords) {
    EXPECT_EQ(to_lower("NULL"), "null");
    EXPECT_EQ(to_upper("ignore_case"), "IGNORE_CASE");
}

// "\xC3\x89lan" is "Élan", "\xC3\xA9lan" is "élan"
TEST(FoldCase, NonAsciiLetters) {
    EXPECT_EQ(fold_case("\xC3\x89lan"), "\xC3\xA9lan");
    EXPECT_EQ(fold_case("FirstName"), "firstname");
    // Greek capital and final sigma fold to the same letter
    EXPECT_EQ(fold_case("\xCE\xA3"), fold_case("\xCF\x82"));
}

TEST(FoldCase, SimpleFoldingOnly) {
    // Sharp s has no single code point fold, so it never matches "ss"
    EXPECT_EQ(fold_case("stra\xC3\x9F" "e"), "stra\xC3\x9F" "e");
    EXPECT_NE(fold_case("STRASSE"), fold_case("stra\xC3\x9F" "e"));
}

TEST(FoldCase, IllFormedBytesKept) {
    EXPECT_EQ(fold_case("\xFF" "A"), "\xFF" "a");
    EXPECT_EQ(fold_case("\xC3"), "\xC3");
}

TEST(NamesEqual, NonAsciiCaseVariant) {
    EXPECT_TRUE(names_equal("\xC3\x89lan", "\xC3\xA9lan", true));
    EXPECT_FALSE(names_equal("\xC3\x89lan", "\xC3\xA9lan", false));
    EXPECT_EQ(name_key("\xC3\x89lan", true), name_key("\xC3\xA9lan", true));
}

TEST(NamesEqual, CasePolicy) {
    EXPECT_TRUE(names_equal("FirstName", "firstname", true));
    EXPECT_FALSE(names_equal("FirstName", "firstname", false));
    EXPECT_TRUE(names_equal("FirstName", "FirstName", false));
    EXPECT_FALSE(names_equal("First", "FirstName", true));
    EXPECT_TRUE(names_equal("", "", true));
}

TEST(NameKey, CasePolicy) {
    EXPECT_EQ(name_key("Badge", true), "badge");
    EXPECT_EQ(name_key("Badge", false), "Badge");
}

TEST(Trim, Whitespace) {
    EXPECT_EQ(trim("  name \t\n"), "name");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim("a b"), "a b");
}

TEST(Join, CommaSpace) {
    EXPECT_EQ(join({"Foo", "Bar"}), "Foo, Bar");
    EXPECT_EQ(join({"Only"}), "Only");
    EXPECT_EQ(join({}), "");
}

TEST(SplitAssignment, NameAndValue) {
    std::pair<std::string, std::string> kv;

    ASSERT_TRUE(split_assignment(" dependents = 4", kv));
    EXPECT_EQ(kv.first, "dependents");
    EXPECT_EQ(kv.second, " 4");

    ASSERT_TRUE(split_assignment("expr=a=b", kv));
    EXPECT_EQ(kv.first, "expr");
    EXPECT_EQ(kv.second, "a=b");

    ASSERT_TRUE(split_assignment("empty=", kv));
    EXPECT_EQ(kv.second, "");
}

TEST(SplitAssignment, Invalid) {
    std::pair<std::string, std::string> kv;

    EXPECT_FALSE(split_assignment("no_equals", kv));
    EXPECT_FALSE(split_assignment(" =value", kv));
}
