#include <gtest/gtest.h>

#include "completion_utils.h"
#include "tabsh.h"
#include "test_support.h"

using namespace completion_utils;

class CompletionUtilsTest : public test_support::ConfigResetTest {};

TEST_F(CompletionUtilsTest, QuotesOnlyWhenNeeded) {
    EXPECT_EQ(quote_path_if_needed("plain.txt"), "plain.txt");
    EXPECT_EQ(quote_path_if_needed("my file.txt"), "\"my file.txt\"");
    EXPECT_EQ(quote_path_if_needed("cost$"), "\"cost\\$\"");
    EXPECT_EQ(quote_path_if_needed(""), "");
}

TEST_F(CompletionUtilsTest, UnquoteHandlesBothQuoteStylesAndEscapes) {
    EXPECT_EQ(unquote_path("\"my file\""), "my file");
    EXPECT_EQ(unquote_path("'it''s'"), "its");
    EXPECT_EQ(unquote_path("my\\ file"), "my file");
    EXPECT_EQ(unquote_path("\"half"), "half");
    EXPECT_EQ(unquote_path(quote_path_if_needed("a \"b\" $c")), "a \"b\" $c");
}

TEST_F(CompletionUtilsTest, PrefixMatchIgnoresCaseByDefault) {
    EXPECT_TRUE(matches_completion_prefix("Makefile", "make"));
    EXPECT_TRUE(matches_completion_prefix("anything", ""));
    EXPECT_FALSE(matches_completion_prefix("make", "makefile"));

    config::case_sensitive = true;
    EXPECT_FALSE(matches_completion_prefix("Makefile", "make"));
    EXPECT_TRUE(matches_completion_prefix("Makefile", "Make"));
}

TEST_F(CompletionUtilsTest, EqualsCompletionToken) {
    EXPECT_TRUE(equals_completion_token("README", "readme"));
    EXPECT_FALSE(equals_completion_token("README", "read"));
    config::case_sensitive = true;
    EXPECT_FALSE(equals_completion_token("README", "readme"));
}

TEST_F(CompletionUtilsTest, QueryWidensToSubsequenceOnlyWhenFuzzy) {
    EXPECT_TRUE(is_subsequence("checkout", "cko"));
    EXPECT_FALSE(is_subsequence("checkout", "okc"));

    EXPECT_FALSE(matches_completion_query("checkout", "cko"));
    config::fuzzy_matching = true;
    EXPECT_TRUE(matches_completion_query("checkout", "cko"));
    EXPECT_TRUE(matches_completion_query("checkout", "ch"));
    EXPECT_FALSE(matches_completion_query("commit", "cko"));
}

TEST_F(CompletionUtilsTest, BaseName) {
    EXPECT_EQ(base_name("src/lib/"), "lib");
    EXPECT_EQ(base_name("/usr/bin/ls"), "ls");
    EXPECT_EQ(base_name("ls"), "ls");
    EXPECT_EQ(base_name("/"), "/");
}
