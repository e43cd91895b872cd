#include "text/TextUtil.hpp"

#include <gtest/gtest.h>

using namespace textutil;

TEST(TextUtil, NormalizeKeepsLettersAndDigits) {
    EXPECT_EQ(normalize("Hello, World! 2024--GDP"), "hello world 2024 gdp");
    EXPECT_EQ(normalize("  ...  "), "");
}

TEST(TextUtil, TokenizeDropsSingleCharacters) {
    const auto toks = tokenize(normalize("A cat sat on 1 mat"));
    ASSERT_EQ(toks.size(), 4u);
    EXPECT_EQ(toks[0], "cat");
    EXPECT_EQ(toks[3], "mat");
}

TEST(TextUtil, ContentTokensRemoveStopwords) {
    const auto toks = content_tokens("The minister said that the budget will rise.");
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_EQ(toks[0], "minister");
    EXPECT_EQ(toks[1], "budget");
    EXPECT_EQ(toks[2], "rise");
}

TEST(TextUtil, BigramsJoinAdjacentTokens) {
    const auto bg = bigrams({"interest", "rates", "rise"});
    ASSERT_EQ(bg.size(), 2u);
    EXPECT_EQ(bg[0], "interest rates");
    EXPECT_EQ(bg[1], "rates rise");
    EXPECT_TRUE(bigrams({"alone"}).empty());
}

TEST(TextUtil, CollapseWhitespace) {
    EXPECT_EQ(collapse_whitespace("  a \n\t b   c "), "a b c");
    EXPECT_EQ(trim("\n x y \t"), "x y");
}

TEST(SplitSentences, BasicBoundaries) {
    const auto s = split_sentences("First one. Second one! Third one? Fourth");
    ASSERT_EQ(s.size(), 4u);
    EXPECT_EQ(s[0], "First one.");
    EXPECT_EQ(s[1], "Second one!");
    EXPECT_EQ(s[2], "Third one?");
    EXPECT_EQ(s[3], "Fourth");
}

TEST(SplitSentences, AbbreviationsAndInitialsDoNotSplit) {
    const auto s = split_sentences("Mr. Smith met Dr. Jones in the U.S. capital. John F. Kennedy was mentioned.");
    ASSERT_EQ(s.size(), 2u);
    EXPECT_EQ(s[0], "Mr. Smith met Dr. Jones in the U.S. capital.");
    EXPECT_EQ(s[1], "John F. Kennedy was mentioned.");
}

TEST(SplitSentences, AbbreviationAtEndOfTextClosesSentence) {
    const auto us = split_sentences("The president flew back to the U.S.");
    ASSERT_EQ(us.size(), 1u);
    EXPECT_EQ(us[0], "The president flew back to the U.S.");

    EXPECT_EQ(split_sentences("The vote closed at 9 p.m.\n").size(), 1u);
    EXPECT_EQ(split_sentences("Shares rose at Apple Inc.").size(), 1u);
    EXPECT_EQ(split_sentences("They fell back to Plan B.  ").size(), 1u);

    const auto two = split_sentences("Talks moved to the U.S. Officials met on Monday.");
    ASSERT_EQ(two.size(), 1u);
    EXPECT_EQ(two[0], "Talks moved to the U.S. Officials met on Monday.");
}

TEST(SplitSentences, DecimalsAndClosingQuotes) {
    const auto s = split_sentences("Growth was 2.1 percent. \"It is fine,\" she said. \"Really?\" Yes.");
    ASSERT_EQ(s.size(), 4u);
    EXPECT_EQ(s[0], "Growth was 2.1 percent.");
    EXPECT_EQ(s[2], "\"Really?\"");
}

TEST(SplitSentences, PunctuationRunsAreOneBoundary) {
    const auto s = split_sentences("Wow!!! Really?! Ok...");
    ASSERT_EQ(s.size(), 3u);
    EXPECT_EQ(s[0], "Wow!!!");
    EXPECT_EQ(s[1], "Really?!");
}

TEST(SplitSentences, NoBoundaryYieldsNothing) {
    EXPECT_TRUE(split_sentences("no terminal punctuation here at all").empty());
    EXPECT_TRUE(split_sentences("").empty());
}
