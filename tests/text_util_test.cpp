#include <gtest/gtest.h>

#include "core/TextUtil.hpp"

#include <string>
#include <vector>

using textutil::normalize;
using textutil::tokenize;

TEST(Normalize, LowercasesAndStripsPunctuation) {
    EXPECT_EQ(normalize("Hello, World!"), "hello world");
    EXPECT_EQ(normalize("HELLO WORLD"), "hello world");
    EXPECT_EQ(normalize("don't stop"), "don t stop");
    EXPECT_EQ(normalize("Version 2.0"), "version 2 0");
}

TEST(Normalize, CollapsesAndTrimsWhitespace) {
    EXPECT_EQ(normalize("  a\t\tb\n\n c  "), "a b c");
    EXPECT_EQ(normalize("a -- b"), "a b");
}

TEST(Normalize, EmptyAndPunctuationOnly) {
    EXPECT_EQ(normalize(""), "");
    EXPECT_EQ(normalize("   "), "");
    EXPECT_EQ(normalize("!!! ... ???"), "");
}

TEST(Normalize, NonAsciiPassesThroughUnfolded) {
    // "Café ÉTÉ": only the ASCII letters change case
    EXPECT_EQ(normalize("Caf\xC3\xA9 \xC3\x89T\xC3\x89"), "caf\xC3\xA9 \xC3\x89t\xC3\x89");
    EXPECT_EQ(normalize("\xE4\xBD\xA0\xE5\xA5\xBD, world"), "\xE4\xBD\xA0\xE5\xA5\xBD world");
}

TEST(Normalize, UnicodeWhitespaceSeparates) {
    EXPECT_EQ(normalize("hello\xC2\xA0world"), "hello world");              // NBSP
    EXPECT_EQ(normalize("a\xE2\x80\x83" "b\xE3\x80\x80" "c"), "a b c");         // em space, ideographic space
    EXPECT_EQ(normalize("a\xC2\x85" "b\xE2\x80\xA8" "c\xE2\x80\xA9" "d"), "a b c d");
    EXPECT_EQ(normalize("\xC2\xA0 \xE2\x80\xAFx\xC2\xA0"), "x");
    // other two-byte sequences beginning with C2 are kept
    EXPECT_EQ(normalize("\xC2\xA9 2024"), "\xC2\xA9 2024");
}

TEST(Normalize, Idempotent) {
    const std::vector<std::string> samples = {
        "Hello, World!",
        "  Mixed   CASE\tand\npunctuation;:  ",
        "!!!",
        "",
        "caf\xC3\xA9 -- R\xC3\xA9SUM\xC3\x89 (draft #2)",
        "a.b.c.d",
    };
    for (const auto& s : samples) {
        const std::string once = normalize(s);
        EXPECT_EQ(normalize(once), once) << "input: " << s;
    }
}

TEST(Tokenize, SplitsInOrder) {
    const auto toks = tokenize("the cat sat on the mat");
    const std::vector<std::string> expected = {"the", "cat", "sat", "on", "the", "mat"};
    EXPECT_EQ(toks, expected);
}

TEST(Tokenize, EmptyInput) {
    EXPECT_TRUE(tokenize("").empty());
    EXPECT_TRUE(tokenize("   ").empty());
}

TEST(Tokenize, IgnoresRepeatedSeparators) {
    const auto toks = tokenize("  a  b ");
    ASSERT_EQ(toks.size(), 2u);
    EXPECT_EQ(toks[0], "a");
    EXPECT_EQ(toks[1], "b");
}

TEST(Tokenize, SplitsOnUnicodeWhitespace) {
    const auto toks = tokenize("one\xC2\xA0two\xE2\x80\x89three");
    const std::vector<std::string> expected = {"one", "two", "three"};
    EXPECT_EQ(toks, expected);
}

TEST(Trim, RemovesSurroundingWhitespace) {
    EXPECT_EQ(textutil::trim("\n\t hi there \r\n"), "hi there");
    EXPECT_EQ(textutil::trim("   "), "");
}

TEST(Trim, RemovesUnicodeWhitespace) {
    EXPECT_EQ(textutil::trim("\xC2\xA0\xE3\x80\x80hi\xC2\xA0there\xE2\x80\x8A\xC2\xA0"), "hi\xC2\xA0there");
    EXPECT_EQ(textutil::trim("\xE2\x80\x80\xC2\x85"), "");
    // a non-space multi-byte character at the end stays
    EXPECT_EQ(textutil::trim("caf\xC3\xA9 "), "caf\xC3\xA9");
}
