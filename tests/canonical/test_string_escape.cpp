/**
 * @file test_string_escape.cpp
 * @brief ASCII-only string escaping and key ordering
 */

#include "ocp/string_escape.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace ocp::canonical::test {

TEST(StringEscape, PrintableAsciiIsLiteral)
{
    EXPECT_EQ(quote_string("hello world").value(), R"("hello world")");
    EXPECT_EQ(quote_string("a/b~c").value(), R"("a/b~c")");
    EXPECT_EQ(quote_string("").value(), R"("")");
}

TEST(StringEscape, QuoteAndBackslash)
{
    EXPECT_EQ(quote_string("say \"hi\"").value(), R"("say \"hi\"")");
    EXPECT_EQ(quote_string("C:\\dir").value(), R"("C:\\dir")");
}

TEST(StringEscape, ControlCharactersUseUnicodeEscapes)
{
    EXPECT_EQ(quote_string("a\nb\tc").value(), R"("a\u000ab\u0009c")");
    EXPECT_EQ(quote_string(std::string("\x00\x1f\x7f", 3)).value(), R"("\u0000\u001f\u007f")");
}

TEST(StringEscape, NonAsciiLowercaseHex)
{
    EXPECT_EQ(quote_string("\xC3\xA9").value(), R"("\u00e9")");
    EXPECT_EQ(quote_string("\xE2\x82\xAC").value(), R"("\u20ac")");
    EXPECT_EQ(quote_string("\xEF\xBF\xBF").value(), R"("\uffff")");
}

TEST(StringEscape, AstralCodePointsBecomeSurrogatePairs)
{
    // U+1F600
    EXPECT_EQ(quote_string("\xF0\x9F\x98\x80").value(), R"("\ud83d\ude00")");
    // U+10FFFF
    EXPECT_EQ(quote_string("\xF4\x8F\xBF\xBF").value(), R"("\udbff\udfff")");
}

TEST(StringEscape, MalformedUtf8Rejected)
{
    const std::vector<std::string> malformed = {
        "\x80",              // stray continuation
        "\xC3",              // truncated
        "\xC0\xAF",          // overlong '/'
        "\xE0\x80\xAF",      // overlong 3-byte
        "\xED\xA0\x80",      // encoded surrogate U+D800
        "\xF4\x90\x80\x80",  // above U+10FFFF
        "\xF8\x88\x80\x80",  // invalid lead
        "ok\xE2\x82",        // truncated at end
    };
    for (const auto& text : malformed) {
        auto result = quote_string(text);
        ASSERT_FALSE(result);
        EXPECT_EQ(result.error().code, ocp::kInvalidInput);
    }
}

TEST(StringEscape, FailureLeavesOutputUntouched)
{
    std::string out = "prefix";
    EXPECT_FALSE(escape_string("abc\xFF", out));
    EXPECT_EQ(out, "prefix");
}

TEST(KeyOrder, CodePointNotUtf16Order)
{
    // U+FB01 sorts before U+1F600 by code point; UTF-16 code units would reverse them
    std::vector<std::string> keys = {"\xF0\x9F\x98\x80", "\xEF\xAC\x81", "~", "\xC3\xA9", "aa", "a", "B", ""};
    std::ranges::sort(keys, code_point_less);
    const std::vector<std::string> expected = {"", "B", "a", "aa", "~", "\xC3\xA9", "\xEF\xAC\x81", "\xF0\x9F\x98\x80"};
    EXPECT_EQ(keys, expected);
}

TEST(KeyOrder, PrefixSortsFirst)
{
    EXPECT_TRUE(code_point_less("a", "ab"));
    EXPECT_FALSE(code_point_less("ab", "a"));
    EXPECT_FALSE(code_point_less("a", "a"));
}

}  // namespace ocp::canonical::test
