#include <gtest/gtest.h>

#include <string>

#include "src/utils/string_utils.hpp"

using namespace documentstack;

TEST(StringUtils, EscapePathSegment) {
    EXPECT_EQ(string_utils::escape_path_segment("tmpl_123-abc.v2~x"), "tmpl_123-abc.v2~x");
    EXPECT_EQ(string_utils::escape_path_segment("a/b"), "a%2Fb");
    EXPECT_EQ(string_utils::escape_path_segment("a b?c#d"), "a%20b%3Fc%23d");
    EXPECT_EQ(string_utils::escape_path_segment("a;b,c"), "a%3Bb%2Cc");
    EXPECT_EQ(string_utils::escape_path_segment("$&+:=@"), "$&+:=@");
    EXPECT_EQ(string_utils::escape_path_segment("caf\xC3\xA9"), "caf%C3%A9");
    EXPECT_EQ(string_utils::escape_path_segment("100%"), "100%25");
}

TEST(StringUtils, ParseInteger) {
    EXPECT_EQ(string_utils::parse_integer("42"), 42);
    EXPECT_EQ(string_utils::parse_integer(" 7 "), 7);
    EXPECT_EQ(string_utils::parse_integer("-3"), -3);
    EXPECT_FALSE(string_utils::parse_integer("").has_value());
    EXPECT_FALSE(string_utils::parse_integer("12ms").has_value());
    EXPECT_FALSE(string_utils::parse_integer("1.5").has_value());
    EXPECT_FALSE(string_utils::parse_integer("99999999999999999999999").has_value());
}

TEST(StringUtils, Trim) {
    EXPECT_EQ(string_utils::trim("  value\r\n"), "value");
    EXPECT_EQ(string_utils::trim(""), "");
}

TEST(StringUtils, StripTrailingSlash) {
    EXPECT_EQ(string_utils::strip_trailing_slash("https://x/"), "https://x");
    EXPECT_EQ(string_utils::strip_trailing_slash("https://x"), "https://x");
    EXPECT_EQ(string_utils::strip_trailing_slash(""), "");
}

TEST(StringUtils, WriteToStringAppends) {
    std::string body = "ab";
    const char chunk[] = {'c', 'd', 'e'};
    EXPECT_EQ(string_utils::write_to_string(chunk, 1, sizeof(chunk), &body), sizeof(chunk));
    EXPECT_EQ(body, "abcde");
}
