#include <gtest/gtest.h>
#include <polyexec/escape_bytes_to_utf8_str.hh>
#include <string>

using std::string;

// NOLINTNEXTLINE
TEST(escape_bytes_to_utf8_str, ascii) {
    EXPECT_EQ(
        escape_bytes_to_utf8_str("abcdefghijklmnopqrstuwvxyz ABCDEFGHIJKLMNOPQRSTUWVXYZ 0123456789"),
        "abcdefghijklmnopqrstuwvxyz ABCDEFGHIJKLMNOPQRSTUWVXYZ 0123456789"
    );
    EXPECT_EQ(escape_bytes_to_utf8_str(""), "");
}

// NOLINTNEXTLINE
TEST(escape_bytes_to_utf8_str, control_characters_are_kept) {
    EXPECT_EQ(escape_bytes_to_utf8_str({"\n\t\r\0\x01\x1f\x7f", 7}), string("\n\t\r\0\x01\x1f\x7f", 7));
}

// NOLINTNEXTLINE
TEST(escape_bytes_to_utf8_str, utf8) {
    EXPECT_EQ(escape_bytes_to_utf8_str("ąćęłńóśźż"), "ąćęłńóśźż");
    EXPECT_EQ(escape_bytes_to_utf8_str("\xc2\x80"), "\xc2\x80"); // U+0080
    EXPECT_EQ(escape_bytes_to_utf8_str("\xe2\x82\xac"), "\xe2\x82\xac"); // U+20AC
    EXPECT_EQ(escape_bytes_to_utf8_str("\xef\xbf\xbf"), "\xef\xbf\xbf"); // U+FFFF
    EXPECT_EQ(escape_bytes_to_utf8_str("\xf0\x9f\x98\x80"), "\xf0\x9f\x98\x80"); // U+1F600
    EXPECT_EQ(escape_bytes_to_utf8_str("\xf4\x8f\xbf\xbf"), "\xf4\x8f\xbf\xbf"); // U+10FFFF
}

// NOLINTNEXTLINE
TEST(escape_bytes_to_utf8_str, invalid_bytes) {
    EXPECT_EQ(escape_bytes_to_utf8_str("ok\xff\xfe"), "ok\\xff\\xfe");
    // stray continuation byte
    EXPECT_EQ(escape_bytes_to_utf8_str("a\x80z"), "a\\x80z");
    // the backslash itself is not escaped
    EXPECT_EQ(escape_bytes_to_utf8_str("\\x41"), "\\x41");
}

// NOLINTNEXTLINE
TEST(escape_bytes_to_utf8_str, truncated_sequences) {
    EXPECT_EQ(escape_bytes_to_utf8_str("\xc5"), "\\xc5");
    EXPECT_EQ(escape_bytes_to_utf8_str("\xe2\x82"), "\\xe2\\x82");
    EXPECT_EQ(escape_bytes_to_utf8_str("\xf0\x9f\x98"), "\\xf0\\x9f\\x98");
    // a valid character right after a broken one is kept
    EXPECT_EQ(escape_bytes_to_utf8_str("\xe2\x82ż"), "\\xe2\\x82ż");
    // second byte is not a continuation byte
    EXPECT_EQ(escape_bytes_to_utf8_str("\xc5z"), "\\xc5z");
    // third byte is not a continuation byte
    EXPECT_EQ(escape_bytes_to_utf8_str("\xe2\x82z"), "\\xe2\\x82z");
    // fourth byte is not a continuation byte
    EXPECT_EQ(escape_bytes_to_utf8_str("\xf0\x9f\x98z"), "\\xf0\\x9f\\x98z");
}

// NOLINTNEXTLINE
TEST(escape_bytes_to_utf8_str, ill_formed_sequences) {
    // overlong encodings
    EXPECT_EQ(escape_bytes_to_utf8_str("\xc0\x80"), "\\xc0\\x80");
    EXPECT_EQ(escape_bytes_to_utf8_str("\xc1\xbf"), "\\xc1\\xbf");
    EXPECT_EQ(escape_bytes_to_utf8_str("\xe0\x80\x80"), "\\xe0\\x80\\x80");
    EXPECT_EQ(escape_bytes_to_utf8_str("\xf0\x80\x80\x80"), "\\xf0\\x80\\x80\\x80");
    // surrogate U+D800
    EXPECT_EQ(escape_bytes_to_utf8_str("\xed\xa0\x80"), "\\xed\\xa0\\x80");
    // above U+10FFFF
    EXPECT_EQ(escape_bytes_to_utf8_str("\xf4\x90\x80\x80"), "\\xf4\\x90\\x80\\x80");
    EXPECT_EQ(escape_bytes_to_utf8_str("\xf5\x80\x80\x80"), "\\xf5\\x80\\x80\\x80");
}

// NOLINTNEXTLINE
TEST(escape_bytes_to_utf8_str, utf8_prefix) {
    EXPECT_EQ(utf8_prefix("abc", 5), "abc");
    EXPECT_EQ(utf8_prefix("abc", 3), "abc");
    EXPECT_EQ(utf8_prefix("abcdef", 3), "abc");
    // "ż" is 2 bytes, "€" is 3 bytes
    EXPECT_EQ(utf8_prefix("aż", 2), "a");
    EXPECT_EQ(utf8_prefix("aż", 3), "aż");
    EXPECT_EQ(utf8_prefix("a€b", 2), "a");
    EXPECT_EQ(utf8_prefix("a€b", 3), "a");
    EXPECT_EQ(utf8_prefix("a€b", 4), "a€");
    EXPECT_EQ(utf8_prefix("\xf0\x9f\x98\x80", 3), "");
    // a run of stray continuation bytes is cut where asked
    EXPECT_EQ(utf8_prefix("ab\x80\x80\x80\x80\x80", 6), "ab\x80\x80\x80\x80");
}
