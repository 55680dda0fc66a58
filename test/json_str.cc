#include <cstdint>
#include <gtest/gtest.h>
#include <optional>
#include <polyexec/json_str.hh>
#include <string>

using std::string;

// NOLINTNEXTLINE
TEST(json_str, append_stringified_json) {
    auto stringify = [](std::string_view str) {
        string res;
        json_str::append_stringified_json(res, str);
        return res;
    };
    EXPECT_EQ(stringify(""), R"("")");
    EXPECT_EQ(stringify("abc"), R"("abc")");
    EXPECT_EQ(stringify("a\"b\\c"), R"("a\"b\\c")");
    EXPECT_EQ(stringify("line\nnext\ttab\r"), R"("line\nnext\ttab\r")");
    EXPECT_EQ(stringify(string{"\0\x1f", 2}), R"("\u0000\u001f")");
    EXPECT_EQ(stringify("zażółć"), "\"zażółć\"");
}

// NOLINTNEXTLINE
TEST(json_str, object) {
    json_str::Object obj;
    obj.prop("s", "x")
        .prop("b", true)
        .prop("n", nullptr)
        .prop("i", -5)
        .prop("u", uint64_t{18446744073709551615ULL})
        .prop("some", std::optional<int>{3})
        .prop("none", std::optional<int>{})
        .prop("str", string{"y"});
    EXPECT_EQ(
        std::move(obj).into_str(),
        R"({"s":"x","b":true,"n":null,"i":-5,"u":18446744073709551615,"some":3,"none":null,"str":"y"})"
    );
}

// NOLINTNEXTLINE
TEST(json_str, empty_object) { EXPECT_EQ(json_str::Object{}.into_str(), "{}"); }
