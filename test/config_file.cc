#include <gtest/gtest.h>
#include <polyexec/config_file.hh>
#include <polyexec/file_contents.hh>
#include <polyexec/temporary_directory.hh>
#include <stdexcept>
#include <string>
#include <vector>

using std::string;
using std::vector;

// NOLINTNEXTLINE
TEST(ConfigFile, values) {
    ConfigFile cf;
    cf.add_vars("a", "b", "c", "d", "e", "empty", "arr", "multiline", "unset");
    cf.load_config_from_string(R"==(
# Comment
a: plain value with spaces   # trailing comment
b = 'single ''quoted'' # not a comment'
c: "tab\tnew\nline\x41"
d:42
e: true
empty:
arr: [x, 'y z', "w"]
multiline: [
    1,
    2 # two
    3
]
unknown: ignored
)==");

    EXPECT_EQ(cf["a"].as_string(), "plain value with spaces");
    EXPECT_EQ(cf["b"].as_string(), "single 'quoted' # not a comment");
    EXPECT_EQ(cf["c"].as_string(), "tab\tnew\nlineA");
    EXPECT_EQ(cf["d"].as<int>(), 42);
    EXPECT_EQ(cf["a"].as<int>(), std::nullopt);
    EXPECT_TRUE(cf["e"].as_bool());
    EXPECT_FALSE(cf["a"].as_bool());

    EXPECT_TRUE(cf["empty"].is_set());
    EXPECT_EQ(cf["empty"].as_string(), "");

    EXPECT_TRUE(cf["arr"].is_array());
    EXPECT_EQ(cf["arr"].as_array(), (vector<string>{"x", "y z", "w"}));
    EXPECT_EQ(cf["multiline"].as_array(), (vector<string>{"1", "2", "3"}));

    EXPECT_FALSE(cf["unset"].is_set());
    EXPECT_FALSE(cf["unknown"].is_set());
    EXPECT_FALSE(cf["never_added"].is_set());
}

// NOLINTNEXTLINE
TEST(ConfigFile, load_all) {
    ConfigFile cf;
    cf.load_config_from_string("x: 1\ny: [a]\n", true);
    EXPECT_EQ(cf.get_vars().size(), 2U);
    EXPECT_EQ(cf["x"].as<int>(), 1);
    EXPECT_EQ(cf["y"].as_array(), vector<string>{"a"});
}

// NOLINTNEXTLINE
TEST(ConfigFile, reloading_unsets_variables) {
    ConfigFile cf;
    cf.add_vars("x", "y");
    cf.load_config_from_string("x: 1\ny: 2");
    cf.load_config_from_string("y: 3");
    EXPECT_FALSE(cf["x"].is_set());
    EXPECT_EQ(cf["y"].as<int>(), 3);
}

// NOLINTNEXTLINE
TEST(ConfigFile, parse_errors) {
    auto error_of = [](string config) -> string {
        ConfigFile cf;
        try {
            cf.load_config_from_string(std::move(config), true);
        } catch (const ConfigFile::ParseError& e) {
            return e.what();
        }
        return "no error";
    };

    EXPECT_EQ(error_of("a: 'abc"), "line 1:8: Missing terminating ' character");
    EXPECT_EQ(error_of("a: 1\nb \"abc\""), "line 2:3: Invalid assignment operator: `\"`");
    EXPECT_EQ(error_of("a: 1\nb"), "line 2:2: Incomplete directive: `b`");
    EXPECT_EQ(error_of(": 1"), "line 1:1: Invalid or missing variable's name");
    EXPECT_EQ(error_of("a: [1, 2"), "line 1:9: Missing terminating ] character at the end of an array");
    EXPECT_EQ(error_of("a: \"\\q\""), "line 1:6: Unknown escape sequence: `\\q`");
    EXPECT_EQ(error_of("a: 'x' y"), "line 1:8: Unknown sequence after the value: `y`");
}

// NOLINTNEXTLINE
TEST(ConfigFile, load_config_from_file) {
    TemporaryDirectory tmp_dir("/tmp/polyexec-config-test.XXXXXX");
    auto path = tmp_dir.path() + "polyexec.conf";
    put_file_contents(path, "scratch_dir: /var/tmp/x\n");

    ConfigFile cf;
    cf.add_vars("scratch_dir");
    cf.load_config_from_file(path);
    EXPECT_EQ(cf["scratch_dir"].as_string(), "/var/tmp/x");

    EXPECT_THROW(cf.load_config_from_file(tmp_dir.path() + "missing.conf"), std::runtime_error);
}
