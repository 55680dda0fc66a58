#include <gtest/gtest.h>
#include <memory>
#include <polyexec/result.hh>
#include <string>

using std::string;

// NOLINTNEXTLINE
TEST(Result, ok) {
    Result<int, string> res = Ok{42};
    EXPECT_TRUE(res.is_ok());
    EXPECT_FALSE(res.is_err());
    EXPECT_EQ(std::move(res).unwrap(), 42);
}

// NOLINTNEXTLINE
TEST(Result, err) {
    Result<int, string> res = Err{string{"boom"}};
    EXPECT_FALSE(res.is_ok());
    EXPECT_TRUE(res.is_err());
    EXPECT_EQ(std::move(res).unwrap_err(), "boom");
}

// NOLINTNEXTLINE
TEST(Result, wrong_unwrap_throws) {
    Result<int, string> res = Err{string{"boom"}};
    EXPECT_THROW((void)std::move(res).unwrap(), std::bad_variant_access);
}

// NOLINTNEXTLINE
TEST(Result, move_only_value) {
    Result<std::unique_ptr<int>, int> res = Ok{std::make_unique<int>(7)};
    auto ptr = std::move(res).unwrap();
    ASSERT_NE(ptr, nullptr);
    EXPECT_EQ(*ptr, 7);
}
