#include <gtest/gtest.h>

#include <string>

#include "gec/gec.hpp"

TEST(VersionTest, MajorMinorPatch) {
    EXPECT_EQ(gec::Version::major, 0);
    EXPECT_EQ(gec::Version::minor, 3);
    EXPECT_EQ(gec::Version::patch, 0);
}

TEST(VersionTest, VersionString) {
    EXPECT_STREQ(gec::Version::string, "0.3.0");
    EXPECT_EQ(std::string(GEC_VERSION_STRING),
              std::to_string(GEC_VERSION_MAJOR) + "." + std::to_string(GEC_VERSION_MINOR) + "." +
                  std::to_string(GEC_VERSION_PATCH));
}

struct TestError {
    int code = 0;
    std::string message;
};

TEST(ResultTest, OkValue) {
    auto result = gec::Result<int, TestError>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorValue) {
    auto result = gec::Result<int, TestError>::err(TestError{404, "not found"});
    EXPECT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().code, 404);
    EXPECT_EQ(result.error().message, "not found");
    EXPECT_EQ(result.valueOr(7), 7);
}

TEST(ResultTest, MoveOutValue) {
    auto result = gec::Result<std::string, TestError>::ok("coins");
    std::string moved = std::move(result).value();
    EXPECT_EQ(moved, "coins");
}

TEST(ResultVoidTest, OkAndError) {
    auto ok = gec::Result<void, TestError>::ok();
    EXPECT_TRUE(static_cast<bool>(ok));

    auto err = gec::Result<void, TestError>::err(TestError{1, "void error"});
    EXPECT_TRUE(err.hasError());
    EXPECT_EQ(err.error().message, "void error");
}
