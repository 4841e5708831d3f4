#include <gtest/gtest.h>
#include "loadsense/core/result.h"
#include <string>
#include <vector>

namespace loadsense {
namespace core {
namespace {

TEST(ResultTest, SuccessConstruction) {
    Result<int> result(42);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorConstruction) {
    auto result = Result<int>::error("Invalid input");
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error(), "Invalid input");
}

TEST(ResultTest, AccessingErrorOfOkResultThrows) {
    Result<std::string> result("fine");
    EXPECT_THROW(result.error(), std::runtime_error);
}

TEST(ResultTest, TakeValueMovesPayload) {
    Result<std::vector<int>> result(std::vector<int>{1, 2, 3});
    std::vector<int> taken = result.take_value();
    EXPECT_EQ(taken.size(), 3u);
}

TEST(ResultTest, MoveConstruction) {
    Result<std::string> original("moved string");
    Result<std::string> moved(std::move(original));

    EXPECT_TRUE(moved.ok());
    EXPECT_EQ(moved.value(), "moved string");
}

TEST(ResultTest, MoveKeepsError) {
    auto original = Result<std::string>::error("Resource not found");
    Result<std::string> moved(std::move(original));
    EXPECT_FALSE(moved.ok());
    EXPECT_EQ(moved.error(), "Resource not found");
}

TEST(ResultVoidTest, SuccessAndError) {
    Result<void> ok;
    EXPECT_TRUE(ok.ok());

    auto failed = Result<void>::error("bad config");
    EXPECT_FALSE(failed.ok());
    EXPECT_EQ(failed.error(), "bad config");
}

} // namespace
} // namespace core
} // namespace loadsense
