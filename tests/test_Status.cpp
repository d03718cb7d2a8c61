#include <gtest/gtest.h>
#include <memory>
#include "Status.hpp"

namespace flm {
namespace testing {

TEST(StatusTest, ValueResultHoldsOnlyValue) {
    Result<int> result(42);

    EXPECT_TRUE(result.ok());
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result.value(), 42);
    EXPECT_THROW(result.error(), std::logic_error);
}

TEST(StatusTest, ErrorResultHoldsOnlyError) {
    Result<int> result(Error{ErrorCode::SequencingError, "late frame"});

    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::SequencingError);
    EXPECT_EQ(result.error().message, "late frame");
    EXPECT_THROW(result.value(), std::runtime_error);
}

TEST(StatusTest, MoveOnlyValue) {
    Result<std::unique_ptr<int>> result(std::make_unique<int>(7));
    ASSERT_TRUE(result.ok());

    std::unique_ptr<int> owned = std::move(result).value();
    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, 7);
}

TEST(StatusTest, VoidResult) {
    Result<void> success;
    EXPECT_TRUE(success.ok());
    EXPECT_THROW(success.error(), std::logic_error);

    Result<void> failure(Error{ErrorCode::InvalidModeError, "wrong mode"});
    EXPECT_FALSE(failure.ok());
    EXPECT_EQ(failure.error().code, ErrorCode::InvalidModeError);
}

TEST(StatusTest, ErrorToString) {
    Error error{ErrorCode::InvalidInputError, "empty image"};
    EXPECT_EQ(error.toString(), "INVALID_INPUT: empty image");

    EXPECT_STREQ(errorCodeName(ErrorCode::InitializationError), "INITIALIZATION_ERROR");
    EXPECT_STREQ(errorCodeName(ErrorCode::InvalidModeError), "INVALID_MODE");
    EXPECT_STREQ(errorCodeName(ErrorCode::SequencingError), "SEQUENCING_ERROR");
    EXPECT_STREQ(errorCodeName(ErrorCode::InternalError), "INTERNAL");
}

} // namespace testing
} // namespace flm
