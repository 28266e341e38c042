#include <gtest/gtest.h>
#include "core/status.hpp"
#include <memory>
#include <string>

using namespace chunkdump;

// Result<T, Error> and Status

TEST(StatusTest, OkCreation) {
    auto result = Result<int>::Ok(42);
    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_err());
    EXPECT_EQ(result.value(), 42);
}

TEST(StatusTest, ErrCarriesCodeAndMessage) {
    auto result = Result<int>::Err(Error{ErrorCode::NotFound, "no records for C1"});
    EXPECT_TRUE(result.is_err());
    EXPECT_TRUE(result.error().is(ErrorCode::NotFound));
    EXPECT_FALSE(result.error().is(ErrorCode::Exhausted));
    EXPECT_EQ(result.error().message, "no records for C1");
}

TEST(StatusTest, ValueThrowsOnError) {
    auto result = Result<int>::Err(Error{ErrorCode::Io, "disk"});
    EXPECT_THROW((void)result.value(), std::runtime_error);
}

TEST(StatusTest, ErrorThrowsOnOk) {
    auto result = Result<int>::Ok(1);
    EXPECT_THROW((void)result.error(), std::runtime_error);
}

TEST(StatusTest, ErrorToStringNamesTheCode) {
    Error e{ErrorCode::Exhausted, "all records read for C1"};
    EXPECT_EQ(e.to_string(), "exhausted: all records read for C1");

    Error bare{ErrorCode::Decode, ""};
    EXPECT_EQ(bare.to_string(), "decode error");
}

TEST(StatusTest, OkStatusAndErrorStatus) {
    auto ok = ok_status();
    EXPECT_TRUE(ok.is_ok());

    auto failed = error_status(ErrorCode::Io, "write failed");
    ASSERT_TRUE(failed.is_err());
    EXPECT_EQ(failed.error().code, ErrorCode::Io);
}

TEST(StatusTest, MapKeepsErrorCode) {
    auto result = Result<int>::Err(Error{ErrorCode::Exhausted, ""});
    auto mapped = result.map([](int x) { return std::to_string(x); });

    ASSERT_TRUE(mapped.is_err());
    EXPECT_EQ(mapped.error().code, ErrorCode::Exhausted);
}

TEST(StatusTest, MapTransformsValue) {
    auto result = Result<int>::Ok(10);
    auto mapped = result.map([](int x) { return x * 2; });

    ASSERT_TRUE(mapped.is_ok());
    EXPECT_EQ(mapped.value(), 20);
}

TEST(StatusTest, AndThenChainsOperations) {
    auto half = [](int x) -> Result<int> {
        if (x % 2 != 0) {
            return Result<int>::Err(Error{ErrorCode::InvalidArgument, "odd"});
        }
        return Result<int>::Ok(x / 2);
    };

    EXPECT_EQ(Result<int>::Ok(10).and_then(half).value(), 5);
    EXPECT_TRUE(Result<int>::Ok(3).and_then(half).is_err());
}

TEST(StatusTest, WorksWithMoveOnlyTypes) {
    auto result = Result<std::unique_ptr<int>>::Ok(std::make_unique<int>(42));

    ASSERT_TRUE(result.is_ok());
    auto ptr = std::move(result).take_value();
    EXPECT_EQ(*ptr, 42);
}
