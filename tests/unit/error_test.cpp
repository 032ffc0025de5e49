#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

#include "core/cancel_token.h"
#include "core/error.h"

using namespace mhub;

TEST(ResultTest, SuccessCarriesData) {
    auto r = Result<int>::success(42);
    EXPECT_TRUE(r.ok());
    ASSERT_TRUE(r.data.has_value());
    EXPECT_EQ(*r.data, 42);
    EXPECT_TRUE(r.error_message.empty());
}

TEST(ResultTest, FailureHasNoData) {
    auto r = Result<std::string>::failure(ErrorKind::kImageNotFound, "no such image");
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.error, ErrorKind::kImageNotFound);
    EXPECT_EQ(r.error_message, "no such image");
    EXPECT_FALSE(r.data.has_value());
}

TEST(ResultTest, FromCopiesErrorAcrossTypes) {
    auto inner = Result<std::vector<int>>::failure(ErrorKind::kEngineUnavailable, "daemon down");
    auto outer = Result<void>::from(inner);
    EXPECT_FALSE(outer.ok());
    EXPECT_EQ(outer.error, ErrorKind::kEngineUnavailable);
    EXPECT_EQ(outer.error_message, "daemon down");
}

TEST(ResultTest, ErrorKindNamesAreStable) {
    EXPECT_STREQ(to_string(ErrorKind::kOk), "OK");
    EXPECT_STREQ(to_string(ErrorKind::kInvalidMount), "INVALID_MOUNT");
    EXPECT_STREQ(to_string(ErrorKind::kAlreadyTerminal), "ALREADY_TERMINAL");
    EXPECT_STREQ(to_string(ErrorKind::kCatalogUnreachable), "CATALOG_UNREACHABLE");
}

TEST(CancelTokenTest, CopiesShareState) {
    CancelToken a;
    CancelToken b = a;
    EXPECT_FALSE(b.cancelled());
    a.cancel();
    EXPECT_TRUE(b.cancelled());
}

TEST(CancelTokenTest, WaitForReturnsFalseOnTimeout) {
    CancelToken token;
    EXPECT_FALSE(token.waitFor(std::chrono::milliseconds(10)));
}

TEST(CancelTokenTest, WaitForWakesOnCancel) {
    CancelToken token;
    std::thread t([token]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        token.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(token.waitFor(std::chrono::seconds(5)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
    t.join();
}
