#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "orchestrator/resource_locks.h"

using namespace mhub;

TEST(ImageLockTableTest, SerializesSameImageAcrossSpellings) {
    ImageLockTable table;
    auto first = table.acquire("mhubai/totalsegmentator");
    ASSERT_TRUE(first);

    std::atomic<bool> acquired{false};
    std::thread other([&]() {
        auto second = table.acquire("docker.io/mhubai/totalsegmentator:latest");
        acquired = second.has_value();
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_FALSE(acquired.load());

    first->release();
    other.join();
    EXPECT_TRUE(acquired.load());
}

TEST(ImageLockTableTest, DifferentImagesDoNotBlock) {
    ImageLockTable table;
    auto a = table.acquire("mhubai/a");
    auto b = table.acquire("mhubai/b");
    EXPECT_TRUE(a);
    EXPECT_TRUE(b);
}

TEST(ImageLockTableTest, CancelledWaitGivesUp) {
    ImageLockTable table;
    auto held = table.acquire("mhubai/a");
    ASSERT_TRUE(held);

    CancelToken cancel;
    std::thread canceller([cancel]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        cancel.cancel();
    });
    auto waiting = table.acquire("mhubai/a", &cancel);
    canceller.join();
    EXPECT_FALSE(waiting);
}

TEST(ImageLockTableTest, PullingMarkIsScoped) {
    ImageLockTable table;
    EXPECT_FALSE(table.isPulling("mhubai/a"));
    {
        auto mark = table.markPulling("mhubai/a:latest");
        auto second = table.markPulling("mhubai/a");
        EXPECT_TRUE(table.isPulling("docker.io/mhubai/a"));
        mark.reset();
        EXPECT_TRUE(table.isPulling("mhubai/a"));
    }
    EXPECT_FALSE(table.isPulling("mhubai/a"));
}

TEST(VolumeLeaseTableTest, SecondLeaseWaitsForRelease) {
    VolumeLeaseTable table;
    CancelToken cancel;
    auto lease = table.acquire("/data/study1", cancel);
    ASSERT_TRUE(lease);
    EXPECT_TRUE(table.held("/data/study1/"));

    std::atomic<bool> got{false};
    std::thread other([&]() {
        CancelToken c;
        auto second = table.acquire("/data/./study1", c);
        got = second != nullptr;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_FALSE(got.load());
    lease.reset();
    other.join();
    EXPECT_TRUE(got.load());
    EXPECT_FALSE(table.held("/data/study1"));
}

TEST(VolumeLeaseTableTest, CancelReturnsNull) {
    VolumeLeaseTable table;
    CancelToken hold;
    auto lease = table.acquire("/data/study2", hold);
    ASSERT_TRUE(lease);

    CancelToken cancel;
    cancel.cancel();
    EXPECT_EQ(table.acquire("/data/study2", cancel), nullptr);
}
