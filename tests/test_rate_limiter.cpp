#include <gtest/gtest.h>
#include "meshgate/rate_limiter.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace meshgate;
using namespace std::chrono_literals;

class RateLimiterTest : public ::testing::Test {
protected:
    void SetUp() override {
        policy.window = 300ms;
        policy.max_requests = 5;
        policy.queue_size = 2;
        policy.queue_timeout = 2000ms;
    }

    void wait_for_queue(RateLimiter& limiter, const std::string& key, size_t length) {
        for (int i = 0; i < 200; ++i) {
            auto status = limiter.status(key);
            if (status && status->queue_length == length) {
                return;
            }
            std::this_thread::sleep_for(2ms);
        }
        FAIL() << "queue for " << key << " never reached " << length;
    }

    RateLimitPolicy policy;
};

TEST_F(RateLimiterTest, AdmitsUpToLimit) {
    RateLimiter limiter(policy);

    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(limiter.acquire("client-a").has_value());
    }

    auto status = limiter.status("client-a");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->count, 5);
    EXPECT_EQ(status->remaining, 0);
    EXPECT_EQ(status->queue_length, 0);
}

TEST_F(RateLimiterTest, KeysAreIndependent) {
    RateLimiter limiter(policy);

    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(limiter.acquire("client-a").has_value());
    }
    EXPECT_TRUE(limiter.acquire("client-b").has_value());
    EXPECT_EQ(limiter.status("client-b")->count, 1);
    EXPECT_FALSE(limiter.status("client-c").has_value());
}

TEST_F(RateLimiterTest, QueuesThenRejectsWhenQueueFull) {
    RateLimiter limiter(policy);
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(limiter.acquire("client-a").has_value());
    }

    std::atomic<int> admitted{0};
    std::vector<std::thread> queued;
    for (int i = 0; i < 2; ++i) {
        queued.emplace_back([&] {
            if (limiter.acquire("client-a").has_value()) {
                ++admitted;
            }
        });
    }
    wait_for_queue(limiter, "client-a", 2);

    auto rejected = limiter.acquire("client-a");
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, ErrorCode::QueueFull);
    EXPECT_EQ(http_status(rejected.error()), 429);
    EXPECT_EQ(rejected.error().message, "Server is currently overloaded. Please try again later.");

    for (auto& t : queued) {
        t.join();
    }
    // Both waiters are admitted by the next window
    EXPECT_EQ(admitted.load(), 2);
    auto status = limiter.status("client-a");
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->count, 2);
    EXPECT_EQ(status->queue_length, 0);
}

TEST_F(RateLimiterTest, QueuedRequestTimesOut) {
    policy.window = 10s;
    policy.queue_timeout = 100ms;
    RateLimiter limiter(policy);
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(limiter.acquire("client-a").has_value());
    }

    auto start = std::chrono::steady_clock::now();
    auto result = limiter.acquire("client-a");
    auto waited = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::QueueTimeout);
    EXPECT_EQ(result.error().message, "Request timed out while waiting in queue. Please try again.");
    EXPECT_GE(waited, 100ms);
    EXPECT_EQ(limiter.status("client-a")->queue_length, 0);
}

TEST_F(RateLimiterTest, WindowResetRestoresCapacity) {
    policy.queue_size = 0;
    RateLimiter limiter(policy);
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(limiter.acquire("client-a").has_value());
    }
    EXPECT_EQ(limiter.acquire("client-a").error().code, ErrorCode::QueueFull);

    std::this_thread::sleep_for(350ms);
    EXPECT_EQ(limiter.status("client-a")->count, 0);
    EXPECT_TRUE(limiter.acquire("client-a").has_value());
    EXPECT_EQ(limiter.status("client-a")->count, 1);
}

TEST_F(RateLimiterTest, PerCallPolicyAppliesToNewKey) {
    RateLimiter limiter(policy);
    RateLimitPolicy strict = policy;
    strict.max_requests = 1;
    strict.queue_size = 0;

    EXPECT_TRUE(limiter.acquire("login", strict).has_value());
    EXPECT_FALSE(limiter.acquire("login", strict).has_value());
    EXPECT_EQ(limiter.default_policy().max_requests, 5);
}

TEST_F(RateLimiterTest, ReleaseReturnsSlotInCurrentWindow) {
    policy.window = 10s;
    policy.queue_size = 0;
    RateLimiter limiter(policy);

    auto first = limiter.acquire("client-a");
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->key, "client-a");
    for (int i = 0; i < 4; ++i) {
        ASSERT_TRUE(limiter.acquire("client-a").has_value());
    }
    ASSERT_FALSE(limiter.acquire("client-a").has_value());

    EXPECT_TRUE(limiter.release(*first));
    EXPECT_EQ(limiter.status("client-a")->count, 4);
    EXPECT_TRUE(limiter.acquire("client-a").has_value());
    EXPECT_FALSE(limiter.release(RateLimitGrant{"client-b", 1}));
}

TEST_F(RateLimiterTest, ReleaseAdmitsQueuedCaller) {
    policy.window = 10s;
    RateLimiter limiter(policy);
    std::vector<RateLimitGrant> grants;
    for (int i = 0; i < 5; ++i) {
        auto grant = limiter.acquire("client-a");
        ASSERT_TRUE(grant.has_value());
        grants.push_back(*grant);
    }

    std::atomic<bool> admitted{false};
    std::thread waiter([&] {
        admitted = limiter.acquire("client-a").has_value();
    });
    wait_for_queue(limiter, "client-a", 1);

    EXPECT_TRUE(limiter.release(grants.front()));
    waiter.join();
    EXPECT_TRUE(admitted.load());
    EXPECT_EQ(limiter.status("client-a")->count, 5);
    EXPECT_EQ(limiter.status("client-a")->queue_length, 0);
}

TEST_F(RateLimiterTest, ReleaseIgnoredOnceWindowMoves) {
    RateLimiter limiter(policy);
    auto old = limiter.acquire("client-a");
    ASSERT_TRUE(old.has_value());

    std::this_thread::sleep_for(350ms);
    ASSERT_TRUE(limiter.acquire("client-a").has_value());

    EXPECT_FALSE(limiter.release(*old));
    EXPECT_EQ(limiter.status("client-a")->count, 1);
}

TEST_F(RateLimiterTest, MaxQueuedCapsWaitersAcrossKeys) {
    policy.window = 10s;
    policy.queue_timeout = 300ms;
    RateLimiter limiter(policy, 60s, 1);
    EXPECT_EQ(limiter.max_queued(), 1);
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(limiter.acquire("client-a").has_value());
        ASSERT_TRUE(limiter.acquire("client-b").has_value());
    }

    std::thread waiter([&] {
        auto result = limiter.acquire("client-a");
        EXPECT_FALSE(result.has_value());
    });
    wait_for_queue(limiter, "client-a", 1);

    // client-b still has room in its own queue, but the limiter as a whole does not
    auto rejected = limiter.acquire("client-b");
    EXPECT_FALSE(rejected.has_value());
    if (!rejected) {
        EXPECT_EQ(rejected.error().code, ErrorCode::QueueFull);
    }
    EXPECT_EQ(limiter.status("client-b")->queue_length, 0);
    waiter.join();

    // The timed-out waiter gave its place back
    auto start = std::chrono::steady_clock::now();
    auto result = limiter.acquire("client-b");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::QueueTimeout);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 300ms);
}

TEST_F(RateLimiterTest, CleanupRemovesExpiredIdleEntries) {
    policy.window = 50ms;
    RateLimiter limiter(policy);
    ASSERT_TRUE(limiter.acquire("client-a").has_value());
    ASSERT_TRUE(limiter.acquire("client-b").has_value());

    EXPECT_EQ(limiter.cleanup(), 0);
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(limiter.cleanup(), 2);
    EXPECT_FALSE(limiter.status("client-a").has_value());

    // A retired key starts over
    EXPECT_TRUE(limiter.acquire("client-a").has_value());
    EXPECT_EQ(limiter.status("client-a")->count, 1);
}

TEST_F(RateLimiterTest, BackgroundCleanup) {
    policy.window = 20ms;
    RateLimiter limiter(policy, 50ms);
    ASSERT_TRUE(limiter.acquire("client-a").has_value());

    limiter.start_cleanup();
    std::this_thread::sleep_for(200ms);
    limiter.stop();

    EXPECT_FALSE(limiter.status("client-a").has_value());
}

TEST_F(RateLimiterTest, StatsReportBusiestKeys) {
    RateLimiter limiter(policy);
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(limiter.acquire("busy").has_value());
    }
    ASSERT_TRUE(limiter.acquire("quiet").has_value());

    auto stats = limiter.stats();
    EXPECT_EQ(stats.total_keys, 2);
    EXPECT_EQ(stats.total_queued, 0);
    EXPECT_DOUBLE_EQ(stats.average_queue_length, 0.0);
    ASSERT_EQ(stats.top_keys.size(), 2);
    EXPECT_EQ(stats.top_keys[0].first, "busy");
    EXPECT_EQ(stats.top_keys[0].second, 3);
}
