#pragma once

#include "meshgate/error.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace meshgate {

struct RateLimitPolicy {
    std::chrono::milliseconds window{60000};
    uint32_t max_requests = 100;
    // Callers allowed to wait for the next window once max_requests is reached
    size_t queue_size = 10;
    std::chrono::milliseconds queue_timeout{30000};
    // Hand the slot back once the outcome is known (status >= 400 counts as failed)
    bool skip_failed_requests = false;
    bool skip_successful_requests = false;
};

// An admitted request, tied to the window that counted it
struct RateLimitGrant {
    std::string key;
    uint64_t window = 0;
};

struct RateLimitStatus {
    uint32_t count = 0;
    uint32_t remaining = 0;
    std::chrono::system_clock::time_point reset_time{};
    size_t queue_length = 0;
};

struct RateLimiterStats {
    size_t total_keys = 0;
    size_t total_queued = 0;
    double average_queue_length = 0.0;
    // Busiest keys by request count in their current window, at most ten
    std::vector<std::pair<std::string, uint32_t>> top_keys;
};

// Fixed window per key with a bounded FIFO wait queue. A queued acquire() blocks until the
// window resets and the drain admits it, or until queue_timeout.
class RateLimiter {
public:
    // max_queued caps waiters across all keys; 0 leaves only the per-key queue_size
    explicit RateLimiter(RateLimitPolicy default_policy = {},
                         std::chrono::milliseconds cleanup_interval = std::chrono::milliseconds{60000},
                         size_t max_queued = 0);
    ~RateLimiter();

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    std::expected<RateLimitGrant, Error> acquire(const std::string& key);

    // The policy applies when the key has no live entry yet
    std::expected<RateLimitGrant, Error> acquire(const std::string& key, const RateLimitPolicy& policy);

    // Returns an admitted request's slot while its window is still current, admitting the
    // next queued caller if any. False when the window has already moved on.
    bool release(const RateLimitGrant& grant);

    std::optional<RateLimitStatus> status(const std::string& key) const;
    RateLimiterStats stats() const;

    // Periodic removal of expired, idle entries
    void start_cleanup();
    void stop();

    // Returns the number of entries removed
    size_t cleanup();

    const RateLimitPolicy& default_policy() const { return default_policy_; }
    size_t max_queued() const { return max_queued_; }

private:
    struct Waiter {
        bool admitted = false;
        uint64_t window = 0;
        std::condition_variable cv;
    };

    struct Entry {
        std::mutex mutex;
        RateLimitPolicy policy;
        uint32_t count = 0;
        std::chrono::steady_clock::time_point window_reset{};
        std::chrono::system_clock::time_point reset_time{};
        uint64_t window_id = 0;
        std::deque<std::shared_ptr<Waiter>> queue;
        // Set once cleanup has dropped the entry from the map
        bool retired = false;
    };

    std::shared_ptr<Entry> entry_for(const std::string& key, const RateLimitPolicy& policy);
    void roll_window_locked(Entry& entry, std::chrono::steady_clock::time_point now);
    void admit_front_locked(Entry& entry);
    void cleanup_loop(std::stop_token stop_token);

    const RateLimitPolicy default_policy_;
    const std::chrono::milliseconds cleanup_interval_;
    const size_t max_queued_;
    std::atomic<size_t> queued_{0};

    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
    mutable std::mutex entries_mutex_;

    std::mutex wait_mutex_;
    std::condition_variable_any wait_cv_;
    std::jthread cleanup_thread_;
};

} // namespace meshgate
