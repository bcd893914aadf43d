#include "meshgate/rate_limiter.hpp"
#include "meshgate/logger.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>

namespace meshgate {

RateLimiter::RateLimiter(RateLimitPolicy default_policy, std::chrono::milliseconds cleanup_interval,
                         size_t max_queued)
    : default_policy_(default_policy), cleanup_interval_(cleanup_interval), max_queued_(max_queued) {}

RateLimiter::~RateLimiter() {
    stop();
}

std::expected<RateLimitGrant, Error> RateLimiter::acquire(const std::string& key) {
    return acquire(key, default_policy_);
}

std::expected<RateLimitGrant, Error> RateLimiter::acquire(const std::string& key, const RateLimitPolicy& policy) {
    std::shared_ptr<Entry> entry;
    std::unique_lock<std::mutex> lock;
    for (;;) {
        entry = entry_for(key, policy);
        lock = std::unique_lock(entry->mutex);
        if (!entry->retired) {
            break;
        }
        // Cleanup dropped it between lookup and lock
        lock.unlock();
    }

    auto now = std::chrono::steady_clock::now();
    if (now >= entry->window_reset) {
        roll_window_locked(*entry, now);
    }

    const auto& active = entry->policy;
    if (entry->count < active.max_requests) {
        ++entry->count;
        if (entry->count * 5 >= active.max_requests * 4) {
            Logger::debug(Logger::Component::RateLimit,
                fmt::format("Key {} approaching limit: {}/{}", key, entry->count, active.max_requests));
        }
        return RateLimitGrant{key, entry->window_id};
    }

    if (entry->queue.size() >= active.queue_size) {
        Logger::warn(Logger::Component::RateLimit,
            fmt::format("Rate limit queue full for {} ({} queued)", key, entry->queue.size()));
        return std::unexpected(Error{ErrorCode::QueueFull,
            "Server is currently overloaded. Please try again later."});
    }
    if (queued_.fetch_add(1) >= max_queued_ && max_queued_ > 0) {
        --queued_;
        Logger::warn(Logger::Component::RateLimit,
            fmt::format("Rate limit wait capacity exhausted ({} queued), rejecting {}", max_queued_, key));
        return std::unexpected(Error{ErrorCode::QueueFull,
            "Server is currently overloaded. Please try again later."});
    }

    auto waiter = std::make_shared<Waiter>();
    entry->queue.push_back(waiter);
    auto deadline = now + active.queue_timeout;
    Logger::info(Logger::Component::RateLimit,
        fmt::format("Request queued for {} at position {}", key, entry->queue.size()));

    while (!waiter->admitted) {
        now = std::chrono::steady_clock::now();
        if (now >= entry->window_reset) {
            roll_window_locked(*entry, now);
            continue;
        }
        if (now >= deadline) {
            auto it = std::find(entry->queue.begin(), entry->queue.end(), waiter);
            if (it != entry->queue.end()) {
                entry->queue.erase(it);
                --queued_;
            }
            Logger::warn(Logger::Component::RateLimit,
                fmt::format("Queued request for {} timed out after {}ms", key, active.queue_timeout.count()));
            return std::unexpected(Error{ErrorCode::QueueTimeout,
                "Request timed out while waiting in queue. Please try again."});
        }
        waiter->cv.wait_until(lock, std::min(entry->window_reset, deadline));
    }
    return RateLimitGrant{key, waiter->window};
}

bool RateLimiter::release(const RateLimitGrant& grant) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard map_lock(entries_mutex_);
        auto it = entries_.find(grant.key);
        if (it == entries_.end()) {
            return false;
        }
        entry = it->second;
    }

    std::lock_guard lock(entry->mutex);
    if (entry->retired || entry->window_id != grant.window || entry->count == 0 ||
        std::chrono::steady_clock::now() >= entry->window_reset) {
        return false;
    }
    --entry->count;
    if (!entry->queue.empty()) {
        admit_front_locked(*entry);
    }
    return true;
}

void RateLimiter::roll_window_locked(Entry& entry, std::chrono::steady_clock::time_point now) {
    entry.count = 0;
    ++entry.window_id;
    entry.window_reset = now + entry.policy.window;
    entry.reset_time = std::chrono::system_clock::now() + entry.policy.window;

    while (!entry.queue.empty() && entry.count < entry.policy.max_requests) {
        admit_front_locked(entry);
    }
}

void RateLimiter::admit_front_locked(Entry& entry) {
    auto waiter = std::move(entry.queue.front());
    entry.queue.pop_front();
    --queued_;
    ++entry.count;
    waiter->admitted = true;
    waiter->window = entry.window_id;
    waiter->cv.notify_one();
}

std::shared_ptr<RateLimiter::Entry> RateLimiter::entry_for(const std::string& key,
                                                          const RateLimitPolicy& policy) {
    std::lock_guard lock(entries_mutex_);
    auto& entry = entries_[key];
    if (!entry) {
        // window_reset defaults to the epoch, so the first acquire opens a window
        entry = std::make_shared<Entry>();
        entry->policy = policy;
    }
    return entry;
}

std::optional<RateLimitStatus> RateLimiter::status(const std::string& key) const {
    std::lock_guard map_lock(entries_mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }

    auto& entry = *it->second;
    std::lock_guard entry_lock(entry.mutex);
    RateLimitStatus status;
    bool expired = std::chrono::steady_clock::now() >= entry.window_reset;
    status.count = expired ? 0 : entry.count;
    status.remaining = entry.policy.max_requests > status.count ? entry.policy.max_requests - status.count : 0;
    status.reset_time = entry.reset_time;
    status.queue_length = entry.queue.size();
    return status;
}

RateLimiterStats RateLimiter::stats() const {
    RateLimiterStats stats;
    std::vector<std::pair<std::string, uint32_t>> counts;
    {
        std::lock_guard map_lock(entries_mutex_);
        for (const auto& [key, entry] : entries_) {
            std::lock_guard entry_lock(entry->mutex);
            stats.total_queued += entry->queue.size();
            counts.emplace_back(key, entry->count);
        }
        stats.total_keys = entries_.size();
    }

    if (stats.total_keys > 0) {
        stats.average_queue_length = static_cast<double>(stats.total_queued) /
                                     static_cast<double>(stats.total_keys);
    }

    std::sort(counts.begin(), counts.end(), [](const auto& a, const auto& b) {
        return a.second > b.second;
    });
    if (counts.size() > 10) {
        counts.resize(10);
    }
    stats.top_keys = std::move(counts);
    return stats;
}

void RateLimiter::start_cleanup() {
    if (cleanup_thread_.joinable()) {
        return;
    }
    cleanup_thread_ = std::jthread([this](std::stop_token stop_token) {
        cleanup_loop(stop_token);
    });
}

void RateLimiter::stop() {
    if (cleanup_thread_.joinable()) {
        cleanup_thread_.request_stop();
        cleanup_thread_.join();
    }
}

size_t RateLimiter::cleanup() {
    auto now = std::chrono::steady_clock::now();
    size_t removed = 0;

    std::lock_guard map_lock(entries_mutex_);
    for (auto it = entries_.begin(); it != entries_.end();) {
        auto& entry = *it->second;
        std::lock_guard entry_lock(entry.mutex);
        if (now >= entry.window_reset && entry.queue.empty()) {
            entry.retired = true;
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        Logger::debug(Logger::Component::RateLimit,
            fmt::format("Cleaned up {} expired rate limit entries", removed));
    }
    return removed;
}

void RateLimiter::cleanup_loop(std::stop_token stop_token) {
    Logger::info(Logger::Component::RateLimit,
        fmt::format("Rate limit cleanup started (interval {}ms)", cleanup_interval_.count()));

    while (!stop_token.stop_requested()) {
        std::unique_lock lock(wait_mutex_);
        wait_cv_.wait_for(lock, stop_token, cleanup_interval_, [] { return false; });
        lock.unlock();
        if (stop_token.stop_requested()) {
            break;
        }
        cleanup();
    }

    Logger::info(Logger::Component::RateLimit, "Rate limit cleanup stopped");
}

} // namespace meshgate
