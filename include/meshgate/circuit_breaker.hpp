#pragma once

#include "meshgate/error.hpp"
#include <spdlog/fmt/fmt.h>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace meshgate {

enum class CircuitState {
    Closed,
    Open,
    HalfOpen
};

inline std::string to_string(CircuitState state) {
    switch (state) {
        case CircuitState::Closed: return "CLOSED";
        case CircuitState::Open: return "OPEN";
        case CircuitState::HalfOpen: return "HALF_OPEN";
        default: return "UNKNOWN";
    }
}

struct CircuitBreakerConfig {
    uint32_t failure_threshold = 5;
    std::chrono::milliseconds recovery_timeout{60000};
    uint32_t success_threshold = 3;
    // Upper bound for a single wrapped call
    std::chrono::milliseconds timeout{30000};
    // A failure this long after the previous one starts a new failure streak
    std::chrono::milliseconds monitoring_period{300000};
};

struct CircuitBreakerStats {
    CircuitState state = CircuitState::Closed;
    uint32_t failure_count = 0;
    uint32_t success_count = 0;
    std::optional<std::chrono::system_clock::time_point> last_failure_time;
    std::optional<std::chrono::system_clock::time_point> last_success_time;
    std::optional<std::chrono::system_clock::time_point> next_attempt_time;
    uint64_t total_requests = 0;
    uint64_t total_failures = 0;
    uint64_t total_successes = 0;
    uint64_t total_rejections = 0;
};

struct BreakerEvent {
    enum class Kind {
        StateChanged,
        RequestSucceeded,
        RequestFailed,
        RequestRejected
    };

    Kind kind;
    std::string breaker;
    CircuitState state;
    std::string error;
};

using BreakerObserver = std::function<void(const BreakerEvent&)>;

// A call guarded by a breaker. It runs on its own thread and may outlive the caller once
// the timeout fires, so it must own (or share) everything it touches. The stop token is
// triggered at the timeout boundary.
template <typename T>
using Operation = std::function<std::expected<T, Error>(std::stop_token)>;

// CLOSED -> OPEN after failure_threshold failures, OPEN -> HALF_OPEN on the first call
// past next_attempt, then success_threshold probe successes close it again.
// One probe at a time while HALF_OPEN.
class CircuitBreaker {
public:
    explicit CircuitBreaker(std::string name, CircuitBreakerConfig config = {},
                            BreakerObserver observer = {});

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    template <typename T>
    std::expected<T, Error> execute(Operation<T> op) {
        return execute<T>(std::move(op), config_.timeout);
    }

    // Same, with a call-specific timeout in place of config().timeout
    template <typename T>
    std::expected<T, Error> execute(Operation<T> op, std::chrono::milliseconds timeout);

    // True when a call made now would be let through
    bool can_execute() const;

    CircuitState state() const;
    CircuitBreakerStats stats() const;

    // Administrative override: CLOSED with zeroed counters
    void reset();

    const std::string& name() const { return name_; }
    const CircuitBreakerConfig& config() const { return config_; }

private:
    // Which state transition a call was let through under
    struct Admission {
        uint64_t generation = 0;
        bool probe = false;
    };

    std::expected<Admission, Error> admit();
    void on_success(const Admission& admission);
    void on_failure(const Admission& admission, const Error& error);
    void transition_locked(CircuitState next, std::vector<BreakerEvent>& events);
    void emit(const std::vector<BreakerEvent>& events) const;

    template <typename T>
    static std::expected<T, Error> run_with_timeout(Operation<T> op, std::chrono::milliseconds timeout);

    const std::string name_;
    const CircuitBreakerConfig config_;
    BreakerObserver observer_;

    mutable std::mutex mutex_;
    CircuitState state_ = CircuitState::Closed;
    uint32_t failure_count_ = 0;
    uint32_t success_count_ = 0;
    bool probe_in_flight_ = false;
    // Bumped on every state change; outcomes from older generations leave the state alone
    uint64_t generation_ = 0;
    std::chrono::steady_clock::time_point next_attempt_{};
    std::optional<std::chrono::steady_clock::time_point> last_failure_steady_;
    std::optional<std::chrono::system_clock::time_point> last_failure_time_;
    std::optional<std::chrono::system_clock::time_point> last_success_time_;
    uint64_t total_requests_ = 0;
    uint64_t total_failures_ = 0;
    uint64_t total_successes_ = 0;
    uint64_t total_rejections_ = 0;
};

template <typename T>
std::expected<T, Error> CircuitBreaker::execute(Operation<T> op, std::chrono::milliseconds timeout) {
    auto admission = admit();
    if (!admission) {
        return std::unexpected(std::move(admission.error()));
    }

    auto result = run_with_timeout<T>(std::move(op), timeout);
    if (result) {
        on_success(*admission);
    } else {
        on_failure(*admission, result.error());
    }
    return result;
}

template <typename T>
std::expected<T, Error> CircuitBreaker::run_with_timeout(Operation<T> op,
                                                         std::chrono::milliseconds timeout) {
    struct Outcome {
        std::mutex mutex;
        std::condition_variable cv;
        std::optional<std::expected<T, Error>> result;
    };
    auto outcome = std::make_shared<Outcome>();

    std::jthread worker([outcome, op = std::move(op)](std::stop_token token) {
        std::optional<std::expected<T, Error>> result;
        try {
            result.emplace(op(token));
        } catch (const std::exception& e) {
            result.emplace(std::unexpected(Error{ErrorCode::Upstream, e.what()}));
        }
        std::lock_guard lock(outcome->mutex);
        outcome->result = std::move(result);
        outcome->cv.notify_one();
    });

    std::unique_lock lock(outcome->mutex);
    if (outcome->cv.wait_for(lock, timeout, [&] { return outcome->result.has_value(); })) {
        std::expected<T, Error> result = std::move(*outcome->result);
        lock.unlock();
        return result;
    }
    lock.unlock();

    // Abandon the call: cancel it and let the worker finish on its own.
    worker.request_stop();
    worker.detach();
    return std::unexpected(Error{ErrorCode::Timeout,
        fmt::format("Request timeout after {}ms", timeout.count())});
}

// Get-or-create by name. A breaker keeps the config from its first use, except the
// timeout, which execute() takes from each call's config.
class CircuitBreakerRegistry {
public:
    CircuitBreakerRegistry() = default;

    CircuitBreakerRegistry(const CircuitBreakerRegistry&) = delete;
    CircuitBreakerRegistry& operator=(const CircuitBreakerRegistry&) = delete;

    std::shared_ptr<CircuitBreaker> get(const std::string& name,
                                        const CircuitBreakerConfig& config = {});

    template <typename T>
    std::expected<T, Error> execute(const std::string& name, Operation<T> op,
                                    const CircuitBreakerConfig& config = {}) {
        return get(name, config)->execute<T>(std::move(op), config.timeout);
    }

    std::shared_ptr<CircuitBreaker> find(const std::string& name) const;

    std::map<std::string, CircuitBreakerStats> all_stats() const;

    void reset_all();
    bool remove(const std::string& name);
    size_t size() const;

    size_t subscribe(BreakerObserver observer);
    void unsubscribe(size_t subscription);

private:
    void dispatch(const BreakerEvent& event) const;

    std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
    mutable std::shared_mutex breakers_mutex_;

    std::map<size_t, BreakerObserver> observers_;
    size_t next_subscription_ = 1;
    mutable std::mutex observers_mutex_;
};

} // namespace meshgate
