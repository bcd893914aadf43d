#include "meshgate/circuit_breaker.hpp"
#include "meshgate/logger.hpp"

namespace meshgate {

CircuitBreaker::CircuitBreaker(std::string name, CircuitBreakerConfig config, BreakerObserver observer)
    : name_(std::move(name)), config_(config), observer_(std::move(observer)) {
    Logger::info(Logger::Component::Breaker,
        fmt::format("Circuit breaker initialized for {} (failures={}, recovery={}ms, successes={}, timeout={}ms)",
                    name_, config_.failure_threshold, config_.recovery_timeout.count(),
                    config_.success_threshold, config_.timeout.count()));
}

bool CircuitBreaker::can_execute() const {
    std::lock_guard lock(mutex_);
    switch (state_) {
        case CircuitState::Closed:
            return true;
        case CircuitState::HalfOpen:
            return !probe_in_flight_;
        case CircuitState::Open:
            return std::chrono::steady_clock::now() >= next_attempt_;
    }
    return false;
}

CircuitState CircuitBreaker::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

CircuitBreakerStats CircuitBreaker::stats() const {
    std::lock_guard lock(mutex_);
    CircuitBreakerStats stats;
    stats.state = state_;
    stats.failure_count = failure_count_;
    stats.success_count = success_count_;
    stats.last_failure_time = last_failure_time_;
    stats.last_success_time = last_success_time_;
    if (state_ == CircuitState::Open) {
        auto remaining = next_attempt_ - std::chrono::steady_clock::now();
        stats.next_attempt_time = std::chrono::system_clock::now() +
            std::chrono::duration_cast<std::chrono::system_clock::duration>(remaining);
    }
    stats.total_requests = total_requests_;
    stats.total_failures = total_failures_;
    stats.total_successes = total_successes_;
    stats.total_rejections = total_rejections_;
    return stats;
}

void CircuitBreaker::reset() {
    std::vector<BreakerEvent> events;
    {
        std::lock_guard lock(mutex_);
        failure_count_ = 0;
        success_count_ = 0;
        probe_in_flight_ = false;
        last_failure_steady_.reset();
        next_attempt_ = std::chrono::steady_clock::now();
        ++generation_;
        transition_locked(CircuitState::Closed, events);
    }
    Logger::info(Logger::Component::Breaker,
        fmt::format("Circuit breaker manually reset for {}", name_));
    emit(events);
}

std::expected<CircuitBreaker::Admission, Error> CircuitBreaker::admit() {
    std::vector<BreakerEvent> events;
    std::optional<Error> rejection;
    Admission admission;
    {
        std::lock_guard lock(mutex_);
        ++total_requests_;

        if (state_ == CircuitState::Open) {
            if (std::chrono::steady_clock::now() < next_attempt_) {
                rejection.emplace(ErrorCode::CircuitOpen,
                    fmt::format("Circuit breaker is OPEN for {}", name_));
            } else {
                success_count_ = 0;
                probe_in_flight_ = true;
                admission.probe = true;
                transition_locked(CircuitState::HalfOpen, events);
                Logger::info(Logger::Component::Breaker,
                    fmt::format("Circuit breaker transitioning to HALF_OPEN for {}", name_));
            }
        } else if (state_ == CircuitState::HalfOpen) {
            if (probe_in_flight_) {
                rejection.emplace(ErrorCode::CircuitOpen,
                    fmt::format("Circuit breaker for {} is HALF_OPEN with a probe in flight", name_));
            } else {
                probe_in_flight_ = true;
                admission.probe = true;
            }
        }

        if (rejection) {
            ++total_rejections_;
            events.push_back({BreakerEvent::Kind::RequestRejected, name_, state_, rejection->message});
        }
        admission.generation = generation_;
    }
    emit(events);
    if (rejection) {
        return std::unexpected(std::move(*rejection));
    }
    return admission;
}

void CircuitBreaker::on_success(const Admission& admission) {
    std::vector<BreakerEvent> events;
    {
        std::lock_guard lock(mutex_);
        ++total_successes_;
        last_success_time_ = std::chrono::system_clock::now();

        if (admission.generation != generation_) {
            Logger::debug(Logger::Component::Breaker,
                fmt::format("Late success for {} admitted before the last state change", name_));
        } else {
            failure_count_ = 0;
            if (admission.probe) {
                probe_in_flight_ = false;
                ++success_count_;
                if (success_count_ >= config_.success_threshold) {
                    success_count_ = 0;
                    transition_locked(CircuitState::Closed, events);
                    Logger::info(Logger::Component::Breaker,
                        fmt::format("Circuit breaker CLOSED for {}", name_));
                }
            }
        }
        events.push_back({BreakerEvent::Kind::RequestSucceeded, name_, state_, {}});
    }
    emit(events);
}

void CircuitBreaker::on_failure(const Admission& admission, const Error& error) {
    std::vector<BreakerEvent> events;
    {
        std::lock_guard lock(mutex_);
        auto now = std::chrono::steady_clock::now();
        ++total_failures_;
        last_failure_time_ = std::chrono::system_clock::now();

        if (admission.generation != generation_) {
            Logger::debug(Logger::Component::Breaker,
                fmt::format("Late failure for {} admitted before the last state change: {}",
                            name_, error.message));
            events.push_back({BreakerEvent::Kind::RequestFailed, name_, state_, error.message});
        } else {
            if (state_ == CircuitState::Closed && last_failure_steady_ &&
                now - *last_failure_steady_ > config_.monitoring_period) {
                failure_count_ = 0;
            }
            last_failure_steady_ = now;
            ++failure_count_;

            Logger::warn(Logger::Component::Breaker,
                fmt::format("Circuit breaker recorded failure for {} ({}/{}): {}",
                            name_, failure_count_, config_.failure_threshold, error.message));

            if (admission.probe) {
                probe_in_flight_ = false;
                next_attempt_ = now + config_.recovery_timeout;
                transition_locked(CircuitState::Open, events);
                Logger::warn(Logger::Component::Breaker,
                    fmt::format("Circuit breaker OPENED (from half-open) for {}", name_));
            } else if (state_ == CircuitState::Closed && failure_count_ >= config_.failure_threshold) {
                next_attempt_ = now + config_.recovery_timeout;
                transition_locked(CircuitState::Open, events);
                Logger::error(Logger::Component::Breaker,
                    fmt::format("Circuit breaker OPENED for {} after {} failures", name_, failure_count_));
            }
            events.push_back({BreakerEvent::Kind::RequestFailed, name_, state_, error.message});
        }
    }
    emit(events);
}

void CircuitBreaker::transition_locked(CircuitState next, std::vector<BreakerEvent>& events) {
    if (state_ == next) {
        return;
    }
    state_ = next;
    ++generation_;
    events.push_back({BreakerEvent::Kind::StateChanged, name_, state_, {}});
}

void CircuitBreaker::emit(const std::vector<BreakerEvent>& events) const {
    if (!observer_) {
        return;
    }
    for (const auto& event : events) {
        observer_(event);
    }
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::get(const std::string& name,
                                                            const CircuitBreakerConfig& config) {
    {
        std::shared_lock lock(breakers_mutex_);
        auto it = breakers_.find(name);
        if (it != breakers_.end()) {
            return it->second;
        }
    }

    std::unique_lock lock(breakers_mutex_);
    auto [it, inserted] = breakers_.try_emplace(name, nullptr);
    if (inserted) {
        it->second = std::make_shared<CircuitBreaker>(name, config,
            [this](const BreakerEvent& event) { dispatch(event); });
    }
    return it->second;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::find(const std::string& name) const {
    std::shared_lock lock(breakers_mutex_);
    auto it = breakers_.find(name);
    return it != breakers_.end() ? it->second : nullptr;
}

std::map<std::string, CircuitBreakerStats> CircuitBreakerRegistry::all_stats() const {
    std::shared_lock lock(breakers_mutex_);
    std::map<std::string, CircuitBreakerStats> stats;
    for (const auto& [name, breaker] : breakers_) {
        stats.emplace(name, breaker->stats());
    }
    return stats;
}

void CircuitBreakerRegistry::reset_all() {
    std::vector<std::shared_ptr<CircuitBreaker>> breakers;
    {
        std::shared_lock lock(breakers_mutex_);
        for (const auto& [name, breaker] : breakers_) {
            breakers.push_back(breaker);
        }
    }
    for (const auto& breaker : breakers) {
        breaker->reset();
    }
    Logger::info(Logger::Component::Breaker, "All circuit breakers reset");
}

bool CircuitBreakerRegistry::remove(const std::string& name) {
    std::unique_lock lock(breakers_mutex_);
    bool removed = breakers_.erase(name) > 0;
    if (removed) {
        Logger::info(Logger::Component::Breaker, fmt::format("Circuit breaker removed for {}", name));
    }
    return removed;
}

size_t CircuitBreakerRegistry::size() const {
    std::shared_lock lock(breakers_mutex_);
    return breakers_.size();
}

size_t CircuitBreakerRegistry::subscribe(BreakerObserver observer) {
    std::lock_guard lock(observers_mutex_);
    size_t id = next_subscription_++;
    observers_.emplace(id, std::move(observer));
    return id;
}

void CircuitBreakerRegistry::unsubscribe(size_t subscription) {
    std::lock_guard lock(observers_mutex_);
    observers_.erase(subscription);
}

void CircuitBreakerRegistry::dispatch(const BreakerEvent& event) const {
    std::vector<BreakerObserver> observers;
    {
        std::lock_guard lock(observers_mutex_);
        for (const auto& [id, observer] : observers_) {
            observers.push_back(observer);
        }
    }
    for (const auto& observer : observers) {
        observer(event);
    }
}

} // namespace meshgate
