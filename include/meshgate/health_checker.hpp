#pragma once

#include "meshgate/circuit_breaker.hpp"
#include "meshgate/http_client.hpp"
#include "meshgate/service_registry.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <condition_variable>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace meshgate {

enum class HealthState {
    Healthy,
    Unhealthy,
    Degraded
};

inline std::string to_string(HealthState state) {
    switch (state) {
        case HealthState::Healthy: return "healthy";
        case HealthState::Unhealthy: return "unhealthy";
        case HealthState::Degraded: return "degraded";
        default: return "unhealthy";
    }
}

struct MemoryUsage {
    double used = 0;
    double total = 0;
    double percentage = 0;
};

// Parsed body of a health endpoint
struct HealthReport {
    HealthState status = HealthState::Healthy;
    std::optional<std::string> version;
    std::optional<double> uptime;
    std::optional<MemoryUsage> memory;
    std::optional<double> cpu_usage;
    std::map<std::string, bool> dependencies;
    nlohmann::json custom_metrics;
};

struct HealthCheckResult {
    std::string service;
    std::string instance_id;
    HealthState status = HealthState::Unhealthy;
    std::chrono::system_clock::time_point timestamp{};
    std::chrono::milliseconds response_time{0};
    std::optional<HealthReport> details;
    std::optional<std::string> error;
};

struct SystemHealth {
    HealthState overall = HealthState::Healthy;
    std::vector<HealthCheckResult> services;
    std::chrono::system_clock::time_point timestamp{};
    size_t total = 0;
    size_t healthy = 0;
    size_t unhealthy = 0;
    size_t degraded = 0;
};

struct HealthCheckConfig {
    std::chrono::milliseconds interval{30000};
    std::chrono::milliseconds timeout{5000};
    // Settings for the per-instance "health-check-<name>-<id>" breakers
    uint32_t breaker_failure_threshold = 3;
    std::chrono::milliseconds breaker_recovery_timeout{30000};
};

using HealthObserver = std::function<void(const HealthCheckResult&)>;

// Periodically probes every registered instance and feeds the outcome back into the
// registry. Newly registered instances are probed as part of registration.
class HealthChecker {
public:
    HealthChecker(ServiceRegistry& registry,
                  CircuitBreakerRegistry& breakers,
                  std::shared_ptr<HttpClient> client,
                  const HealthCheckConfig& config = {});

    ~HealthChecker();

    HealthChecker(const HealthChecker&) = delete;
    HealthChecker& operator=(const HealthChecker&) = delete;

    // Start health checking in background thread
    void start();

    // Stop health checking gracefully
    void stop();

    // Probe every registered instance concurrently and wait for all of them
    void run_cycle();

    // Breaker-guarded probe of one instance; updates the registry and stored result
    HealthCheckResult check_instance(const ServiceInstance& instance);

    // Raw probe without breaker or registry side effects
    std::expected<HealthReport, Error> probe(const ServiceInstance& instance) const;

    // One breaker per instance so a dead sibling never short-circuits a live one
    static std::string breaker_name(const std::string& service_name, const std::string& instance_id);

    // Derives the detailed status from a health endpoint body
    static HealthState determine_health(const nlohmann::json& body);

    std::optional<HealthCheckResult> result(const std::string& instance_id) const;
    SystemHealth system_health() const;
    void clear_results();

    size_t subscribe(HealthObserver observer);
    void unsubscribe(size_t subscription);

    const HealthCheckConfig& config() const { return config_; }

private:
    void health_check_loop(std::stop_token stop_token);
    void publish(const HealthCheckResult& result) const;

    static std::expected<HealthReport, Error> probe_with(HttpClient& client,
                                                         const ServiceInstance& instance,
                                                         std::chrono::milliseconds timeout,
                                                         std::stop_token token);

    ServiceRegistry& registry_;
    CircuitBreakerRegistry& breakers_;
    std::shared_ptr<HttpClient> client_;
    HealthCheckConfig config_;
    size_t registry_subscription_ = 0;

    std::unordered_map<std::string, HealthCheckResult> results_;
    mutable std::mutex results_mutex_;

    std::map<size_t, HealthObserver> observers_;
    size_t next_subscription_ = 1;
    mutable std::mutex observers_mutex_;

    std::mutex wait_mutex_;
    std::condition_variable_any wait_cv_;
    std::jthread health_check_thread_;
};

} // namespace meshgate
