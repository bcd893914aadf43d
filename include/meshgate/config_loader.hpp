#pragma once

#include "meshgate/circuit_breaker.hpp"
#include "meshgate/health_checker.hpp"
#include "meshgate/load_balancer.hpp"
#include "meshgate/rate_limiter.hpp"
#include "meshgate/service_manager.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace meshgate {

struct GatewaySettings {
    std::string host = "0.0.0.0";
    uint16_t port = 8000;
    std::string log_file = "meshgate.log";
    std::string log_level = "INFO";
    bool admin_enabled = true;
    // Server threads kept free of rate limit waiters; the pool adds one per possible waiter
    size_t worker_threads = 8;
};

struct RateLimiterSettings {
    // Applies per client address to routes without their own rate_limit
    RateLimitPolicy policy;
    bool apply_to_all_routes = true;
    // Waiters across all keys
    size_t max_queued_total = 64;
    std::chrono::milliseconds cleanup_interval{60000};
};

struct Config {
    GatewaySettings gateway;
    HealthCheckConfig health_check;
    // Defaults for the gateway's proxy breakers
    CircuitBreakerConfig circuit_breaker;
    Strategy strategy = Strategy::HealthBased;
    RateLimiterSettings rate_limiter;
    ServiceManagerConfig manager;
    std::vector<ServiceDefinition> services;
};

class ConfigLoader {
public:
    static std::expected<Config, std::string> load(const std::string& config_path);

    static std::expected<Config, std::string> parse_config(const std::string& content);

private:
    static std::expected<ServiceDefinition, std::string> parse_service(const nlohmann::json& j);
    static std::expected<RouteConfig, std::string> parse_route(const nlohmann::json& j);
    static std::expected<void, std::string> validate_config(const Config& config);
};

} // namespace meshgate
