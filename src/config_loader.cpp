#include "meshgate/config_loader.hpp"
#include <fstream>
#include <set>
#include <sstream>

using json = nlohmann::json;

namespace meshgate {

namespace {

std::chrono::milliseconds millis(const json& j, const char* key, int64_t fallback) {
    return std::chrono::milliseconds{j.value(key, fallback)};
}

RateLimitPolicy parse_policy(const json& rl) {
    RateLimitPolicy policy;
    policy.window = millis(rl, "window_ms", 60000);
    policy.max_requests = rl.value("max_requests", 100u);
    policy.queue_size = rl.value("queue_size", size_t{10});
    policy.queue_timeout = millis(rl, "queue_timeout_ms", 30000);
    policy.skip_failed_requests = rl.value("skip_failed_requests", false);
    policy.skip_successful_requests = rl.value("skip_successful_requests", false);
    return policy;
}

} // namespace

std::expected<Config, std::string> ConfigLoader::load(const std::string& config_path) {
    // Try multiple locations for the config file
    std::vector<std::string> search_paths = {
        config_path,                           // Current directory
        "../" + config_path,                   // Parent directory (for build dirs)
        "../../" + config_path                 // Two levels up (for nested builds)
    };

    std::ifstream file;

    for (const auto& path : search_paths) {
        file.open(path);
        if (file.is_open()) {
            break;
        }
        file.clear();
    }

    if (!file.is_open()) {
        return std::unexpected("Failed to open config file: " + config_path +
                             " (searched in: ., .., ../..)");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_config(buffer.str());
}

std::expected<Config, std::string> ConfigLoader::parse_config(const std::string& content) {
    try {
        json j = json::parse(content);
        Config config;

        if (!j.contains("gateway")) {
            return std::unexpected("Missing 'gateway' section");
        }
        const auto& gw = j["gateway"];
        config.gateway.host = gw.value("host", "0.0.0.0");
        config.gateway.port = gw.value("port", 8000);
        config.gateway.log_file = gw.value("log_file", "meshgate.log");
        config.gateway.log_level = gw.value("log_level", "INFO");
        config.gateway.admin_enabled = gw.value("admin_enabled", true);
        config.gateway.worker_threads = gw.value("worker_threads", size_t{8});

        if (j.contains("health_check")) {
            const auto& hc = j["health_check"];
            config.health_check.interval = millis(hc, "interval_ms", 30000);
            config.health_check.timeout = millis(hc, "timeout_ms", 5000);
        }

        if (j.contains("circuit_breaker")) {
            const auto& cb = j["circuit_breaker"];
            config.circuit_breaker.failure_threshold = cb.value("failure_threshold", 5u);
            config.circuit_breaker.recovery_timeout = millis(cb, "recovery_timeout_ms", 60000);
            config.circuit_breaker.success_threshold = cb.value("success_threshold", 3u);
            config.circuit_breaker.timeout = millis(cb, "timeout_ms", 30000);
            config.circuit_breaker.monitoring_period = millis(cb, "monitoring_period_ms", 300000);
        }

        if (j.contains("load_balancer")) {
            std::string name = j["load_balancer"].value("strategy", "health_based");
            auto strategy = strategy_from_string(name);
            if (!strategy) {
                return std::unexpected("Unknown load balancing strategy: " + name);
            }
            config.strategy = *strategy;
        }

        if (j.contains("rate_limiter")) {
            const auto& rl = j["rate_limiter"];
            config.rate_limiter.policy = parse_policy(rl);
            config.rate_limiter.apply_to_all_routes = rl.value("apply_to_all_routes", true);
            config.rate_limiter.max_queued_total = rl.value("max_queued_total", size_t{64});
            config.rate_limiter.cleanup_interval = millis(rl, "cleanup_interval_ms", 60000);
        }

        if (j.contains("service_manager")) {
            config.manager.poll_interval = millis(j["service_manager"], "poll_interval_ms", 2000);
        }

        if (j.contains("services")) {
            if (!j["services"].is_array()) {
                return std::unexpected("'services' must be an array");
            }
            for (const auto& service : j["services"]) {
                auto definition = parse_service(service);
                if (!definition) {
                    return std::unexpected(definition.error());
                }
                config.services.push_back(std::move(*definition));
            }
        }

        if (auto valid = validate_config(config); !valid) {
            return std::unexpected("Configuration validation failed: " + valid.error());
        }

        return config;

    } catch (const json::exception& e) {
        return std::unexpected(std::string("JSON parsing error: ") + e.what());
    }
}

std::expected<ServiceDefinition, std::string> ConfigLoader::parse_service(const json& j) {
    if (!j.is_object() || !j.contains("name")) {
        return std::unexpected("Service entry without a 'name'");
    }

    ServiceDefinition definition;
    definition.name = j["name"].get<std::string>();
    definition.version = j.value("version", "1.0.0");
    definition.host = j.value("host", "localhost");
    definition.port = j.value("port", 0);
    definition.health_endpoint = j.value("health_endpoint", "/health");
    definition.tags = j.value("tags", std::set<std::string>{});
    definition.dependencies = j.value("dependencies", std::vector<std::string>{});
    definition.metadata = j.value("metadata", json::object());
    definition.startup_timeout = millis(j, "startup_timeout_ms", 60000);
    definition.shutdown_timeout = millis(j, "shutdown_timeout_ms", 30000);

    std::string protocol = j.value("protocol", "http");
    auto parsed = protocol_from_string(protocol);
    if (!parsed) {
        return std::unexpected("Unknown protocol '" + protocol + "' for service " + definition.name);
    }
    definition.protocol = *parsed;

    if (j.contains("routes")) {
        for (const auto& route_json : j["routes"]) {
            auto route = parse_route(route_json);
            if (!route) {
                return std::unexpected(route.error() + " (service " + definition.name + ")");
            }
            route->service_name = definition.name;
            definition.routes.push_back(std::move(*route));
        }
    }
    return definition;
}

std::expected<RouteConfig, std::string> ConfigLoader::parse_route(const json& j) {
    if (!j.is_object() || !j.contains("path")) {
        return std::unexpected("Route entry without a 'path'");
    }

    RouteConfig route;
    route.method = j.value("method", "GET");
    route.path = j["path"].get<std::string>();
    route.target_path = j.value("target_path", "");
    route.tags = j.value("tags", std::vector<std::string>{});
    route.timeout = millis(j, "timeout_ms", 30000);
    route.retries = j.value("retries", 0u);

    if (j.contains("rate_limit")) {
        const auto& rl = j["rate_limit"];
        RouteRateLimit limit;
        limit.policy = parse_policy(rl);
        route.rate_limit = limit;
    }
    return route;
}

std::expected<void, std::string> ConfigLoader::validate_config(const Config& config) {
    if (config.gateway.port == 0) {
        return std::unexpected("gateway.port must be set");
    }
    if (config.health_check.interval.count() <= 0 || config.health_check.timeout.count() <= 0) {
        return std::unexpected("health_check intervals must be positive");
    }
    if (config.circuit_breaker.failure_threshold == 0 || config.circuit_breaker.success_threshold == 0) {
        return std::unexpected("circuit_breaker thresholds must be positive");
    }
    if (config.circuit_breaker.recovery_timeout.count() <= 0 || config.circuit_breaker.timeout.count() <= 0) {
        return std::unexpected("circuit_breaker timeouts must be positive");
    }
    if (config.rate_limiter.policy.window.count() <= 0 || config.rate_limiter.policy.max_requests == 0) {
        return std::unexpected("rate_limiter window and max_requests must be positive");
    }
    if (config.gateway.worker_threads == 0 || config.rate_limiter.max_queued_total == 0) {
        return std::unexpected("gateway.worker_threads and rate_limiter.max_queued_total must be positive");
    }
    if (config.manager.poll_interval.count() <= 0) {
        return std::unexpected("service_manager.poll_interval_ms must be positive");
    }

    static const std::set<std::string> methods = {"GET", "POST", "PUT", "DELETE", "PATCH"};
    std::set<std::string> names;
    for (const auto& service : config.services) {
        if (service.name.empty() || !names.insert(service.name).second) {
            return std::unexpected("Duplicate or empty service name: '" + service.name + "'");
        }
        if (service.port == 0) {
            return std::unexpected("Service " + service.name + " has no port");
        }
        for (const auto& route : service.routes) {
            if (!methods.contains(route.method)) {
                return std::unexpected("Unsupported route method " + route.method);
            }
            if (route.path.empty() || route.path.front() != '/') {
                return std::unexpected("Route path must start with '/': " + route.path);
            }
            if (route.timeout.count() <= 0) {
                return std::unexpected("Route timeout must be positive: " + route.path);
            }
            if (route.rate_limit && route.rate_limit->policy.max_requests == 0) {
                return std::unexpected("Route rate limit max_requests must be positive: " + route.path);
            }
        }
    }
    return {};
}

} // namespace meshgate
