#include "meshgate/admin_api.hpp"
#include "meshgate/logger.hpp"
#include "meshgate/response_body.hpp"
#include <httplib.h>
#include <spdlog/fmt/fmt.h>
#include <sstream>

using json = nlohmann::json;

namespace meshgate {

namespace {

json optional_time(const std::optional<std::chrono::system_clock::time_point>& time) {
    return time ? json(format_timestamp(*time)) : json(nullptr);
}

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> segments;
    std::stringstream stream(path);
    std::string segment;
    while (std::getline(stream, segment, '/')) {
        if (!segment.empty()) {
            segments.push_back(segment);
        }
    }
    return segments;
}

} // namespace

void to_json(json& j, const ServiceInstance& instance) {
    j = json{
        {"id", instance.id},
        {"name", instance.name},
        {"version", instance.version},
        {"host", instance.host},
        {"port", instance.port},
        {"protocol", to_string(instance.protocol)},
        {"healthEndpoint", instance.health_endpoint},
        {"tags", instance.tags},
        {"dependencies", instance.dependencies},
        {"metadata", instance.metadata},
        {"status", to_string(instance.status)},
        {"registeredAt", format_timestamp(instance.registered_at)},
        {"lastHealthCheck", format_timestamp(instance.last_health_check)}
    };
}

void to_json(json& j, const ServiceHealthSummary& summary) {
    j = json{{"healthy", summary.healthy}, {"unhealthy", summary.unhealthy}, {"total", summary.total}};
}

void to_json(json& j, const RegistryStats& stats) {
    j = json{
        {"totalInstances", stats.total_instances},
        {"healthyInstances", stats.healthy_instances},
        {"unhealthyInstances", stats.unhealthy_instances},
        {"instancesByService", stats.instances_by_service}
    };
}

void to_json(json& j, const CircuitBreakerStats& stats) {
    j = json{
        {"state", to_string(stats.state)},
        {"failureCount", stats.failure_count},
        {"successCount", stats.success_count},
        {"lastFailureTime", optional_time(stats.last_failure_time)},
        {"lastSuccessTime", optional_time(stats.last_success_time)},
        {"nextAttemptTime", optional_time(stats.next_attempt_time)},
        {"totalRequests", stats.total_requests},
        {"totalFailures", stats.total_failures},
        {"totalSuccesses", stats.total_successes},
        {"totalRejections", stats.total_rejections}
    };
}

void to_json(json& j, const InstanceMetrics& metrics) {
    j = json{
        {"activeConnections", metrics.active_connections},
        {"totalRequests", metrics.total_requests},
        {"averageResponseTime", metrics.average_response_time},
        {"errorRate", metrics.error_rate},
        {"lastRequestTime", format_timestamp(metrics.last_request_time)},
        {"weight", metrics.weight}
    };
}

void to_json(json& j, const LoadBalancerStats& stats) {
    j = json{
        {"strategy", to_string(stats.strategy)},
        {"totalInstances", stats.total_instances},
        {"totalRequests", stats.total_requests},
        {"averageResponseTime", stats.average_response_time},
        {"instances", stats.instances}
    };
}

void to_json(json& j, const RateLimitStatus& status) {
    j = json{
        {"count", status.count},
        {"remaining", status.remaining},
        {"resetTime", format_timestamp(status.reset_time)},
        {"queueLength", status.queue_length}
    };
}

void to_json(json& j, const RateLimiterStats& stats) {
    json top = json::array();
    for (const auto& [key, count] : stats.top_keys) {
        top.push_back({{"key", key}, {"count", count}});
    }
    j = json{
        {"totalKeys", stats.total_keys},
        {"totalQueued", stats.total_queued},
        {"averageQueueLength", stats.average_queue_length},
        {"topKeys", top}
    };
}

void to_json(json& j, const HealthReport& report) {
    j = json{{"status", to_string(report.status)}, {"dependencies", report.dependencies}};
    if (report.version) j["version"] = *report.version;
    if (report.uptime) j["uptime"] = *report.uptime;
    if (report.memory) {
        j["memory"] = {{"used", report.memory->used}, {"total", report.memory->total},
                       {"percentage", report.memory->percentage}};
    }
    if (report.cpu_usage) j["cpu"] = {{"usage", *report.cpu_usage}};
    if (!report.custom_metrics.is_null()) j["customMetrics"] = report.custom_metrics;
}

void to_json(json& j, const HealthCheckResult& result) {
    j = json{
        {"service", result.service},
        {"instanceId", result.instance_id},
        {"status", to_string(result.status)},
        {"timestamp", format_timestamp(result.timestamp)},
        {"responseTime", result.response_time.count()}
    };
    if (result.details) j["details"] = *result.details;
    if (result.error) j["error"] = *result.error;
}

void to_json(json& j, const SystemHealth& health) {
    j = json{
        {"overall", to_string(health.overall)},
        {"services", health.services},
        {"timestamp", format_timestamp(health.timestamp)},
        {"summary", {
            {"total", health.total},
            {"healthy", health.healthy},
            {"unhealthy", health.unhealthy},
            {"degraded", health.degraded}
        }}
    };
}

void to_json(json& j, const RouteConfig& route) {
    j = json{
        {"method", route.method},
        {"path", route.path},
        {"serviceName", route.service_name},
        {"targetPath", route.target_path.empty() ? route.path : route.target_path},
        {"tags", route.tags},
        {"timeout", route.timeout.count()},
        {"retries", route.retries}
    };
    if (route.rate_limit) {
        j["rateLimit"] = {
            {"windowMs", route.rate_limit->policy.window.count()},
            {"max", route.rate_limit->policy.max_requests}
        };
    }
}

void to_json(json& j, const GatewayStats& stats) {
    j = json{
        {"totalRoutes", stats.total_routes},
        {"registeredServices", stats.registered_services},
        {"totalRequests", stats.total_requests},
        {"failedRequests", stats.failed_requests},
        {"loadBalancerStats", stats.load_balancer},
        {"circuitBreakerStats", stats.circuit_breakers}
    };
}

void to_json(json& j, const ServiceStatus& status) {
    j = json{
        {"name", status.name},
        {"status", to_string(status.lifecycle)},
        {"health", status.health ? json(to_string(*status.health)) : json(nullptr)},
        {"dependencies", status.dependencies},
        {"startedAt", optional_time(status.started_at)},
        {"stoppedAt", optional_time(status.stopped_at)}
    };
    if (status.error) j["error"] = *status.error;
}

void to_json(json& j, const ServiceManagerStats& stats) {
    j = json{
        {"totalServices", stats.total_services},
        {"runningServices", stats.running_services},
        {"failedServices", stats.failed_services},
        {"serviceStatuses", stats.statuses}
    };
}

AdminApi::AdminApi(ServiceRegistry& registry,
                   CircuitBreakerRegistry& breakers,
                   LoadBalancer& load_balancer,
                   RateLimiter& rate_limiter,
                   HealthChecker& health_checker,
                   Gateway& gateway,
                   ServiceManager& manager)
    : registry_(registry),
      breakers_(breakers),
      load_balancer_(load_balancer),
      rate_limiter_(rate_limiter),
      health_checker_(health_checker),
      gateway_(gateway),
      manager_(manager) {}

std::optional<AdminResponse> AdminApi::handle(const std::string& method, const std::string& path,
                                              const QueryMap& query) {
    auto segments = split_path(path);
    if (segments.empty() || segments[0] != "admin") {
        return std::nullopt;
    }
    segments.erase(segments.begin());
    if (segments.empty()) {
        return not_found(path);
    }

    const auto& resource = segments[0];
    const bool get = method == "GET";

    if (resource == "services" && get) {
        if (segments.size() == 1) {
            return AdminResponse{200, json(registry_.all_services())};
        }
        const auto& name = segments[1];
        if (segments.size() == 2) {
            return AdminResponse{200, {{"name", name}, {"instances", registry_.instances(name)},
                                       {"health", registry_.service_health(name)}}};
        }
        if (segments.size() == 3 && segments[2] == "health") {
            return AdminResponse{200, json(registry_.service_health(name))};
        }
    }

    if (resource == "registry" && get && segments.size() == 2 && segments[1] == "stats") {
        return AdminResponse{200, json(registry_.stats())};
    }

    if (resource == "breakers") {
        if (get && segments.size() == 1) {
            return AdminResponse{200, json(breakers_.all_stats())};
        }
        if (method == "POST" && segments.size() == 2 && segments[1] == "reset") {
            breakers_.reset_all();
            Logger::info(Logger::Component::Admin, "All circuit breakers reset");
            return AdminResponse{200, {{"reset", breakers_.size()}}};
        }
        if (method == "POST" && segments.size() == 3 && segments[2] == "reset") {
            auto breaker = breakers_.find(segments[1]);
            if (!breaker) {
                return not_found(path);
            }
            breaker->reset();
            Logger::info(Logger::Component::Admin, fmt::format("Circuit breaker {} reset", segments[1]));
            return AdminResponse{200, {{"reset", segments[1]}}};
        }
    }

    if (resource == "load-balancer") {
        if (get && segments.size() == 1) {
            return AdminResponse{200, json(load_balancer_.stats())};
        }
        if ((method == "PUT" || method == "POST") && segments.size() == 2 && segments[1] == "strategy") {
            auto it = query.find("strategy");
            auto strategy = it != query.end() ? strategy_from_string(it->second) : std::nullopt;
            if (!strategy) {
                return AdminResponse{400, {{"error", "Unknown or missing strategy"}}};
            }
            load_balancer_.set_strategy(*strategy);
            return AdminResponse{200, {{"strategy", to_string(*strategy)}}};
        }
    }

    if (resource == "rate-limit" && get) {
        if (segments.size() == 1) {
            return AdminResponse{200, json(rate_limiter_.stats())};
        }
        if (segments.size() == 2) {
            auto status = rate_limiter_.status(segments[1]);
            if (!status) {
                return not_found(path);
            }
            return AdminResponse{200, json(*status)};
        }
    }

    if (resource == "routes" && get && segments.size() == 1) {
        return AdminResponse{200, json(gateway_.routes())};
    }
    if (resource == "gateway" && get && segments.size() == 1) {
        return AdminResponse{200, json(gateway_.stats())};
    }
    if (resource == "manager" && get && segments.size() == 1) {
        return AdminResponse{200, json(manager_.stats())};
    }
    if (resource == "health" && get && segments.size() == 1) {
        auto health = health_checker_.system_health();
        int status = health.overall == HealthState::Unhealthy ? 503 : 200;
        return AdminResponse{status, json(health)};
    }

    return not_found(path);
}

AdminResponse AdminApi::not_found(const std::string& path) const {
    return AdminResponse{404, {{"error", "Not found"}, {"path", path}}};
}

void AdminApi::mount(httplib::Server& server) {
    auto handler = [this](const httplib::Request& req, httplib::Response& res) {
        QueryMap query;
        for (const auto& [key, value] : req.params) {
            query.emplace(key, value);
        }
        auto response = handle(req.method, req.path, query);
        if (!response) {
            response = not_found(req.path);
        }
        Logger::debug(Logger::Component::Admin,
            fmt::format("{} {} -> {}", req.method, req.path, response->status));
        res.status = response->status;
        res.set_content(response->body.dump(2), "application/json");
    };

    server.Get(R"(/admin/.*)", handler);
    server.Post(R"(/admin/.*)", handler);
    server.Put(R"(/admin/.*)", handler);
}

} // namespace meshgate
