#pragma once

#include "meshgate/api_gateway.hpp"
#include "meshgate/circuit_breaker.hpp"
#include "meshgate/health_checker.hpp"
#include "meshgate/load_balancer.hpp"
#include "meshgate/rate_limiter.hpp"
#include "meshgate/service_manager.hpp"
#include "meshgate/service_registry.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace httplib {
class Server;
}

namespace meshgate {

void to_json(nlohmann::json& j, const ServiceInstance& instance);
void to_json(nlohmann::json& j, const ServiceHealthSummary& summary);
void to_json(nlohmann::json& j, const RegistryStats& stats);
void to_json(nlohmann::json& j, const CircuitBreakerStats& stats);
void to_json(nlohmann::json& j, const InstanceMetrics& metrics);
void to_json(nlohmann::json& j, const LoadBalancerStats& stats);
void to_json(nlohmann::json& j, const RateLimitStatus& status);
void to_json(nlohmann::json& j, const RateLimiterStats& stats);
void to_json(nlohmann::json& j, const HealthReport& report);
void to_json(nlohmann::json& j, const HealthCheckResult& result);
void to_json(nlohmann::json& j, const SystemHealth& health);
void to_json(nlohmann::json& j, const RouteConfig& route);
void to_json(nlohmann::json& j, const GatewayStats& stats);
void to_json(nlohmann::json& j, const ServiceStatus& status);
void to_json(nlohmann::json& j, const ServiceManagerStats& stats);

struct AdminResponse {
    int status = 200;
    nlohmann::json body;
};

// Read-only snapshots (plus breaker resets and strategy changes) under /admin/
class AdminApi {
public:
    AdminApi(ServiceRegistry& registry,
             CircuitBreakerRegistry& breakers,
             LoadBalancer& load_balancer,
             RateLimiter& rate_limiter,
             HealthChecker& health_checker,
             Gateway& gateway,
             ServiceManager& manager);

    // Returns nothing for paths outside /admin/
    std::optional<AdminResponse> handle(const std::string& method, const std::string& path,
                                        const QueryMap& query = {});

    void mount(httplib::Server& server);

private:
    AdminResponse not_found(const std::string& path) const;

    ServiceRegistry& registry_;
    CircuitBreakerRegistry& breakers_;
    LoadBalancer& load_balancer_;
    RateLimiter& rate_limiter_;
    HealthChecker& health_checker_;
    Gateway& gateway_;
    ServiceManager& manager_;
};

} // namespace meshgate
