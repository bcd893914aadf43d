#pragma once

#include "meshgate/api_gateway.hpp"
#include "meshgate/error.hpp"
#include "meshgate/health_checker.hpp"
#include "meshgate/service_registry.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <expected>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace meshgate {

enum class Lifecycle {
    Starting,
    Running,
    Stopping,
    Stopped,
    Failed
};

inline std::string to_string(Lifecycle lifecycle) {
    switch (lifecycle) {
        case Lifecycle::Starting: return "starting";
        case Lifecycle::Running: return "running";
        case Lifecycle::Stopping: return "stopping";
        case Lifecycle::Stopped: return "stopped";
        case Lifecycle::Failed: return "failed";
        default: return "stopped";
    }
}

struct ServiceDefinition {
    std::string name;
    std::string version;
    std::string host;
    uint16_t port = 0;
    Protocol protocol = Protocol::Http;
    std::string health_endpoint = "/health";
    // A service tagged "critical" aborts start_all_services when it fails to start
    std::set<std::string> tags;
    std::vector<std::string> dependencies;
    nlohmann::json metadata = nlohmann::json::object();
    std::chrono::milliseconds startup_timeout{60000};
    std::chrono::milliseconds shutdown_timeout{30000};
    // Registered with the gateway under this service's name
    std::vector<RouteConfig> routes;
};

struct ServiceStatus {
    std::string name;
    Lifecycle lifecycle = Lifecycle::Stopped;
    std::optional<HealthState> health;
    std::map<std::string, bool> dependencies;
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::chrono::system_clock::time_point> stopped_at;
    std::optional<std::string> error;
};

struct ServiceManagerStats {
    size_t total_services = 0;
    size_t running_services = 0;
    size_t failed_services = 0;
    std::map<std::string, ServiceStatus> statuses;
};

struct ServiceManagerConfig {
    // Delay between startup health probes
    std::chrono::milliseconds poll_interval{2000};
};

// Control plane: owns service definitions and drives their lifecycle against the
// registry, health checker and gateway.
class ServiceManager {
public:
    ServiceManager(ServiceRegistry& registry,
                   HealthChecker& health_checker,
                   Gateway& gateway,
                   ServiceManagerConfig config = {});
    ~ServiceManager();

    ServiceManager(const ServiceManager&) = delete;
    ServiceManager& operator=(const ServiceManager&) = delete;

    void register_service(ServiceDefinition definition);

    // Dependencies before dependents, registration order otherwise.
    // A dependency cycle is a Configuration error.
    std::expected<std::vector<std::string>, Error> calculate_startup_order() const;

    std::expected<void, Error> start_service(const std::string& name);
    std::expected<void, Error> stop_service(const std::string& name);

    std::expected<void, Error> start_all_services();
    void stop_all_services();

    std::optional<ServiceStatus> status(const std::string& name) const;
    std::vector<ServiceStatus> all_statuses() const;
    ServiceManagerStats stats() const;

    bool shutting_down() const { return shutting_down_.load(); }

private:
    std::expected<void, Error> visit(const std::string& name,
                                     std::unordered_set<std::string>& visiting,
                                     std::unordered_set<std::string>& visited,
                                     std::vector<std::string>& order) const;
    std::expected<void, Error> wait_for_health(const ServiceInstance& instance,
                                               std::chrono::milliseconds timeout);
    std::expected<void, Error> fail_start(const std::string& name, Error error);
    std::optional<ServiceDefinition> definition(const std::string& name) const;

    ServiceRegistry& registry_;
    HealthChecker& health_checker_;
    Gateway& gateway_;
    ServiceManagerConfig config_;
    size_t health_subscription_ = 0;
    std::atomic<bool> shutting_down_{false};

    // Registration order drives the startup order among independent services
    std::vector<std::string> order_;
    std::unordered_map<std::string, ServiceDefinition> definitions_;
    std::unordered_map<std::string, ServiceStatus> statuses_;
    mutable std::mutex mutex_;
};

} // namespace meshgate
