#include "meshgate/service_manager.hpp"
#include "meshgate/logger.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <algorithm>
#include <thread>

namespace meshgate {

ServiceManager::ServiceManager(ServiceRegistry& registry,
                               HealthChecker& health_checker,
                               Gateway& gateway,
                               ServiceManagerConfig config)
    : registry_(registry), health_checker_(health_checker), gateway_(gateway), config_(config) {
    health_subscription_ = health_checker_.subscribe([this](const HealthCheckResult& result) {
        std::lock_guard lock(mutex_);
        auto it = statuses_.find(result.service);
        if (it != statuses_.end()) {
            it->second.health = result.status;
        }
    });
}

ServiceManager::~ServiceManager() {
    health_checker_.unsubscribe(health_subscription_);
}

void ServiceManager::register_service(ServiceDefinition definition) {
    for (auto route : definition.routes) {
        route.service_name = definition.name;
        gateway_.register_route(std::move(route));
    }

    Logger::info(Logger::Component::Manager,
        fmt::format("Service registered: {} v{} at {}:{} (dependencies: {})", definition.name,
                    definition.version, definition.host, definition.port,
                    fmt::join(definition.dependencies, ", ")));

    std::lock_guard lock(mutex_);
    const std::string name = definition.name;
    if (definitions_.find(name) == definitions_.end()) {
        order_.push_back(name);
    }
    ServiceStatus status;
    status.name = name;
    statuses_[name] = std::move(status);
    definitions_[name] = std::move(definition);
}

std::expected<std::vector<std::string>, Error> ServiceManager::calculate_startup_order() const {
    std::lock_guard lock(mutex_);
    std::unordered_set<std::string> visiting;
    std::unordered_set<std::string> visited;
    std::vector<std::string> order;
    for (const auto& name : order_) {
        if (auto result = visit(name, visiting, visited, order); !result) {
            return std::unexpected(result.error());
        }
    }
    return order;
}

std::expected<void, Error> ServiceManager::visit(const std::string& name,
                                                 std::unordered_set<std::string>& visiting,
                                                 std::unordered_set<std::string>& visited,
                                                 std::vector<std::string>& order) const {
    if (visited.contains(name)) {
        return {};
    }
    if (visiting.contains(name)) {
        return std::unexpected(Error{ErrorCode::Configuration,
            "Circular dependency detected involving: " + name});
    }

    visiting.insert(name);
    auto it = definitions_.find(name);
    if (it != definitions_.end()) {
        for (const auto& dependency : it->second.dependencies) {
            // Dependencies outside this manager are checked at start time only
            if (definitions_.contains(dependency)) {
                if (auto result = visit(dependency, visiting, visited, order); !result) {
                    return result;
                }
            }
        }
    }
    visiting.erase(name);
    visited.insert(name);
    order.push_back(name);
    return {};
}

std::expected<void, Error> ServiceManager::start_service(const std::string& name) {
    auto def = definition(name);
    if (!def) {
        return std::unexpected(Error{ErrorCode::Configuration, "Service not found: " + name});
    }

    {
        std::lock_guard lock(mutex_);
        auto& status = statuses_[name];
        if (status.lifecycle == Lifecycle::Running) {
            Logger::warn(Logger::Component::Manager, fmt::format("Service already running: {}", name));
            return {};
        }
        status.lifecycle = Lifecycle::Starting;
        status.error.reset();
    }
    Logger::info(Logger::Component::Manager, fmt::format("Starting service: {}", name));

    std::map<std::string, bool> satisfied;
    std::optional<std::string> missing;
    for (const auto& dependency : def->dependencies) {
        bool available = !registry_.discover(dependency).empty();
        satisfied[dependency] = available;
        if (!available && !missing) {
            missing = dependency;
        }
    }
    {
        std::lock_guard lock(mutex_);
        statuses_[name].dependencies = satisfied;
    }
    if (missing) {
        return fail_start(name, Error{ErrorCode::Unavailable, "Dependency not available: " + *missing});
    }

    // Stable id so a restart replaces the previous registration instead of adding one
    ServiceInstance instance;
    instance.id = fmt::format("{}-{}-{}", name, def->host, def->port);
    instance.name = def->name;
    instance.version = def->version;
    instance.host = def->host;
    instance.port = def->port;
    instance.protocol = def->protocol;
    instance.health_endpoint = def->health_endpoint;
    instance.tags = def->tags;
    instance.dependencies = def->dependencies;
    instance.metadata = def->metadata;
    registry_.register_instance(instance);

    if (auto healthy = wait_for_health(instance, def->startup_timeout); !healthy) {
        return fail_start(name, healthy.error());
    }

    {
        std::lock_guard lock(mutex_);
        auto& status = statuses_[name];
        status.lifecycle = Lifecycle::Running;
        status.started_at = std::chrono::system_clock::now();
    }
    Logger::info(Logger::Component::Manager, fmt::format("Service started successfully: {}", name));
    return {};
}

std::expected<void, Error> ServiceManager::wait_for_health(const ServiceInstance& instance,
                                                           std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        auto report = health_checker_.probe(instance);
        if (report && report->status != HealthState::Unhealthy) {
            registry_.update_status(instance.name, instance.id, InstanceStatus::Healthy);
            return {};
        }
        if (!report) {
            Logger::debug(Logger::Component::Manager,
                fmt::format("Startup probe for {} failed: {}", instance.id, report.error().message));
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(config_.poll_interval, remaining));
    }

    return std::unexpected(Error{ErrorCode::Timeout,
        "Service health check timeout: " + instance.name});
}

std::expected<void, Error> ServiceManager::fail_start(const std::string& name, Error error) {
    {
        std::lock_guard lock(mutex_);
        auto& status = statuses_[name];
        status.lifecycle = Lifecycle::Failed;
        status.error = error.message;
    }
    Logger::error(Logger::Component::Manager,
        fmt::format("Failed to start service {}: {}", name, error.message));
    return std::unexpected(std::move(error));
}

std::expected<void, Error> ServiceManager::stop_service(const std::string& name) {
    auto def = definition(name);
    if (!def) {
        return std::unexpected(Error{ErrorCode::Configuration, "Service not found: " + name});
    }

    {
        std::lock_guard lock(mutex_);
        auto& status = statuses_[name];
        if (status.lifecycle == Lifecycle::Stopped) {
            return {};
        }
        status.lifecycle = Lifecycle::Stopping;
    }
    Logger::info(Logger::Component::Manager, fmt::format("Stopping service: {}", name));

    for (const auto& instance : registry_.instances(name)) {
        registry_.deregister(name, instance.id);
    }

    if (!gateway_.wait_for_drain(name, def->shutdown_timeout)) {
        Logger::warn(Logger::Component::Manager,
            fmt::format("{} still had {} request(s) in flight after {}ms", name,
                        gateway_.in_flight(name), def->shutdown_timeout.count()));
    }

    {
        std::lock_guard lock(mutex_);
        auto& status = statuses_[name];
        status.lifecycle = Lifecycle::Stopped;
        status.stopped_at = std::chrono::system_clock::now();
    }
    Logger::info(Logger::Component::Manager, fmt::format("Service stopped: {}", name));
    return {};
}

std::expected<void, Error> ServiceManager::start_all_services() {
    auto order = calculate_startup_order();
    if (!order) {
        Logger::error(Logger::Component::Manager,
            fmt::format("Cannot compute startup order: {}", order.error().message));
        return std::unexpected(order.error());
    }

    Logger::info(Logger::Component::Manager,
        fmt::format("Starting all services: {}", fmt::join(*order, " -> ")));

    for (const auto& name : *order) {
        auto started = start_service(name);
        if (started) {
            continue;
        }
        auto def = definition(name);
        if (def && def->tags.contains("critical")) {
            Logger::error(Logger::Component::Manager,
                fmt::format("Critical service {} failed to start, aborting startup", name));
            return started;
        }
        Logger::warn(Logger::Component::Manager,
            fmt::format("Continuing startup without {}", name));
    }
    return {};
}

void ServiceManager::stop_all_services() {
    shutting_down_ = true;

    std::vector<std::string> order;
    if (auto startup = calculate_startup_order()) {
        order = std::move(*startup);
    } else {
        std::lock_guard lock(mutex_);
        order = order_;
    }
    std::reverse(order.begin(), order.end());

    Logger::info(Logger::Component::Manager,
        fmt::format("Stopping all services: {}", fmt::join(order, " -> ")));

    for (const auto& name : order) {
        if (auto stopped = stop_service(name); !stopped) {
            Logger::error(Logger::Component::Manager,
                fmt::format("Error stopping service {}: {}", name, stopped.error().message));
        }
    }
}

std::optional<ServiceStatus> ServiceManager::status(const std::string& name) const {
    std::lock_guard lock(mutex_);
    auto it = statuses_.find(name);
    if (it == statuses_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ServiceStatus> ServiceManager::all_statuses() const {
    std::lock_guard lock(mutex_);
    std::vector<ServiceStatus> result;
    result.reserve(order_.size());
    for (const auto& name : order_) {
        result.push_back(statuses_.at(name));
    }
    return result;
}

ServiceManagerStats ServiceManager::stats() const {
    std::lock_guard lock(mutex_);
    ServiceManagerStats stats;
    stats.total_services = definitions_.size();
    for (const auto& [name, status] : statuses_) {
        if (status.lifecycle == Lifecycle::Running) ++stats.running_services;
        if (status.lifecycle == Lifecycle::Failed) ++stats.failed_services;
        stats.statuses.emplace(name, status);
    }
    return stats;
}

std::optional<ServiceDefinition> ServiceManager::definition(const std::string& name) const {
    std::lock_guard lock(mutex_);
    auto it = definitions_.find(name);
    if (it == definitions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace meshgate
