#include "meshgate/service_registry.hpp"
#include "meshgate/logger.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <random>

namespace meshgate {

namespace {

std::mt19937& random_engine() {
    thread_local std::mt19937 engine{std::random_device{}()};
    return engine;
}

} // namespace

void ServiceRegistry::register_instance(ServiceInstance instance) {
    instance.status = InstanceStatus::Unknown;
    instance.registered_at = std::chrono::system_clock::now();
    instance.last_health_check = instance.registered_at;

    RegistryEvent event{RegistryEvent::Kind::Registered, instance.name, instance.id, instance};
    {
        std::unique_lock lock(mutex_);
        auto& list = registry_[instance.name];
        auto it = std::find_if(list.begin(), list.end(),
                               [&](const ServiceInstance& s) { return s.id == instance.id; });
        if (it != list.end()) {
            *it = std::move(instance);
        } else {
            list.push_back(std::move(instance));
        }
    }

    Logger::info(Logger::Component::Registry,
        fmt::format("Service registered: {} ({} at {}:{})", event.service_name, event.instance_id,
                    event.instance->host, event.instance->port));
    notify(event);
}

bool ServiceRegistry::deregister(const std::string& service_name, const std::string& instance_id) {
    bool removed = false;
    {
        std::unique_lock lock(mutex_);
        auto it = registry_.find(service_name);
        if (it != registry_.end()) {
            auto& list = it->second;
            auto before = list.size();
            std::erase_if(list, [&](const ServiceInstance& s) { return s.id == instance_id; });
            removed = list.size() < before;
            if (list.empty()) {
                registry_.erase(it);
            }
        }
    }

    if (removed) {
        Logger::info(Logger::Component::Registry,
            fmt::format("Service deregistered: {} ({})", service_name, instance_id));
        notify(RegistryEvent{RegistryEvent::Kind::Deregistered, service_name, instance_id, std::nullopt});
    }
    return removed;
}

std::vector<ServiceInstance> ServiceRegistry::discover(const std::string& service_name,
                                                       const std::vector<std::string>& tags) const {
    std::shared_lock lock(mutex_);
    std::vector<ServiceInstance> result;
    auto it = registry_.find(service_name);
    if (it == registry_.end()) {
        return result;
    }
    for (const auto& instance : it->second) {
        if (instance.status == InstanceStatus::Healthy && instance.has_tags(tags)) {
            result.push_back(instance);
        }
    }
    return result;
}

std::optional<ServiceInstance> ServiceRegistry::pick_one(const std::string& service_name,
                                                         const std::vector<std::string>& tags) const {
    auto candidates = discover(service_name, tags);
    if (candidates.empty()) {
        return std::nullopt;
    }
    std::uniform_int_distribution<size_t> dist(0, candidates.size() - 1);
    return candidates[dist(random_engine())];
}

std::map<std::string, bool> ServiceRegistry::check_dependencies(const std::string& service_name) const {
    std::vector<std::string> dependencies;
    {
        std::shared_lock lock(mutex_);
        auto it = registry_.find(service_name);
        if (it == registry_.end() || it->second.empty()) {
            return {};
        }
        dependencies = it->second.front().dependencies;
    }

    std::map<std::string, bool> status;
    for (const auto& dependency : dependencies) {
        status[dependency] = !discover(dependency).empty();
    }
    return status;
}

std::optional<InstanceStatus> ServiceRegistry::update_status(const std::string& service_name,
                                                             const std::string& instance_id,
                                                             InstanceStatus status) {
    std::optional<InstanceStatus> previous;
    std::optional<RegistryEvent> event;
    {
        std::unique_lock lock(mutex_);
        auto it = registry_.find(service_name);
        if (it == registry_.end()) {
            return std::nullopt;
        }
        for (auto& instance : it->second) {
            if (instance.id != instance_id) {
                continue;
            }
            previous = instance.status;
            instance.status = status;
            instance.last_health_check = std::chrono::system_clock::now();

            bool was_healthy = *previous == InstanceStatus::Healthy;
            if (!was_healthy && status == InstanceStatus::Healthy) {
                event = RegistryEvent{RegistryEvent::Kind::Recovered, service_name, instance_id, instance};
            } else if (was_healthy && status == InstanceStatus::Unhealthy) {
                event = RegistryEvent{RegistryEvent::Kind::Unhealthy, service_name, instance_id, instance};
            }
            break;
        }
    }

    if (event) {
        if (event->kind == RegistryEvent::Kind::Recovered) {
            Logger::info(Logger::Component::Registry,
                fmt::format("Service recovered: {} ({})", service_name, instance_id));
        } else {
            Logger::warn(Logger::Component::Registry,
                fmt::format("Service became unhealthy: {} ({})", service_name, instance_id));
        }
        notify(*event);
    }
    return previous;
}

std::optional<ServiceInstance> ServiceRegistry::find(const std::string& service_name,
                                                     const std::string& instance_id) const {
    std::shared_lock lock(mutex_);
    auto it = registry_.find(service_name);
    if (it == registry_.end()) {
        return std::nullopt;
    }
    for (const auto& instance : it->second) {
        if (instance.id == instance_id) {
            return instance;
        }
    }
    return std::nullopt;
}

std::vector<ServiceInstance> ServiceRegistry::instances(const std::string& service_name) const {
    std::shared_lock lock(mutex_);
    auto it = registry_.find(service_name);
    if (it == registry_.end()) {
        return {};
    }
    return it->second;
}

std::map<std::string, std::vector<ServiceInstance>> ServiceRegistry::all_services() const {
    std::shared_lock lock(mutex_);
    return {registry_.begin(), registry_.end()};
}

ServiceHealthSummary ServiceRegistry::service_health(const std::string& service_name) const {
    ServiceHealthSummary summary;
    std::shared_lock lock(mutex_);
    auto it = registry_.find(service_name);
    if (it == registry_.end()) {
        return summary;
    }
    for (const auto& instance : it->second) {
        if (instance.status == InstanceStatus::Healthy) {
            ++summary.healthy;
        } else if (instance.status == InstanceStatus::Unhealthy) {
            ++summary.unhealthy;
        }
    }
    summary.total = it->second.size();
    return summary;
}

RegistryStats ServiceRegistry::stats() const {
    RegistryStats stats;
    std::shared_lock lock(mutex_);
    for (const auto& [name, list] : registry_) {
        stats.instances_by_service[name] = list.size();
        stats.total_instances += list.size();
        for (const auto& instance : list) {
            if (instance.status == InstanceStatus::Healthy) {
                ++stats.healthy_instances;
            } else if (instance.status == InstanceStatus::Unhealthy) {
                ++stats.unhealthy_instances;
            }
        }
    }
    return stats;
}

size_t ServiceRegistry::subscribe(RegistryObserver observer) {
    std::lock_guard lock(observers_mutex_);
    size_t id = next_subscription_++;
    observers_.emplace(id, std::move(observer));
    return id;
}

void ServiceRegistry::unsubscribe(size_t subscription) {
    std::lock_guard lock(observers_mutex_);
    observers_.erase(subscription);
}

void ServiceRegistry::notify(const RegistryEvent& event) const {
    std::vector<RegistryObserver> observers;
    {
        std::lock_guard lock(observers_mutex_);
        observers.reserve(observers_.size());
        for (const auto& [id, observer] : observers_) {
            observers.push_back(observer);
        }
    }
    for (const auto& observer : observers) {
        observer(event);
    }
}

} // namespace meshgate
