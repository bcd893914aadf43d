#pragma once

#include "meshgate/service_instance.hpp"
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace meshgate {

struct RegistryEvent {
    enum class Kind {
        Registered,
        Deregistered,
        Recovered,
        Unhealthy
    };

    Kind kind;
    std::string service_name;
    std::string instance_id;
    // Snapshot of the instance; empty for Deregistered
    std::optional<ServiceInstance> instance;
};

using RegistryObserver = std::function<void(const RegistryEvent&)>;

struct ServiceHealthSummary {
    size_t healthy = 0;
    size_t unhealthy = 0;
    size_t total = 0;
};

struct RegistryStats {
    size_t total_instances = 0;
    size_t healthy_instances = 0;
    size_t unhealthy_instances = 0;
    std::map<std::string, size_t> instances_by_service;
};

// In-memory registry of service instances, keyed by service name.
// Readers take a shared lock; observers are invoked after the lock is released.
class ServiceRegistry {
public:
    ServiceRegistry() = default;

    ServiceRegistry(const ServiceRegistry&) = delete;
    ServiceRegistry& operator=(const ServiceRegistry&) = delete;

    // Upsert by id. The instance starts with status unknown.
    void register_instance(ServiceInstance instance);

    // Returns true when an instance was removed
    bool deregister(const std::string& service_name, const std::string& instance_id);

    // Healthy instances carrying every requested tag
    std::vector<ServiceInstance> discover(const std::string& service_name,
                                          const std::vector<std::string>& tags = {}) const;

    // Uniform random choice among discover() results
    std::optional<ServiceInstance> pick_one(const std::string& service_name,
                                            const std::vector<std::string>& tags = {}) const;

    // Dependency name -> at least one healthy instance exists
    std::map<std::string, bool> check_dependencies(const std::string& service_name) const;

    // Records a health-check outcome. Returns the previous status, or nothing when the
    // instance is no longer registered.
    std::optional<InstanceStatus> update_status(const std::string& service_name,
                                                const std::string& instance_id,
                                                InstanceStatus status);

    std::optional<ServiceInstance> find(const std::string& service_name,
                                        const std::string& instance_id) const;

    // Every instance of a service regardless of status
    std::vector<ServiceInstance> instances(const std::string& service_name) const;

    std::map<std::string, std::vector<ServiceInstance>> all_services() const;

    ServiceHealthSummary service_health(const std::string& service_name) const;

    RegistryStats stats() const;

    size_t subscribe(RegistryObserver observer);
    void unsubscribe(size_t subscription);

private:
    void notify(const RegistryEvent& event) const;

    std::unordered_map<std::string, std::vector<ServiceInstance>> registry_;
    mutable std::shared_mutex mutex_;

    std::map<size_t, RegistryObserver> observers_;
    size_t next_subscription_ = 1;
    mutable std::mutex observers_mutex_;
};

} // namespace meshgate
