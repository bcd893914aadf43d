#pragma once

#include "meshgate/error.hpp"
#include "meshgate/routing_policy.hpp"
#include "meshgate/service_registry.hpp"
#include <expected>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace meshgate {

enum class Strategy {
    RoundRobin,
    LeastConnections,
    WeightedRoundRobin,
    Random,
    HealthBased
};

std::string to_string(Strategy strategy);
std::optional<Strategy> strategy_from_string(const std::string& value);

struct LoadBalancerStats {
    Strategy strategy = Strategy::HealthBased;
    size_t total_instances = 0;
    uint64_t total_requests = 0;
    double average_response_time = 0.0;
    std::map<std::string, InstanceMetrics> instances;
};

// Picks a healthy instance per the configured strategy. Metrics entries follow the
// registry's registration events.
class LoadBalancer {
public:
    explicit LoadBalancer(ServiceRegistry& registry, Strategy strategy = Strategy::HealthBased);
    ~LoadBalancer();

    LoadBalancer(const LoadBalancer&) = delete;
    LoadBalancer& operator=(const LoadBalancer&) = delete;

    void set_strategy(Strategy strategy);
    Strategy strategy() const;

    std::expected<ServiceInstance, Error> select(const std::string& service_name,
                                                 const std::vector<std::string>& tags = {});

    // EMA update of latency and error rate (alpha = 0.1)
    void record_request(const std::string& instance_id, double response_time_ms, bool success);
    void record_connection_start(const std::string& instance_id);
    void record_connection_end(const std::string& instance_id);

    std::optional<InstanceMetrics> metrics(const std::string& instance_id) const;
    LoadBalancerStats stats() const;

    static constexpr double kSmoothing = 0.1;

private:
    template <SelectionPolicy Policy>
    size_t pick(Policy& policy, const std::string& service_name,
                const std::vector<ServiceInstance>& candidates) {
        return policy.select(service_name, candidates, metrics_);
    }

    void initialize_metrics(const ServiceInstance& instance);

    ServiceRegistry& registry_;
    size_t subscription_ = 0;

    mutable std::mutex mutex_;
    Strategy strategy_;
    MetricsTable metrics_;
    RoundRobinPolicy round_robin_;
    LeastConnectionsPolicy least_connections_;
    WeightedRoundRobinPolicy weighted_round_robin_;
    RandomPolicy random_;
    HealthBasedPolicy health_based_;
};

} // namespace meshgate
