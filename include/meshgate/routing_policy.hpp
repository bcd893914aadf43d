#pragma once

#include "meshgate/service_instance.hpp"
#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace meshgate {

// Rolling per-instance metrics fed by the gateway
struct InstanceMetrics {
    uint32_t active_connections = 0;
    uint64_t total_requests = 0;
    double average_response_time = 0.0;  // ms, EMA
    double error_rate = 0.0;             // EMA of the failure indicator
    std::chrono::system_clock::time_point last_request_time{};
    int weight = 1;
};

using MetricsTable = std::unordered_map<std::string, InstanceMetrics>;

// A policy picks an index into a non-empty candidate list
template<typename T>
concept SelectionPolicy = requires(T policy, const std::string& service,
                                   const std::vector<ServiceInstance>& candidates,
                                   const MetricsTable& metrics) {
    { policy.select(service, candidates, metrics) } -> std::same_as<size_t>;
};

class RoundRobinPolicy {
public:
    size_t select(const std::string& service, const std::vector<ServiceInstance>& candidates,
                  const MetricsTable& /*metrics*/) {
        uint64_t& counter = counters_[service];
        size_t index = counter % candidates.size();
        ++counter;
        return index;
    }

    void reset() {
        counters_.clear();
    }

private:
    std::unordered_map<std::string, uint64_t> counters_;
};

class LeastConnectionsPolicy {
public:
    size_t select(const std::string& service, const std::vector<ServiceInstance>& candidates,
                  const MetricsTable& metrics);
};

class WeightedRoundRobinPolicy {
public:
    // Total weight is recomputed on every call so weight changes apply immediately
    size_t select(const std::string& service, const std::vector<ServiceInstance>& candidates,
                  const MetricsTable& metrics);

    void reset() {
        counters_.clear();
    }

private:
    std::unordered_map<std::string, uint64_t> counters_;
};

class RandomPolicy {
public:
    RandomPolicy() : engine_(std::random_device{}()) {}

    size_t select(const std::string& service, const std::vector<ServiceInstance>& candidates,
                  const MetricsTable& metrics);

private:
    std::mt19937 engine_;
};

class HealthBasedPolicy {
public:
    size_t select(const std::string& service, const std::vector<ServiceInstance>& candidates,
                  const MetricsTable& metrics);

    // Higher is better. Instances without metrics score 0.5.
    static double score(const InstanceMetrics* metrics);
};

static_assert(SelectionPolicy<RoundRobinPolicy>);
static_assert(SelectionPolicy<LeastConnectionsPolicy>);
static_assert(SelectionPolicy<WeightedRoundRobinPolicy>);
static_assert(SelectionPolicy<RandomPolicy>);
static_assert(SelectionPolicy<HealthBasedPolicy>);

} // namespace meshgate
