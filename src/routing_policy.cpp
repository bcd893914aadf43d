#include "meshgate/routing_policy.hpp"
#include <algorithm>

namespace meshgate {

namespace {

const InstanceMetrics* lookup(const MetricsTable& metrics, const std::string& id) {
    auto it = metrics.find(id);
    return it != metrics.end() ? &it->second : nullptr;
}

} // namespace

size_t LeastConnectionsPolicy::select(const std::string& /*service*/,
                                      const std::vector<ServiceInstance>& candidates,
                                      const MetricsTable& metrics) {
    size_t best = 0;
    uint32_t min_connections = UINT32_MAX;
    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto* m = lookup(metrics, candidates[i].id);
        uint32_t connections = m ? m->active_connections : 0;
        if (connections < min_connections) {
            min_connections = connections;
            best = i;
        }
    }
    return best;
}

size_t WeightedRoundRobinPolicy::select(const std::string& service,
                                        const std::vector<ServiceInstance>& candidates,
                                        const MetricsTable& metrics) {
    auto weight_of = [&](const ServiceInstance& instance) -> uint64_t {
        const auto* m = lookup(metrics, instance.id);
        return (m && m->weight > 0) ? static_cast<uint64_t>(m->weight) : 1;
    };

    uint64_t total_weight = 0;
    for (const auto& instance : candidates) {
        total_weight += weight_of(instance);
    }

    uint64_t& counter = counters_[service];
    uint64_t position = counter % total_weight;
    ++counter;

    for (size_t i = 0; i < candidates.size(); ++i) {
        uint64_t weight = weight_of(candidates[i]);
        if (position < weight) {
            return i;
        }
        position -= weight;
    }
    return 0;
}

size_t RandomPolicy::select(const std::string& /*service*/,
                            const std::vector<ServiceInstance>& candidates,
                            const MetricsTable& /*metrics*/) {
    std::uniform_int_distribution<size_t> dist(0, candidates.size() - 1);
    return dist(engine_);
}

size_t HealthBasedPolicy::select(const std::string& /*service*/,
                                 const std::vector<ServiceInstance>& candidates,
                                 const MetricsTable& metrics) {
    size_t best = 0;
    double best_score = score(lookup(metrics, candidates[0].id));
    for (size_t i = 1; i < candidates.size(); ++i) {
        double s = score(lookup(metrics, candidates[i].id));
        if (s > best_score) {
            best_score = s;
            best = i;
        }
    }
    return best;
}

double HealthBasedPolicy::score(const InstanceMetrics* metrics) {
    if (!metrics) {
        return 0.5;
    }
    double response_time_score = 1.0 - std::min(1.0, metrics->average_response_time / 5000.0);
    double error_rate_score = std::max(0.0, 1.0 - metrics->error_rate);
    double connection_score = 1.0 - std::min(1.0, metrics->active_connections / 100.0);
    return response_time_score * 0.4 + error_rate_score * 0.4 + connection_score * 0.2;
}

} // namespace meshgate
