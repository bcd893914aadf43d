#include "meshgate/load_balancer.hpp"
#include "meshgate/logger.hpp"
#include <spdlog/fmt/fmt.h>

namespace meshgate {

std::string to_string(Strategy strategy) {
    switch (strategy) {
        case Strategy::RoundRobin: return "round_robin";
        case Strategy::LeastConnections: return "least_connections";
        case Strategy::WeightedRoundRobin: return "weighted_round_robin";
        case Strategy::Random: return "random";
        case Strategy::HealthBased: return "health_based";
        default: return "health_based";
    }
}

std::optional<Strategy> strategy_from_string(const std::string& value) {
    if (value == "round_robin" || value == "round-robin") return Strategy::RoundRobin;
    if (value == "least_connections") return Strategy::LeastConnections;
    if (value == "weighted_round_robin") return Strategy::WeightedRoundRobin;
    if (value == "random") return Strategy::Random;
    if (value == "health_based") return Strategy::HealthBased;
    return std::nullopt;
}

LoadBalancer::LoadBalancer(ServiceRegistry& registry, Strategy strategy)
    : registry_(registry), strategy_(strategy) {
    subscription_ = registry_.subscribe([this](const RegistryEvent& event) {
        if (event.kind == RegistryEvent::Kind::Registered && event.instance) {
            initialize_metrics(*event.instance);
        } else if (event.kind == RegistryEvent::Kind::Deregistered) {
            std::lock_guard lock(mutex_);
            metrics_.erase(event.instance_id);
            Logger::debug(Logger::Component::Balancer,
                fmt::format("Removed metrics for {}", event.instance_id));
        }
    });

    // Instances registered before this balancer existed
    for (const auto& [name, instances] : registry_.all_services()) {
        for (const auto& instance : instances) {
            initialize_metrics(instance);
        }
    }
}

LoadBalancer::~LoadBalancer() {
    registry_.unsubscribe(subscription_);
}

void LoadBalancer::set_strategy(Strategy strategy) {
    {
        std::lock_guard lock(mutex_);
        strategy_ = strategy;
    }
    Logger::info(Logger::Component::Balancer,
        fmt::format("Load balancing strategy changed to {}", to_string(strategy)));
}

Strategy LoadBalancer::strategy() const {
    std::lock_guard lock(mutex_);
    return strategy_;
}

std::expected<ServiceInstance, Error> LoadBalancer::select(const std::string& service_name,
                                                           const std::vector<std::string>& tags) {
    auto candidates = registry_.discover(service_name, tags);

    if (candidates.empty()) {
        Logger::warn(Logger::Component::Balancer,
            fmt::format("No healthy instances found for {}", service_name));
        return std::unexpected(Error{ErrorCode::Unavailable,
            "No healthy instances available for service: " + service_name});
    }
    if (candidates.size() == 1) {
        return candidates.front();
    }

    std::lock_guard lock(mutex_);
    size_t index = 0;
    switch (strategy_) {
        case Strategy::RoundRobin:
            index = pick(round_robin_, service_name, candidates);
            break;
        case Strategy::LeastConnections:
            index = pick(least_connections_, service_name, candidates);
            break;
        case Strategy::WeightedRoundRobin:
            index = pick(weighted_round_robin_, service_name, candidates);
            break;
        case Strategy::Random:
            index = pick(random_, service_name, candidates);
            break;
        case Strategy::HealthBased:
            index = pick(health_based_, service_name, candidates);
            break;
    }
    return candidates[index];
}

void LoadBalancer::record_request(const std::string& instance_id, double response_time_ms, bool success) {
    std::lock_guard lock(mutex_);
    auto it = metrics_.find(instance_id);
    if (it == metrics_.end()) {
        return;
    }
    auto& m = it->second;
    ++m.total_requests;
    m.last_request_time = std::chrono::system_clock::now();
    m.average_response_time = kSmoothing * response_time_ms + (1.0 - kSmoothing) * m.average_response_time;
    m.error_rate = kSmoothing * (success ? 0.0 : 1.0) + (1.0 - kSmoothing) * m.error_rate;
}

void LoadBalancer::record_connection_start(const std::string& instance_id) {
    std::lock_guard lock(mutex_);
    auto it = metrics_.find(instance_id);
    if (it != metrics_.end()) {
        ++it->second.active_connections;
    }
}

void LoadBalancer::record_connection_end(const std::string& instance_id) {
    std::lock_guard lock(mutex_);
    auto it = metrics_.find(instance_id);
    if (it != metrics_.end() && it->second.active_connections > 0) {
        --it->second.active_connections;
    }
}

std::optional<InstanceMetrics> LoadBalancer::metrics(const std::string& instance_id) const {
    std::lock_guard lock(mutex_);
    auto it = metrics_.find(instance_id);
    if (it == metrics_.end()) {
        return std::nullopt;
    }
    return it->second;
}

LoadBalancerStats LoadBalancer::stats() const {
    std::lock_guard lock(mutex_);
    LoadBalancerStats stats;
    stats.strategy = strategy_;
    stats.total_instances = metrics_.size();
    double response_time_sum = 0.0;
    for (const auto& [id, m] : metrics_) {
        stats.total_requests += m.total_requests;
        response_time_sum += m.average_response_time;
        stats.instances.emplace(id, m);
    }
    if (!metrics_.empty()) {
        stats.average_response_time = response_time_sum / static_cast<double>(metrics_.size());
    }
    return stats;
}

void LoadBalancer::initialize_metrics(const ServiceInstance& instance) {
    InstanceMetrics m;
    m.weight = instance.weight();
    m.last_request_time = std::chrono::system_clock::now();
    {
        std::lock_guard lock(mutex_);
        metrics_[instance.id] = m;
    }
    Logger::debug(Logger::Component::Balancer,
        fmt::format("Initialized metrics for {} ({}), weight {}", instance.id, instance.name, m.weight));
}

} // namespace meshgate
