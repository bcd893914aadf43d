#include "meshgate/health_checker.hpp"
#include "meshgate/logger.hpp"
#include <spdlog/fmt/fmt.h>

namespace meshgate {

namespace {

std::optional<HealthState> parse_status_field(const std::string& value) {
    if (value == "healthy" || value == "ok" || value == "up" || value == "pass") {
        return HealthState::Healthy;
    }
    if (value == "degraded" || value == "warn") {
        return HealthState::Degraded;
    }
    if (value == "unhealthy" || value == "down" || value == "fail") {
        return HealthState::Unhealthy;
    }
    return std::nullopt;
}

} // namespace

HealthChecker::HealthChecker(ServiceRegistry& registry,
                             CircuitBreakerRegistry& breakers,
                             std::shared_ptr<HttpClient> client,
                             const HealthCheckConfig& config)
    : registry_(registry), breakers_(breakers), client_(std::move(client)), config_(config) {
    registry_subscription_ = registry_.subscribe([this](const RegistryEvent& event) {
        if (event.kind == RegistryEvent::Kind::Registered && event.instance) {
            check_instance(*event.instance);
        } else if (event.kind == RegistryEvent::Kind::Deregistered) {
            {
                std::lock_guard lock(results_mutex_);
                results_.erase(event.instance_id);
            }
            breakers_.remove(breaker_name(event.service_name, event.instance_id));
        }
    });
}

HealthChecker::~HealthChecker() {
    stop();
    registry_.unsubscribe(registry_subscription_);
}

void HealthChecker::start() {
    if (health_check_thread_.joinable()) {
        return;
    }
    health_check_thread_ = std::jthread([this](std::stop_token stop_token) {
        health_check_loop(stop_token);
    });
}

void HealthChecker::stop() {
    if (health_check_thread_.joinable()) {
        health_check_thread_.request_stop();
        health_check_thread_.join();
    }
}

void HealthChecker::health_check_loop(std::stop_token stop_token) {
    Logger::info(Logger::Component::HealthCheck,
        fmt::format("Health check thread started (interval {}ms, timeout {}ms)",
                    config_.interval.count(), config_.timeout.count()));

    while (!stop_token.stop_requested()) {
        Logger::debug(Logger::Component::HealthCheck, "Starting health check cycle");
        run_cycle();

        std::unique_lock lock(wait_mutex_);
        wait_cv_.wait_for(lock, stop_token, config_.interval, [] { return false; });
    }

    Logger::info(Logger::Component::HealthCheck, "Health check thread stopped");
}

void HealthChecker::run_cycle() {
    std::vector<ServiceInstance> targets;
    for (auto& [name, instances] : registry_.all_services()) {
        for (auto& instance : instances) {
            targets.push_back(std::move(instance));
        }
    }

    std::vector<std::jthread> probes;
    probes.reserve(targets.size());
    for (const auto& target : targets) {
        probes.emplace_back([this, &target] { check_instance(target); });
    }
    // jthread joins on destruction
}

HealthCheckResult HealthChecker::check_instance(const ServiceInstance& instance) {
    auto start = std::chrono::steady_clock::now();

    CircuitBreakerConfig breaker_config;
    breaker_config.failure_threshold = config_.breaker_failure_threshold;
    breaker_config.recovery_timeout = config_.breaker_recovery_timeout;
    breaker_config.timeout = config_.timeout;

    auto client = client_;
    auto timeout = config_.timeout;
    auto report = breakers_.execute<HealthReport>(breaker_name(instance.name, instance.id),
        [client, instance, timeout](std::stop_token token) {
            return probe_with(*client, instance, timeout, token);
        },
        breaker_config);

    HealthCheckResult result;
    result.service = instance.name;
    result.instance_id = instance.id;
    result.timestamp = std::chrono::system_clock::now();
    result.response_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (report) {
        result.status = report->status;
        result.details = std::move(*report);
        Logger::debug(Logger::Component::HealthCheck,
            fmt::format("{} ({}:{}): {} ({}ms)", instance.id, instance.host, instance.port,
                        to_string(result.status), result.response_time.count()));
    } else {
        result.status = HealthState::Unhealthy;
        result.error = report.error().message;
        Logger::error(Logger::Component::HealthCheck,
            fmt::format("Health check failed for {} ({}:{}): {}", instance.id, instance.host,
                        instance.port, report.error().message));
    }

    // An open breaker means the instance was not contacted; its registry status stays as is
    bool contacted = report.has_value() || report.error().code != ErrorCode::CircuitOpen;
    auto status = result.status == HealthState::Unhealthy ? InstanceStatus::Unhealthy
                                                          : InstanceStatus::Healthy;
    bool registered = contacted
        ? registry_.update_status(instance.name, instance.id, status).has_value()
        : registry_.find(instance.name, instance.id).has_value();
    if (!registered) {
        Logger::debug(Logger::Component::HealthCheck,
            fmt::format("{} was deregistered during its health check", instance.id));
        return result;
    }

    {
        std::lock_guard lock(results_mutex_);
        results_[instance.id] = result;
    }
    publish(result);
    return result;
}

std::string HealthChecker::breaker_name(const std::string& service_name, const std::string& instance_id) {
    return fmt::format("health-check-{}-{}", service_name, instance_id);
}

std::expected<HealthReport, Error> HealthChecker::probe(const ServiceInstance& instance) const {
    std::stop_source never_stopped;
    return probe_with(*client_, instance, config_.timeout, never_stopped.get_token());
}

std::expected<HealthReport, Error> HealthChecker::probe_with(HttpClient& client,
                                                             const ServiceInstance& instance,
                                                             std::chrono::milliseconds timeout,
                                                             std::stop_token token) {
    HttpRequest request;
    request.method = "GET";
    request.base_url = instance.base_url();
    request.path = instance.health_endpoint;
    request.headers["Accept"] = "application/json";
    request.headers["User-Agent"] = "meshgate-health/1.0";

    auto response = client.send(request, timeout, token);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status < 200 || response->status >= 300) {
        return std::unexpected(Error{ErrorCode::Upstream, fmt::format("HTTP {}", response->status)});
    }

    HealthReport report;
    auto body = nlohmann::json::parse(response->body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return report;
    }

    if (body.contains("version") && body["version"].is_string()) {
        report.version = body["version"].get<std::string>();
    }
    if (body.contains("uptime") && body["uptime"].is_number()) {
        report.uptime = body["uptime"].get<double>();
    }
    if (body.contains("memory") && body["memory"].is_object()) {
        const auto& memory = body["memory"];
        report.memory = MemoryUsage{memory.value("used", 0.0), memory.value("total", 0.0),
                                    memory.value("percentage", 0.0)};
    }
    if (body.contains("cpu") && body["cpu"].is_object()) {
        report.cpu_usage = body["cpu"].value("usage", 0.0);
    }
    if (body.contains("dependencies") && body["dependencies"].is_object()) {
        for (const auto& [name, ok] : body["dependencies"].items()) {
            report.dependencies[name] = ok.is_boolean() && ok.get<bool>();
        }
    }
    if (body.contains("customMetrics")) {
        report.custom_metrics = body["customMetrics"];
    }
    report.status = determine_health(body);
    return report;
}

HealthState HealthChecker::determine_health(const nlohmann::json& body) {
    if (!body.is_object()) {
        return HealthState::Healthy;
    }

    if (body.contains("status") && body["status"].is_string()) {
        if (auto explicit_status = parse_status_field(body["status"].get<std::string>())) {
            return *explicit_status;
        }
    }

    if (body.contains("memory") && body["memory"].is_object() &&
        body["memory"].value("percentage", 0.0) > 90.0) {
        return HealthState::Degraded;
    }

    if (body.contains("cpu") && body["cpu"].is_object() &&
        body["cpu"].value("usage", 0.0) > 90.0) {
        return HealthState::Degraded;
    }

    if (body.contains("dependencies") && body["dependencies"].is_object()) {
        size_t total = body["dependencies"].size();
        size_t failed = 0;
        for (const auto& [name, ok] : body["dependencies"].items()) {
            if (!ok.is_boolean() || !ok.get<bool>()) {
                ++failed;
            }
        }
        if (failed > 0) {
            return (total > 1 && failed < total) ? HealthState::Degraded : HealthState::Unhealthy;
        }
    }

    return HealthState::Healthy;
}

std::optional<HealthCheckResult> HealthChecker::result(const std::string& instance_id) const {
    std::lock_guard lock(results_mutex_);
    auto it = results_.find(instance_id);
    if (it == results_.end()) {
        return std::nullopt;
    }
    return it->second;
}

SystemHealth HealthChecker::system_health() const {
    SystemHealth health;
    health.timestamp = std::chrono::system_clock::now();
    {
        std::lock_guard lock(results_mutex_);
        for (const auto& [id, result] : results_) {
            health.services.push_back(result);
        }
    }

    for (const auto& result : health.services) {
        switch (result.status) {
            case HealthState::Healthy: ++health.healthy; break;
            case HealthState::Unhealthy: ++health.unhealthy; break;
            case HealthState::Degraded: ++health.degraded; break;
        }
    }
    health.total = health.services.size();

    if (health.unhealthy > 0) {
        health.overall = (health.total > 1 && health.healthy > 0) ? HealthState::Degraded
                                                                  : HealthState::Unhealthy;
    } else if (health.degraded > 0) {
        health.overall = HealthState::Degraded;
    }
    return health;
}

void HealthChecker::clear_results() {
    std::lock_guard lock(results_mutex_);
    results_.clear();
}

size_t HealthChecker::subscribe(HealthObserver observer) {
    std::lock_guard lock(observers_mutex_);
    size_t id = next_subscription_++;
    observers_.emplace(id, std::move(observer));
    return id;
}

void HealthChecker::unsubscribe(size_t subscription) {
    std::lock_guard lock(observers_mutex_);
    observers_.erase(subscription);
}

void HealthChecker::publish(const HealthCheckResult& result) const {
    std::vector<HealthObserver> observers;
    {
        std::lock_guard lock(observers_mutex_);
        for (const auto& [id, observer] : observers_) {
            observers.push_back(observer);
        }
    }
    for (const auto& observer : observers) {
        observer(result);
    }
}

} // namespace meshgate
