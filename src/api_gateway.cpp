#include "meshgate/api_gateway.hpp"
#include "meshgate/logger.hpp"
#include "meshgate/response_body.hpp"
#include <spdlog/fmt/fmt.h>
#include <array>
#include <set>

namespace meshgate {

namespace {

constexpr std::array<const char*, 6> kAllowedHeaders = {
    "content-type", "authorization", "accept", "user-agent", "accept-language", "accept-encoding"
};

constexpr std::array<const char*, 8> kHopByHopHeaders = {
    "connection", "keep-alive", "proxy-authenticate", "proxy-authorization",
    "te", "trailers", "transfer-encoding", "upgrade"
};

} // namespace

Gateway::Gateway(LoadBalancer& load_balancer,
                 CircuitBreakerRegistry& breakers,
                 RateLimiter& rate_limiter,
                 std::shared_ptr<HttpClient> client,
                 CircuitBreakerConfig proxy_breaker)
    : load_balancer_(load_balancer),
      breakers_(breakers),
      rate_limiter_(rate_limiter),
      client_(std::move(client)),
      proxy_breaker_(proxy_breaker) {}

std::string Gateway::route_key(const std::string& method, const std::string& path) {
    return method + ":" + path;
}

void Gateway::register_route(RouteConfig route) {
    auto key = route_key(route.method, route.path);
    Logger::info(Logger::Component::Gateway,
        fmt::format("Route registered: {} -> {}{}", key, route.service_name,
                    route.target_path.empty() ? "" : " " + route.target_path));
    std::unique_lock lock(routes_mutex_);
    routes_[key] = std::move(route);
}

bool Gateway::remove_route(const std::string& method, const std::string& path) {
    auto key = route_key(method, path);
    bool removed = false;
    {
        std::unique_lock lock(routes_mutex_);
        removed = routes_.erase(key) > 0;
    }
    if (removed) {
        Logger::info(Logger::Component::Gateway, fmt::format("Route removed: {}", key));
    }
    return removed;
}

void Gateway::clear_routes() {
    {
        std::unique_lock lock(routes_mutex_);
        routes_.clear();
    }
    Logger::info(Logger::Component::Gateway, "All routes cleared");
}

std::vector<RouteConfig> Gateway::routes() const {
    std::shared_lock lock(routes_mutex_);
    std::vector<RouteConfig> result;
    result.reserve(routes_.size());
    for (const auto& [key, route] : routes_) {
        result.push_back(route);
    }
    return result;
}

std::optional<RouteConfig> Gateway::find_route(const std::string& method, const std::string& path) const {
    std::shared_lock lock(routes_mutex_);
    auto it = routes_.find(route_key(method, path));
    if (it == routes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<GatewayResponse> Gateway::handle(const GatewayRequest& request) {
    auto route = find_route(request.method, request.path);
    if (!route) {
        return std::nullopt;
    }

    auto request_id = generate_request_id();
    auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start] {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
    };

    ++total_requests_;
    begin_request(route->service_name);

    GatewayRequestRecord record;
    record.request_id = request_id;
    record.method = request.method;
    record.path = request.path;
    record.service_name = route->service_name;

    std::optional<RateLimitGrant> grant;
    RateLimitPolicy limit_policy;
    auto settle_rate_limit = [&](int status) {
        if (!grant) {
            return;
        }
        bool failed = status >= 400;
        if ((failed && limit_policy.skip_failed_requests) ||
            (!failed && limit_policy.skip_successful_requests)) {
            rate_limiter_.release(*grant);
        }
    };

    auto fail = [&](const Error& error, const std::string& message) {
        auto response = error_response(http_status(error), message, request_id);
        response.response_time = elapsed();
        settle_rate_limit(response.status);
        ++failed_requests_;
        end_request(route->service_name);

        record.status = response.status;
        record.response_time = response.response_time;
        record.error = error.message;
        Logger::error(Logger::Component::Gateway,
            fmt::format("[{}] {} {} -> {} failed: {} ({}) in {}ms", request_id, request.method,
                        request.path, route->service_name, error.message, to_string(error.code),
                        response.response_time.count()));
        publish(record);
        return response;
    };

    Logger::debug(Logger::Component::Request,
        fmt::format("[{}] {} {} from {}", request_id, request.method, request.path,
                    request.client_ip.empty() ? "unknown" : request.client_ip));

    if (route->rate_limit || default_rate_limit_) {
        std::string client = request.client_ip.empty() ? "unknown" : request.client_ip;
        std::string key;
        if (route->rate_limit) {
            const auto& limit = *route->rate_limit;
            key = limit.key_generator ? limit.key_generator(request)
                                      : route_key(route->method, route->path) + "|" + client;
            limit_policy = limit.policy;
        } else {
            key = client;
            limit_policy = rate_limiter_.default_policy();
        }
        auto admitted = rate_limiter_.acquire(key, limit_policy);
        if (!admitted) {
            return fail(admitted.error(), admitted.error().message);
        }
        grant = std::move(*admitted);
    }

    auto instance = load_balancer_.select(route->service_name, route->tags);
    if (!instance) {
        return fail(instance.error(), "Service Unavailable");
    }
    record.instance_id = instance->id;

    auto outbound = build_outbound(request, *route, *instance, request_id);

    CircuitBreakerConfig breaker_config = proxy_breaker_;
    breaker_config.timeout = route->timeout;

    auto client = client_;
    auto timeout = route->timeout;
    auto transform_response = route->transform_response;

    load_balancer_.record_connection_start(instance->id);
    auto response = breakers_.execute<GatewayResponse>("proxy-" + route->service_name,
        [client, outbound, timeout, transform_response](std::stop_token token)
            -> std::expected<GatewayResponse, Error> {
            auto upstream = client->send(outbound, timeout, token);
            if (!upstream) {
                return std::unexpected(upstream.error());
            }
            if (upstream->status < 200 || upstream->status >= 300) {
                return std::unexpected(Error{ErrorCode::Upstream,
                    fmt::format("Upstream responded with HTTP {}", upstream->status)});
            }

            GatewayResponse proxied;
            proxied.status = upstream->status;
            proxied.headers = strip_hop_by_hop(upstream->headers);
            proxied.body = ResponseBody::decode(upstream->body);
            if (transform_response) {
                proxied = transform_response(std::move(proxied));
            }
            return proxied;
        },
        breaker_config);
    load_balancer_.record_connection_end(instance->id);

    auto response_time = elapsed();
    if (!response) {
        // A rejected call never reached the instance
        if (response.error().code != ErrorCode::CircuitOpen) {
            load_balancer_.record_request(instance->id, static_cast<double>(response_time.count()), false);
        }
        std::string message = response.error().code == ErrorCode::CircuitOpen
            ? "Service temporarily unavailable"
            : "Internal Server Error";
        return fail(response.error(), message);
    }

    load_balancer_.record_request(instance->id, static_cast<double>(response_time.count()), true);
    response->response_time = response_time;
    response->headers.insert_or_assign("x-request-id", request_id);
    settle_rate_limit(response->status);
    end_request(route->service_name);

    record.status = response->status;
    record.response_time = response_time;
    record.success = true;
    Logger::info(Logger::Component::Response,
        fmt::format("[{}] {} {} -> {} ({}) {} in {}ms", request_id, request.method, request.path,
                    route->service_name, instance->id, response->status, response_time.count()));
    publish(record);
    return std::move(*response);
}

HttpRequest Gateway::build_outbound(const GatewayRequest& request, const RouteConfig& route,
                                    const ServiceInstance& instance, const std::string& request_id) const {
    HttpRequest outbound;
    outbound.method = request.method;
    outbound.base_url = instance.base_url();
    outbound.path = route.target_path.empty() ? request.path : route.target_path;
    outbound.query = request.query;
    outbound.headers = forwarded_headers(request.headers, request_id);
    outbound.body = request.body;

    if (route.transform_request) {
        outbound = route.transform_request(std::move(outbound));
    }
    return outbound;
}

HeaderMap Gateway::forwarded_headers(const HeaderMap& inbound, const std::string& request_id) {
    HeaderMap headers;
    for (const char* name : kAllowedHeaders) {
        auto it = inbound.find(name);
        if (it != inbound.end()) {
            headers.emplace(it->first, it->second);
        }
    }
    headers.insert_or_assign("x-request-id", request_id);
    headers.insert_or_assign("x-forwarded-by", kForwardedBy);
    headers.insert_or_assign("x-gateway-version", kVersion);
    return headers;
}

HeaderMap Gateway::strip_hop_by_hop(const HeaderMap& headers) {
    HeaderMap result = headers;
    for (const char* name : kHopByHopHeaders) {
        result.erase(name);
    }
    return result;
}

GatewayResponse Gateway::error_response(int status, const std::string& message,
                                        const std::string& request_id) const {
    GatewayResponse response;
    response.status = status;
    response.headers.insert_or_assign("x-request-id", request_id);
    response.body = {
        {"error", {
            {"code", status},
            {"message", message},
            {"timestamp", format_timestamp(std::chrono::system_clock::now())},
            {"requestId", request_id}
        }}
    };
    return response;
}

std::string Gateway::generate_request_id() {
    auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return fmt::format("req_{}_{}", now, ++request_counter_);
}

void Gateway::begin_request(const std::string& service_name) {
    std::lock_guard lock(in_flight_mutex_);
    ++in_flight_[service_name];
}

void Gateway::end_request(const std::string& service_name) {
    {
        std::lock_guard lock(in_flight_mutex_);
        auto it = in_flight_.find(service_name);
        if (it != in_flight_.end() && --it->second == 0) {
            in_flight_.erase(it);
        }
    }
    drained_cv_.notify_all();
}

size_t Gateway::in_flight(const std::string& service_name) const {
    std::lock_guard lock(in_flight_mutex_);
    auto it = in_flight_.find(service_name);
    return it == in_flight_.end() ? 0 : it->second;
}

bool Gateway::wait_for_drain(const std::string& service_name, std::chrono::milliseconds timeout) {
    std::unique_lock lock(in_flight_mutex_);
    return drained_cv_.wait_for(lock, timeout, [&] {
        return in_flight_.find(service_name) == in_flight_.end();
    });
}

GatewayStats Gateway::stats() const {
    GatewayStats stats;
    {
        std::shared_lock lock(routes_mutex_);
        std::set<std::string> services;
        for (const auto& [key, route] : routes_) {
            services.insert(route.service_name);
        }
        stats.total_routes = routes_.size();
        stats.registered_services = services.size();
    }
    stats.total_requests = total_requests_.load();
    stats.failed_requests = failed_requests_.load();
    stats.load_balancer = load_balancer_.stats();
    stats.circuit_breakers = breakers_.all_stats();
    return stats;
}

size_t Gateway::subscribe(GatewayObserver observer) {
    std::lock_guard lock(observers_mutex_);
    size_t id = next_subscription_++;
    observers_.emplace(id, std::move(observer));
    return id;
}

void Gateway::unsubscribe(size_t subscription) {
    std::lock_guard lock(observers_mutex_);
    observers_.erase(subscription);
}

void Gateway::publish(const GatewayRequestRecord& record) const {
    std::vector<GatewayObserver> observers;
    {
        std::lock_guard lock(observers_mutex_);
        for (const auto& [id, observer] : observers_) {
            observers.push_back(observer);
        }
    }
    for (const auto& observer : observers) {
        observer(record);
    }
}

} // namespace meshgate
