#pragma once

#include "meshgate/circuit_breaker.hpp"
#include "meshgate/error.hpp"
#include "meshgate/http_client.hpp"
#include "meshgate/load_balancer.hpp"
#include "meshgate/rate_limiter.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace meshgate {

// Inbound request as seen by the gateway
struct GatewayRequest {
    std::string method = "GET";
    std::string path = "/";
    HeaderMap headers;
    QueryMap query;
    std::string body;
    std::string client_ip;
};

struct GatewayResponse {
    int status = 200;
    HeaderMap headers;
    // JSON payload, or a string holding raw text
    nlohmann::json body;
    std::chrono::milliseconds response_time{0};
};

struct RouteRateLimit {
    RateLimitPolicy policy;
    // Defaults to the route plus the client address
    std::function<std::string(const GatewayRequest&)> key_generator;
};

struct RouteConfig {
    std::string method = "GET";
    std::string path;
    std::string service_name;
    // Empty means the inbound path
    std::string target_path;
    std::vector<std::string> tags;
    std::chrono::milliseconds timeout{30000};
    // Informational, the gateway never retries
    uint32_t retries = 0;
    std::optional<RouteRateLimit> rate_limit;
    std::function<HttpRequest(HttpRequest)> transform_request;
    std::function<GatewayResponse(GatewayResponse)> transform_response;
};

// Emitted once per handled request
struct GatewayRequestRecord {
    std::string request_id;
    std::string method;
    std::string path;
    std::string service_name;
    std::string instance_id;
    int status = 0;
    std::chrono::milliseconds response_time{0};
    bool success = false;
    std::optional<std::string> error;
};

using GatewayObserver = std::function<void(const GatewayRequestRecord&)>;

struct GatewayStats {
    size_t total_routes = 0;
    size_t registered_services = 0;
    uint64_t total_requests = 0;
    uint64_t failed_requests = 0;
    LoadBalancerStats load_balancer;
    std::map<std::string, CircuitBreakerStats> circuit_breakers;
};

class Gateway {
public:
    static constexpr const char* kVersion = "1.0.0";
    static constexpr const char* kForwardedBy = "meshgate";

    Gateway(LoadBalancer& load_balancer,
            CircuitBreakerRegistry& breakers,
            RateLimiter& rate_limiter,
            std::shared_ptr<HttpClient> client,
            CircuitBreakerConfig proxy_breaker = {});

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    // Replaces any route with the same method and path
    void register_route(RouteConfig route);
    bool remove_route(const std::string& method, const std::string& path);
    void clear_routes();
    std::vector<RouteConfig> routes() const;

    // Routes without their own rate_limit are limited per client address with the
    // rate limiter's default policy
    void apply_default_rate_limit(bool enabled) { default_rate_limit_ = enabled; }

    // Returns nothing when no route matches, leaving the request to the caller
    std::optional<GatewayResponse> handle(const GatewayRequest& request);

    size_t in_flight(const std::string& service_name) const;

    // Blocks until no request for the service is in flight or the timeout passes.
    // Returns true when drained.
    bool wait_for_drain(const std::string& service_name, std::chrono::milliseconds timeout);

    GatewayStats stats() const;

    size_t subscribe(GatewayObserver observer);
    void unsubscribe(size_t subscription);

    // Allow-listed inbound headers copied to the upstream request
    static HeaderMap forwarded_headers(const HeaderMap& inbound, const std::string& request_id);

    // Response headers with hop-by-hop entries removed
    static HeaderMap strip_hop_by_hop(const HeaderMap& headers);

private:
    std::optional<RouteConfig> find_route(const std::string& method, const std::string& path) const;
    std::string generate_request_id();
    HttpRequest build_outbound(const GatewayRequest& request, const RouteConfig& route,
                               const ServiceInstance& instance, const std::string& request_id) const;
    GatewayResponse error_response(int status, const std::string& message,
                                   const std::string& request_id) const;
    void begin_request(const std::string& service_name);
    void end_request(const std::string& service_name);
    void publish(const GatewayRequestRecord& record) const;

    static std::string route_key(const std::string& method, const std::string& path);

    LoadBalancer& load_balancer_;
    CircuitBreakerRegistry& breakers_;
    RateLimiter& rate_limiter_;
    std::shared_ptr<HttpClient> client_;
    // Settings for the "proxy-<service>" breakers; the timeout comes from each route
    const CircuitBreakerConfig proxy_breaker_;
    std::atomic<bool> default_rate_limit_{false};

    std::map<std::string, RouteConfig> routes_;
    mutable std::shared_mutex routes_mutex_;

    std::atomic<uint64_t> request_counter_{0};
    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> failed_requests_{0};

    std::unordered_map<std::string, size_t> in_flight_;
    mutable std::mutex in_flight_mutex_;
    std::condition_variable drained_cv_;

    std::map<size_t, GatewayObserver> observers_;
    size_t next_subscription_ = 1;
    mutable std::mutex observers_mutex_;
};

} // namespace meshgate
