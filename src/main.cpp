#include "meshgate/admin_api.hpp"
#include "meshgate/api_gateway.hpp"
#include "meshgate/circuit_breaker.hpp"
#include "meshgate/config_loader.hpp"
#include "meshgate/health_checker.hpp"
#include "meshgate/http_client.hpp"
#include "meshgate/load_balancer.hpp"
#include "meshgate/logger.hpp"
#include "meshgate/rate_limiter.hpp"
#include "meshgate/response_body.hpp"
#include "meshgate/service_manager.hpp"
#include "meshgate/service_registry.hpp"
#include <httplib.h>
#include <csignal>
#include <atomic>
#include <spdlog/fmt/fmt.h>
#include <iostream>

using namespace meshgate;

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        shutdown_requested.store(true);
    }
}

namespace {

GatewayRequest to_gateway_request(const httplib::Request& req) {
    GatewayRequest request;
    request.method = req.method;
    request.path = req.path;
    request.body = req.body;
    request.client_ip = req.remote_addr;
    for (const auto& [name, value] : req.headers) {
        request.headers.emplace(name, value);
    }
    for (const auto& [name, value] : req.params) {
        request.query.emplace(name, value);
    }
    return request;
}

void write_response(const GatewayResponse& response, httplib::Response& res) {
    // httplib computes these from the body
    HeaderMap headers = response.headers;
    std::string upstream_type;
    if (auto it = headers.find("content-type"); it != headers.end()) {
        upstream_type = it->second;
        headers.erase(it);
    }
    headers.erase("content-length");

    for (const auto& [name, value] : headers) {
        res.set_header(name, value);
    }
    res.status = response.status;
    res.set_content(ResponseBody::encode(response.body),
                    ResponseBody::content_type_for(response.body, upstream_type));
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path = argc > 1 ? argv[1] : "config.json";

    // Install signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto config_result = ConfigLoader::load(config_path);
    if (!config_result.has_value()) {
        std::cerr << "Failed to load configuration: " << config_result.error() << std::endl;
        return 1;
    }

    Config config = config_result.value();

    Logger::init(config.gateway.log_file, config.gateway.log_level);
    Logger::info(Logger::Component::Config,
        fmt::format("Loaded {} service definition(s), strategy {}",
            config.services.size(), to_string(config.strategy)));

    ServiceRegistry registry;
    CircuitBreakerRegistry breakers;
    auto client = std::make_shared<HttplibClient>();

    HealthChecker health_checker(registry, breakers, client, config.health_check);
    LoadBalancer load_balancer(registry, config.strategy);
    RateLimiter rate_limiter(config.rate_limiter.policy, config.rate_limiter.cleanup_interval,
                             config.rate_limiter.max_queued_total);
    Gateway gateway(load_balancer, breakers, rate_limiter, client, config.circuit_breaker);
    gateway.apply_default_rate_limit(config.rate_limiter.apply_to_all_routes);
    ServiceManager manager(registry, health_checker, gateway, config.manager);
    AdminApi admin(registry, breakers, load_balancer, rate_limiter, health_checker, gateway, manager);

    breakers.subscribe([](const BreakerEvent& event) {
        if (event.kind == BreakerEvent::Kind::StateChanged) {
            Logger::warn(Logger::Component::Breaker,
                fmt::format("Breaker {} is now {}", event.breaker, to_string(event.state)));
        }
    });
    registry.subscribe([](const RegistryEvent& event) {
        if (event.kind == RegistryEvent::Kind::Unhealthy) {
            Logger::warn(Logger::Component::Registry,
                fmt::format("{} ({}) became unhealthy", event.instance_id, event.service_name));
        } else if (event.kind == RegistryEvent::Kind::Recovered) {
            Logger::info(Logger::Component::Registry,
                fmt::format("{} ({}) recovered", event.instance_id, event.service_name));
        }
    });

    for (auto& definition : config.services) {
        manager.register_service(std::move(definition));
    }

    httplib::Server server;

    // Queued rate limit waiters each hold a server thread; size the pool so they never
    // take the last worker_threads
    size_t pool_size = config.gateway.worker_threads + config.rate_limiter.max_queued_total;
    server.new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    // Configure server timeout
    server.set_read_timeout(5, 0);  // 5 seconds
    server.set_write_timeout(5, 0);

    if (config.gateway.admin_enabled) {
        admin.mount(server);
    }

    auto proxy = [&gateway](const httplib::Request& req, httplib::Response& res) {
        auto response = gateway.handle(to_gateway_request(req));
        if (!response) {
            Logger::debug(Logger::Component::Request,
                fmt::format("No route for {} {} from {}", req.method, req.path, req.remote_addr));
            res.status = 404;
            res.set_content(R"({"error": "No route configured"})", "application/json");
            return;
        }
        write_response(*response, res);
    };

    server.Get(".*", proxy);
    server.Post(".*", proxy);
    server.Put(".*", proxy);
    server.Delete(".*", proxy);
    server.Patch(".*", proxy);

    std::thread server_thread([&]() {
        if (!server.listen(config.gateway.host, config.gateway.port)) {
            Logger::error(Logger::Component::Gateway,
                fmt::format("Failed to listen on {}:{}", config.gateway.host, config.gateway.port));
            shutdown_requested.store(true);
        }
    });

    Logger::info(Logger::Component::Gateway,
        fmt::format("Started on port {}", config.gateway.port));
    std::cout << fmt::format("meshgate started on port {}\n", config.gateway.port);
    std::cout << "Press Ctrl+C to stop\n";

    health_checker.start();
    rate_limiter.start_cleanup();

    int exit_code = 0;
    if (auto started = manager.start_all_services(); !started) {
        Logger::error(Logger::Component::Manager,
            fmt::format("Startup aborted: {}", started.error().message));
        exit_code = 1;
        shutdown_requested.store(true);
    }

    // Wait for shutdown signal
    while (!shutdown_requested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\nShutting down gracefully...\n";
    Logger::info(Logger::Component::Gateway, "Shutting down gracefully");

    manager.stop_all_services();
    server.stop();
    health_checker.stop();
    rate_limiter.stop();

    if (server_thread.joinable()) {
        server_thread.join();
    }

    Logger::shutdown();

    std::cout << "Shutdown complete\n";
    return exit_code;
}
