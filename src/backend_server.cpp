#include "meshgate/logger.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <iostream>
#include <csignal>
#include <atomic>
#include <chrono>

using json = nlohmann::json;
using namespace meshgate;

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        shutdown_requested.store(true);
    }
}

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <port>" << std::endl;
        return 1;
    }

    int port = 0;
    try {
        port = std::stoi(argv[1]);
    } catch (const std::exception& e) {
        std::cerr << "Invalid port '" << argv[1] << "': " << e.what() << std::endl;
        return 1;
    }

    // Install signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Logger::init("backend.log", "INFO", true, port);

    Logger::info(Logger::Component::Backend,
        fmt::format("Started on port {}", port));

    auto started_at = std::chrono::steady_clock::now();
    // While set, every route except /fail answers 500
    std::atomic<bool> failing{false};
    std::atomic<uint64_t> requests{0};

    httplib::Server server;

    server.Get("/health", [&](const httplib::Request& req, httplib::Response& res) {
        Logger::debug(Logger::Component::Backend,
            fmt::format("Health check from {}", req.remote_addr));

        auto uptime = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_at).count();
        json response;
        response["status"] = failing.load() ? "unhealthy" : "healthy";
        response["version"] = "1.0.0";
        response["uptime"] = uptime;
        response["customMetrics"] = {{"requests", requests.load()}, {"port", port}};

        res.status = failing.load() ? 500 : 200;
        res.set_content(response.dump(), "application/json");
    });

    // Toggle failure injection
    server.Post("/fail", [&](const httplib::Request& req, httplib::Response& res) {
        bool enable = !req.has_param("enabled") || req.get_param_value("enabled") != "false";
        failing.store(enable);
        Logger::warn(Logger::Component::Backend,
            fmt::format("Failure injection {}", enable ? "enabled" : "disabled"));

        json response;
        response["failing"] = enable;
        res.set_content(response.dump(), "application/json");
    });

    auto echo = [&](const httplib::Request& req, httplib::Response& res) {
        auto start_time = std::chrono::steady_clock::now();
        ++requests;

        Logger::info(Logger::Component::Request,
            fmt::format("{} {} from {} ({})", req.method, req.path, req.remote_addr,
                        req.get_header_value("x-request-id")));

        json response;
        if (failing.load()) {
            res.status = 500;
            response["error"] = "Injected failure";
            response["port"] = port;
        } else {
            response["message"] = fmt::format("{} received by backend", req.method);
            response["port"] = port;
            response["path"] = req.path;
            response["method"] = req.method;
            response["body_size"] = req.body.size();
            response["request_id"] = req.get_header_value("x-request-id");
        }

        res.set_content(response.dump(), "application/json");

        auto end_time = std::chrono::steady_clock::now();
        auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time).count();

        Logger::info(Logger::Component::Response,
            fmt::format("{} ({}ms)", res.status, duration_ms));
    };

    server.Get(".*", echo);
    server.Post(".*", echo);
    server.Put(".*", echo);
    server.Delete(".*", echo);
    server.Patch(".*", echo);

    std::cout << fmt::format("Backend server started on port {}\n", port);
    std::cout << "Press Ctrl+C to stop\n";

    // Run server in a separate thread to allow graceful shutdown
    std::thread server_thread([&]() {
        if (!server.listen("0.0.0.0", port)) {
            Logger::error(Logger::Component::Backend, fmt::format("Failed to listen on port {}", port));
            shutdown_requested.store(true);
        }
    });

    // Wait for shutdown signal
    while (!shutdown_requested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\nShutting down backend server...\n";
    Logger::info(Logger::Component::Backend,
        fmt::format("Backend on port {} shutting down", port));

    server.stop();

    if (server_thread.joinable()) {
        server_thread.join();
    }

    Logger::shutdown();

    return 0;
}
