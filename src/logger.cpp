#include "meshgate/logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <vector>

namespace meshgate {

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;

namespace {

// Resolve "logs/..." relative to the first ancestor (up to two levels) that has or can
// create the directory, so the binaries log to the same place from a build dir.
std::string resolve_log_path(const std::string& log_file) {
    std::vector<std::string> candidates{log_file};
    if (log_file.rfind("logs/", 0) == 0) {
        candidates.push_back("../" + log_file);
        candidates.push_back("../../" + log_file);
    }

    for (const auto& candidate : candidates) {
        std::filesystem::path dir = std::filesystem::path(candidate).parent_path();
        if (dir.empty() || std::filesystem::exists(dir)) {
            return candidate;
        }
    }

    std::error_code ec;
    std::filesystem::path dir = std::filesystem::path(log_file).parent_path();
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        std::cerr << "Cannot create log directory " << dir << ": " << ec.message() << std::endl;
    }
    return log_file;
}

} // namespace

void Logger::init(const std::string& log_file, const std::string& log_level,
                 bool is_backend, int backend_port) {
    try {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(spdlog::level::info);

        size_t max_size = is_backend ? 5 * 1024 * 1024 : 20 * 1024 * 1024;
        size_t max_files = is_backend ? 3 : 5;

        std::string target = log_file;
        if (is_backend && backend_port > 0) {
            target = fmt::format("logs/meshgate_backend_{}.log", backend_port);
        }

        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            resolve_log_path(target), max_size, max_files);
        file_sink->set_level(string_to_level(log_level));

        std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
        logger_ = std::make_shared<spdlog::logger>("meshgate", sinks.begin(), sinks.end());

        logger_->set_level(string_to_level(log_level));
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        logger_->flush_on(spdlog::level::warn);

        spdlog::register_logger(logger_);

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::drop_all();
        logger_.reset();
    }
}

void Logger::info(Component component, const std::string& message) {
    if (logger_) {
        logger_->info("[{}] {}", component_to_string(component), message);
    }
}

void Logger::warn(Component component, const std::string& message) {
    if (logger_) {
        logger_->warn("[{}] {}", component_to_string(component), message);
    }
}

void Logger::error(Component component, const std::string& message) {
    if (logger_) {
        logger_->error("[{}] {}", component_to_string(component), message);
    }
}

void Logger::debug(Component component, const std::string& message) {
    if (logger_) {
        logger_->debug("[{}] {}", component_to_string(component), message);
    }
}

std::string Logger::component_to_string(Component component) {
    switch (component) {
        case Component::Gateway: return "Gateway";
        case Component::Registry: return "Registry";
        case Component::HealthCheck: return "HealthCheck";
        case Component::Breaker: return "Breaker";
        case Component::Balancer: return "Balancer";
        case Component::RateLimit: return "RateLimit";
        case Component::Manager: return "Manager";
        case Component::Config: return "Config";
        case Component::Admin: return "Admin";
        case Component::Request: return "Request";
        case Component::Response: return "Response";
        case Component::Backend: return "Backend";
        default: return "Unknown";
    }
}

spdlog::level::level_enum Logger::string_to_level(const std::string& level) {
    std::string upper = level;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "TRACE") return spdlog::level::trace;
    if (upper == "DEBUG") return spdlog::level::debug;
    if (upper == "INFO") return spdlog::level::info;
    if (upper == "WARN" || upper == "WARNING") return spdlog::level::warn;
    if (upper == "ERROR") return spdlog::level::err;
    return spdlog::level::info;
}

} // namespace meshgate
