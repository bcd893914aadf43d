#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace meshgate {

enum class Protocol {
    Http,
    Https,
    Ws,
    Wss
};

enum class InstanceStatus {
    Healthy,
    Unhealthy,
    Unknown
};

inline std::string to_string(Protocol protocol) {
    switch (protocol) {
        case Protocol::Http: return "http";
        case Protocol::Https: return "https";
        case Protocol::Ws: return "ws";
        case Protocol::Wss: return "wss";
        default: return "http";
    }
}

inline std::optional<Protocol> protocol_from_string(const std::string& value) {
    if (value == "http") return Protocol::Http;
    if (value == "https") return Protocol::Https;
    if (value == "ws") return Protocol::Ws;
    if (value == "wss") return Protocol::Wss;
    return std::nullopt;
}

inline std::string to_string(InstanceStatus status) {
    switch (status) {
        case InstanceStatus::Healthy: return "healthy";
        case InstanceStatus::Unhealthy: return "unhealthy";
        case InstanceStatus::Unknown: return "unknown";
        default: return "unknown";
    }
}

// One running backend process
struct ServiceInstance {
    std::string id;
    std::string name;
    std::string version;
    std::string host;
    uint16_t port = 0;
    Protocol protocol = Protocol::Http;
    std::string health_endpoint = "/health";
    std::set<std::string> tags;
    std::vector<std::string> dependencies;
    nlohmann::json metadata = nlohmann::json::object();
    InstanceStatus status = InstanceStatus::Unknown;
    std::chrono::system_clock::time_point registered_at{};
    std::chrono::system_clock::time_point last_health_check{};

    bool has_tags(const std::vector<std::string>& required) const {
        for (const auto& tag : required) {
            if (tags.find(tag) == tags.end()) {
                return false;
            }
        }
        return true;
    }

    // Load-balancing weight from metadata; anything missing or below 1 counts as 1
    int weight() const {
        if (metadata.is_object()) {
            auto it = metadata.find("weight");
            if (it != metadata.end() && it->is_number()) {
                int w = it->get<int>();
                return w > 0 ? w : 1;
            }
        }
        return 1;
    }

    // Scheme used on the wire; websocket instances expose their HTTP endpoints on the same port
    std::string base_url() const {
        bool secure = protocol == Protocol::Https || protocol == Protocol::Wss;
        return std::string(secure ? "https" : "http") + "://" + host + ":" + std::to_string(port);
    }
};

} // namespace meshgate
