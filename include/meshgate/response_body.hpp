#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <string>

namespace meshgate {

class ResponseBody {
public:
    // Parsed JSON when the payload is JSON, otherwise the raw text as a JSON string
    static nlohmann::json decode(const std::string& body);

    // Strings go out verbatim, everything else is serialized as JSON
    static std::string encode(const nlohmann::json& body);

    // Content type to answer with; raw text keeps the upstream's type when it has one
    static std::string content_type_for(const nlohmann::json& body,
                                        const std::string& upstream_content_type);

    // Extract main type before semicolon, lowercased
    static std::string get_content_type_main(const std::string& content_type);
};

// "2026-10-19T08:15:30.123Z"
std::string format_timestamp(std::chrono::system_clock::time_point time);

} // namespace meshgate
