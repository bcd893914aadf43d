#include "meshgate/response_body.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/chrono.h>
#include <algorithm>
#include <cctype>

using json = nlohmann::json;

namespace meshgate {

json ResponseBody::decode(const std::string& body) {
    if (body.empty()) {
        return body;
    }
    try {
        return json::parse(body);
    } catch (const json::exception&) {
        // Not JSON, pass through as text
        return body;
    }
}

std::string ResponseBody::encode(const json& body) {
    if (body.is_string()) {
        return body.get<std::string>();
    }
    if (body.is_null()) {
        return "";
    }
    return body.dump();
}

std::string ResponseBody::content_type_for(const json& body, const std::string& upstream_content_type) {
    if (!body.is_string()) {
        return "application/json";
    }
    std::string main_type = get_content_type_main(upstream_content_type);
    if (main_type.empty() || main_type.find("json") != std::string::npos) {
        return "text/plain";
    }
    return upstream_content_type;
}

std::string ResponseBody::get_content_type_main(const std::string& content_type) {
    // "text/html; charset=utf-8" -> "text/html"
    size_t semicolon_pos = content_type.find(';');
    std::string main_type = (semicolon_pos != std::string::npos)
                            ? content_type.substr(0, semicolon_pos)
                            : content_type;

    std::transform(main_type.begin(), main_type.end(), main_type.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    main_type.erase(std::remove(main_type.begin(), main_type.end(), ' '), main_type.end());
    return main_type;
}

std::string format_timestamp(std::chrono::system_clock::time_point time) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        time.time_since_epoch()).count() % 1000;
    std::tm utc = fmt::gmtime(std::chrono::system_clock::to_time_t(time));
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}Z", utc, millis);
}

} // namespace meshgate
