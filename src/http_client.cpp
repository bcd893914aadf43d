#include "meshgate/http_client.hpp"
#include <httplib.h>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>

namespace meshgate {

bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
}

std::expected<HttpResponse, Error> HttplibClient::send(const HttpRequest& request,
                                                       std::chrono::milliseconds timeout,
                                                       std::stop_token token) {
    if (token.stop_requested()) {
        return std::unexpected(Error{ErrorCode::Timeout, "Request cancelled before dispatch"});
    }

    try {
        httplib::Client client(request.base_url);
        client.set_connection_timeout(timeout);
        client.set_read_timeout(timeout);
        client.set_write_timeout(timeout);

        // Shuts the socket down from the cancelling thread
        std::stop_callback cancel(token, [&client] { client.stop(); });

        httplib::Params params(request.query.begin(), request.query.end());

        httplib::Request req;
        req.method = request.method;
        req.path = httplib::append_query_params(request.path, params);
        for (const auto& [name, value] : request.headers) {
            req.headers.emplace(name, value);
        }
        req.body = request.body;

        auto result = client.send(req);
        if (!result) {
            if (token.stop_requested()) {
                return std::unexpected(Error{ErrorCode::Timeout,
                    fmt::format("{} {}{} cancelled", request.method, request.base_url, request.path)});
            }
            return std::unexpected(Error{ErrorCode::Upstream,
                fmt::format("{} {}{} failed: {}", request.method, request.base_url, request.path,
                            httplib::to_string(result.error()))});
        }

        HttpResponse response;
        response.status = result->status;
        for (const auto& [name, value] : result->headers) {
            response.headers[name] = value;
        }
        response.body = result->body;
        return response;

    } catch (const std::exception& e) {
        return std::unexpected(Error{ErrorCode::Upstream,
            fmt::format("{} {}{} raised: {}", request.method, request.base_url, request.path, e.what())});
    }
}

} // namespace meshgate
