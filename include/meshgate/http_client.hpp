#pragma once

#include "meshgate/error.hpp"
#include <chrono>
#include <expected>
#include <map>
#include <stop_token>
#include <string>

namespace meshgate {

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;
using QueryMap = std::map<std::string, std::string>;

struct HttpRequest {
    std::string method = "GET";
    std::string base_url;   // scheme://host:port
    std::string path = "/";
    QueryMap query;
    HeaderMap headers;
    std::string body;
};

struct HttpResponse {
    int status = 0;
    HeaderMap headers;
    std::string body;
};

// Outbound HTTP seam used for health probes and proxied calls
class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Transport failures come back as Upstream errors; any status code is a response.
    // Implementations abandon the call when the token is stopped.
    virtual std::expected<HttpResponse, Error> send(const HttpRequest& request,
                                                    std::chrono::milliseconds timeout,
                                                    std::stop_token token) = 0;
};

class HttplibClient : public HttpClient {
public:
    std::expected<HttpResponse, Error> send(const HttpRequest& request,
                                            std::chrono::milliseconds timeout,
                                            std::stop_token token) override;
};

} // namespace meshgate
