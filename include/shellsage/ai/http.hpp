#pragma once
#include <string>
#include <vector>

namespace shellsage::ai {

struct HttpResponse {
    long status = 0;         // HTTP status, 0 when no response was received
    std::string body;
    std::string error;       // libcurl error text; empty when the transfer completed

    bool transport_ok() const { return error.empty(); }
    bool success() const { return error.empty() && status/100 == 2; }
};

// Blocking JSON POST over libcurl.
HttpResponse http_post_json(const std::string& url,
                            const std::vector<std::string>& headers,
                            const std::string& body,
                            int timeout_seconds);

// "HTTP 401: <message>" using the provider's JSON error message when present.
std::string describe_http_failure(const HttpResponse& r);

} // namespace shellsage::ai
