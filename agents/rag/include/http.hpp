#pragma once
#include <string>

struct HttpResponse {
    long status{0};
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

// Both throw std::runtime_error on transport failure; HTTP error statuses are returned.
HttpResponse http_post_json(const std::string& url, const std::string& json_body, long timeout_ms = 30000);
HttpResponse http_get(const std::string& url, long timeout_ms = 30000);
