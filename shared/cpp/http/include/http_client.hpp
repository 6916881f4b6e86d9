#pragma once
#include <string>

struct HttpResponse {
    long status{0};
    std::string body;
};

// Throws TransportError when the request could not be performed at all
// (connection refused, timeout, DNS). HTTP error statuses are returned.
HttpResponse http_request(const std::string& method, const std::string& url,
                          const std::string& json_body = {}, long timeout_ms = 30000);

HttpResponse http_post_json(const std::string& url, const std::string& json_body, long timeout_ms = 30000);
HttpResponse http_get(const std::string& url, long timeout_ms = 30000);
HttpResponse http_delete(const std::string& url, long timeout_ms = 30000);

std::string url_encode(const std::string& s);
