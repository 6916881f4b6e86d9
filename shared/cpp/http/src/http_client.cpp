#include "../include/http_client.hpp"
#include "../../common/include/errors.hpp"
#include <curl/curl.h>
#include <mutex>
#include <stdexcept>

namespace {
size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

// curl_global_init is not thread-safe; run it once before any easy handle.
void ensure_curl_global() {
    static std::once_flag once;
    std::call_once(once, []{ curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct CurlHandle {
    CURL* h{nullptr};
    CurlHandle() {
        ensure_curl_global();
        h = curl_easy_init();
        if (!h) throw std::runtime_error("curl_easy_init failed");
    }
    ~CurlHandle() { if (h) curl_easy_cleanup(h); }
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
};

struct HeaderList {
    curl_slist* list{nullptr};
    ~HeaderList() { if (list) curl_slist_free_all(list); }
};
}

HttpResponse http_request(const std::string& method, const std::string& url,
                          const std::string& json_body, long timeout_ms) {
    CurlHandle c;
    HeaderList headers;
    std::string buf;

    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &buf);
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(c.h, CURLOPT_NOSIGNAL, 1L);

    if (method == "POST") {
        headers.list = curl_slist_append(headers.list, "Content-Type: application/json");
        curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, headers.list);
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, json_body.c_str());
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, (long)json_body.size());
    } else if (method != "GET") {
        curl_easy_setopt(c.h, CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    CURLcode code = curl_easy_perform(c.h);
    if (code != CURLE_OK) {
        throw TransportError(method + " " + url + " failed: " + curl_easy_strerror(code));
    }
    HttpResponse resp;
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &resp.status);
    resp.body = std::move(buf);
    return resp;
}

HttpResponse http_post_json(const std::string& url, const std::string& json_body, long timeout_ms) {
    return http_request("POST", url, json_body, timeout_ms);
}

HttpResponse http_get(const std::string& url, long timeout_ms) {
    return http_request("GET", url, {}, timeout_ms);
}

HttpResponse http_delete(const std::string& url, long timeout_ms) {
    return http_request("DELETE", url, {}, timeout_ms);
}

std::string url_encode(const std::string& s) {
    CurlHandle c;
    char* out = curl_easy_escape(c.h, s.c_str(), (int)s.size());
    if (!out) throw std::runtime_error("curl_easy_escape failed");
    std::string r(out);
    curl_free(out);
    return r;
}
