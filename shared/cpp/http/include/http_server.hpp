#pragma once
#include <functional>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

struct MHD_Daemon;

struct HttpRequest {
    std::string method;
    std::string path;
    std::string body;
    std::map<std::string, std::string> query;

    // Empty string when the parameter is absent.
    std::string param(const std::string& key) const;
};

struct HttpReply {
    int status{200};
    std::string body;
    std::string content_type{"application/json"};
};

HttpReply json_reply(int status, const nlohmann::json& body);
HttpReply no_content();

// Embedded libmicrohttpd server dispatching every request to one handler.
// Exceptions escaping the handler become JSON error replies:
// InvalidArgument / json errors -> 400, NotFound -> 404,
// BusUnavailable -> 503, anything else -> 500.
class HttpServer {
public:
    using Handler = std::function<HttpReply(const HttpRequest&)>;

    HttpServer(std::string name, Handler handler);
    ~HttpServer();
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Throws std::runtime_error when the daemon cannot bind. Port 0 binds
    // an ephemeral port; port() reports the one chosen.
    void start(int port);
    void stop();
    int port() const { return port_; }

    HttpReply handle(const HttpRequest& req) const;

private:
    std::string name_;
    Handler handler_;
    MHD_Daemon* daemon_{nullptr};
    int port_{0};
};
