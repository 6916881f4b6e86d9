#include "../include/http_server.hpp"
#include "../../common/include/errors.hpp"
#include "../../common/include/log.hpp"
#include <sys/types.h>
#include <sys/socket.h>
#include <cstdarg>
#include <cstdint>
#include <cstring>
#include <microhttpd.h>
#include <stdexcept>

using json = nlohmann::json;

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

namespace {
struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
};

MhdResult send_response(struct MHD_Connection* conn, const HttpReply& reply) {
    struct MHD_Response* resp = MHD_create_response_from_buffer(reply.body.size(), (void*)reply.body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, reply.content_type.c_str());
    MhdResult ret = MHD_queue_response(conn, reply.status, resp);
    MHD_destroy_response(resp);
    return ret;
}

std::map<std::string, std::string> parse_query(struct MHD_Connection* conn) {
    std::map<std::string, std::string> out;
    MHD_get_connection_values(conn, MHD_GET_ARGUMENT_KIND,
        [](void* cls, enum MHD_ValueKind, const char* key, const char* val) -> MhdResult {
            auto* m = static_cast<std::map<std::string, std::string>*>(cls);
            (*m)[key ? key : ""] = val ? val : "";
            return MHD_YES;
        }, &out);
    return out;
}

MhdResult dispatch(void* cls, struct MHD_Connection* connection, const char* url, const char* method,
                   const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    auto* server = static_cast<HttpServer*>(cls);
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}};
        *con_cls = ci;
        return MHD_YES;
    }

    if (*upload_data_size) {
        ci->body.append(upload_data, *upload_data_size);
        *upload_data_size = 0;
        return MHD_YES;
    }

    HttpRequest req;
    req.method = ci->method;
    req.path = ci->url;
    req.body = ci->body;
    req.query = parse_query(connection);
    return send_response(connection, server->handle(req));
}

void request_completed(void* /*cls*/, struct MHD_Connection*, void** con_cls, enum MHD_RequestTerminationCode) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}
}

std::string HttpRequest::param(const std::string& key) const {
    auto it = query.find(key);
    return it == query.end() ? std::string() : it->second;
}

HttpReply json_reply(int status, const json& body) {
    return HttpReply{status, body.dump(), "application/json"};
}

HttpReply no_content() {
    return HttpReply{MHD_HTTP_NO_CONTENT, "", "text/plain"};
}

HttpServer::HttpServer(std::string name, Handler handler)
    : name_(std::move(name)), handler_(std::move(handler)) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start(int port) {
    if (daemon_) return;
    daemon_ = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD, (uint16_t)port, nullptr, nullptr,
                               &dispatch, this,
                               MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                               MHD_OPTION_END);
    if (!daemon_) {
        throw std::runtime_error("failed to start HTTP server on port " + std::to_string(port));
    }
    port_ = port;
    const union MHD_DaemonInfo* info = MHD_get_daemon_info(daemon_, MHD_DAEMON_INFO_BIND_PORT);
    if (info && info->port) port_ = info->port;
    log_info(name_, "HTTP server listening on port " + std::to_string(port_));
}

void HttpServer::stop() {
    if (!daemon_) return;
    MHD_stop_daemon(daemon_);
    daemon_ = nullptr;
    port_ = 0;
}

HttpReply HttpServer::handle(const HttpRequest& req) const {
    try {
        return handler_(req);
    } catch (const InvalidArgument& e) {
        return json_reply(MHD_HTTP_BAD_REQUEST, json{{"error", e.what()}});
    } catch (const json::exception& e) {
        return json_reply(MHD_HTTP_BAD_REQUEST, json{{"error", e.what()}});
    } catch (const NotFound& e) {
        return json_reply(MHD_HTTP_NOT_FOUND, json{{"error", e.what()}});
    } catch (const BusUnavailable& e) {
        return json_reply(MHD_HTTP_SERVICE_UNAVAILABLE, json{{"error", e.what()}});
    } catch (const std::exception& e) {
        log_error(name_, req.method + " " + req.path + " failed: " + e.what());
        return json_reply(MHD_HTTP_INTERNAL_SERVER_ERROR, json{{"error", e.what()}});
    }
}
