#include <csignal>
#include <string>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include "../include/orchestrator.hpp"
#include "../../../shared/cpp/bus/include/http_bus.hpp"
#include "../../../shared/cpp/common/include/config.hpp"
#include "../../../shared/cpp/common/include/errors.hpp"
#include "../../../shared/cpp/common/include/log.hpp"
#include "../../../shared/cpp/http/include/http_server.hpp"

using json = nlohmann::json;

namespace {
volatile std::sig_atomic_t g_stop = 0;

std::chrono::milliseconds parse_wait(const std::string& s) {
    if (s.empty()) return std::chrono::milliseconds(0);
    try {
        long long v = std::stoll(s);
        if (v < 0) throw InvalidArgument("wait_ms must be >= 0");
        return std::chrono::milliseconds(v);
    } catch (const std::logic_error&) {
        throw InvalidArgument("wait_ms must be a non-negative integer");
    }
}

HttpReply route(Orchestrator& orch, const HttpRequest& req) {
    const std::string& path = req.path;
    if (req.method == "POST" && path == "/tasks") {
        auto j = json::parse(req.body);
        std::string id = orch.submit_task(j.value("description", std::string()),
                                          j.at("capability").get<std::string>(),
                                          parse_task_priority(j.value("priority", std::string("low"))),
                                          j.value("input", json::object()));
        return json_reply(200, json{{"task_id", id}, {"status", "pending"}});
    }
    if (path.rfind("/tasks/", 0) == 0) {
        std::string id = path.substr(std::string("/tasks/").size());
        if (id.empty()) throw InvalidArgument("task id required");
        if (req.method == "GET") {
            auto wait = parse_wait(req.param("wait_ms"));
            if (wait.count() > 0) return json_reply(200, task_to_json(orch.wait_for(id, wait)));
            auto t = orch.task(id);
            if (!t) throw NotFound("unknown task " + id);
            return json_reply(200, task_to_json(*t));
        }
        if (req.method == "DELETE") {
            bool cancelled = orch.cancel_task(id);
            return json_reply(200, json{{"task_id", id}, {"cancelled", cancelled}});
        }
    }
    if (req.method == "POST" && path == "/workflows") {
        auto j = json::parse(req.body);
        std::string id = orch.submit_workflow(j.at("type").get<std::string>(), j.value("data", json::object()),
                                              parse_task_priority(j.value("priority", std::string("low"))));
        return json_reply(200, *orch.workflow(id));
    }
    if (req.method == "GET" && path.rfind("/workflows/", 0) == 0) {
        std::string id = path.substr(std::string("/workflows/").size());
        auto w = orch.workflow(id);
        if (!w) throw NotFound("unknown workflow " + id);
        return json_reply(200, *w);
    }
    if (req.method == "GET" && path == "/status") {
        return json_reply(200, orch.status());
    }
    if (req.method == "GET" && path == "/ping") {
        auto agent = req.param("agent");
        if (agent.empty()) throw InvalidArgument("agent query parameter required");
        return json_reply(200, orch.ping(agent));
    }
    return json_reply(404, json{{"error", "not found"}});
}
}

int main(int, char**) {
    FleetConfig cfg;
    try {
        cfg = load_config();
    } catch (const std::exception& e) {
        log_error("orchestrator", std::string("bad configuration: ") + e.what());
        return 2;
    }
    set_log_level(parse_log_level(cfg.log_level));
    log_info("orchestrator", "Starting. BROKER_URL=" + cfg.broker_url + " port=" + std::to_string(cfg.orchestrator_port));

    HttpBus bus(cfg.broker_url, "orchestrator", RetryPolicy::from(cfg));
    Orchestrator orch(bus, OrchestratorConfig::from(cfg));
    HttpServer server("orchestrator", [&orch](const HttpRequest& req) { return route(orch, req); });
    try {
        orch.start();
        server.start(cfg.orchestrator_port);
    } catch (const std::exception& e) {
        log_error("orchestrator", e.what());
        return 1;
    }

    std::signal(SIGTERM, [](int){ g_stop = 1; });
    std::signal(SIGINT, [](int){ g_stop = 1; });
    while (!g_stop) pause();
    log_info("orchestrator", "shutting down");
    server.stop();
    orch.stop();
    return 0;
}
