#include "../include/config.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <fstream>

using json = nlohmann::json;

namespace {
std::chrono::milliseconds positive_ms(const char* name, long long v) {
    if (v <= 0) throw InvalidArgument(std::string(name) + " must be > 0");
    return std::chrono::milliseconds(v);
}

int positive_int(const char* name, long long v) {
    if (v <= 0) throw InvalidArgument(std::string(name) + " must be > 0");
    return (int)v;
}
}

FleetConfig load_config() {
    FleetConfig cfg;
    cfg.broker_url = getenv_or("BROKER_URL", cfg.broker_url);
    cfg.broker_port = positive_int("BROKER_PORT", getenv_int_or("BROKER_PORT", cfg.broker_port));
    cfg.orchestrator_port = positive_int("ORCHESTRATOR_PORT", getenv_int_or("ORCHESTRATOR_PORT", cfg.orchestrator_port));
    cfg.memory_db_path = getenv_or("MEMORY_DB_PATH", cfg.memory_db_path);
    cfg.heartbeat_interval = positive_ms("HEARTBEAT_MS", getenv_int_or("HEARTBEAT_MS", cfg.heartbeat_interval.count()));
    cfg.dispatch_retry_ceiling = positive_int("DISPATCH_RETRY_CEILING", getenv_int_or("DISPATCH_RETRY_CEILING", cfg.dispatch_retry_ceiling));
    cfg.request_timeout = positive_ms("REQUEST_TIMEOUT_MS", getenv_int_or("REQUEST_TIMEOUT_MS", cfg.request_timeout.count()));
    cfg.dispatch_poll_interval = positive_ms("DISPATCH_POLL_MS", getenv_int_or("DISPATCH_POLL_MS", cfg.dispatch_poll_interval.count()));
    cfg.submission_deadline = positive_ms("SUBMISSION_DEADLINE_MS", getenv_int_or("SUBMISSION_DEADLINE_MS", cfg.submission_deadline.count()));
    cfg.publish_max_attempts = positive_int("PUBLISH_MAX_ATTEMPTS", getenv_int_or("PUBLISH_MAX_ATTEMPTS", cfg.publish_max_attempts));
    cfg.publish_backoff = positive_ms("PUBLISH_BACKOFF_MS", getenv_int_or("PUBLISH_BACKOFF_MS", cfg.publish_backoff.count()));
    cfg.working_sweep_interval = positive_ms("WORKING_SWEEP_MS", getenv_int_or("WORKING_SWEEP_MS", cfg.working_sweep_interval.count()));
    cfg.shutdown_grace = positive_ms("SHUTDOWN_GRACE_MS", getenv_int_or("SHUTDOWN_GRACE_MS", cfg.shutdown_grace.count()));
    cfg.log_level = getenv_or("FLEET_LOG_LEVEL", cfg.log_level);

    auto path = getenv_or("FLEET_CONFIG", "");
    if (!path.empty()) apply_config_file(cfg, path);
    return cfg;
}

void apply_config_file(FleetConfig& cfg, const std::string& path) {
    std::ifstream f(path);
    if (!f) throw InvalidArgument("cannot open config file: " + path);
    json j;
    try {
        j = json::parse(f);
    } catch (const json::parse_error& e) {
        throw InvalidArgument("config file " + path + " is not valid JSON: " + e.what());
    }
    if (!j.is_object()) throw InvalidArgument("config file " + path + " must hold a JSON object");

    try {
        cfg.broker_url = j.value("broker_url", cfg.broker_url);
        cfg.broker_port = positive_int("broker_port", j.value("broker_port", cfg.broker_port));
        cfg.orchestrator_port = positive_int("orchestrator_port", j.value("orchestrator_port", cfg.orchestrator_port));
        cfg.memory_db_path = j.value("memory_db_path", cfg.memory_db_path);
        cfg.heartbeat_interval = positive_ms("heartbeat_ms", j.value("heartbeat_ms", (long long)cfg.heartbeat_interval.count()));
        cfg.dispatch_retry_ceiling = positive_int("dispatch_retry_ceiling", j.value("dispatch_retry_ceiling", cfg.dispatch_retry_ceiling));
        cfg.request_timeout = positive_ms("request_timeout_ms", j.value("request_timeout_ms", (long long)cfg.request_timeout.count()));
        cfg.dispatch_poll_interval = positive_ms("dispatch_poll_ms", j.value("dispatch_poll_ms", (long long)cfg.dispatch_poll_interval.count()));
        cfg.submission_deadline = positive_ms("submission_deadline_ms", j.value("submission_deadline_ms", (long long)cfg.submission_deadline.count()));
        cfg.publish_max_attempts = positive_int("publish_max_attempts", j.value("publish_max_attempts", cfg.publish_max_attempts));
        cfg.publish_backoff = positive_ms("publish_backoff_ms", j.value("publish_backoff_ms", (long long)cfg.publish_backoff.count()));
        cfg.working_sweep_interval = positive_ms("working_sweep_ms", j.value("working_sweep_ms", (long long)cfg.working_sweep_interval.count()));
        cfg.shutdown_grace = positive_ms("shutdown_grace_ms", j.value("shutdown_grace_ms", (long long)cfg.shutdown_grace.count()));
        cfg.log_level = j.value("log_level", cfg.log_level);

        if (j.contains("agent_types")) {
            cfg.agent_types.clear();
            for (auto it = j["agent_types"].begin(); it != j["agent_types"].end(); ++it) {
                cfg.agent_types[it.key()] = it.value().get<std::set<std::string>>();
            }
        }
    } catch (const json::type_error& e) {
        throw InvalidArgument("config file " + path + ": " + e.what());
    }
}
