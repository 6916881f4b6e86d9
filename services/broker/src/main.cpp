#include <csignal>
#include <string>
#include <unistd.h>
#include "../include/broker_routes.hpp"
#include "../../../shared/cpp/common/include/config.hpp"
#include "../../../shared/cpp/common/include/log.hpp"
#include "../../../shared/cpp/common/include/util.hpp"

namespace {
volatile std::sig_atomic_t g_stop = 0;
}

int main(int, char**) {
    FleetConfig cfg;
    std::chrono::milliseconds visibility{30000};
    std::chrono::milliseconds lease{60000};
    try {
        cfg = load_config();
        visibility = std::chrono::milliseconds(getenv_int_or("BROKER_VISIBILITY_MS", visibility.count()));
        lease = std::chrono::milliseconds(getenv_int_or("BROKER_SUBSCRIPTION_LEASE_MS", lease.count()));
    } catch (const std::exception& e) {
        log_error("broker", std::string("bad configuration: ") + e.what());
        return 2;
    }
    set_log_level(parse_log_level(cfg.log_level));
    log_info("broker", "Starting. visibility_ms=" + std::to_string(visibility.count()) +
             " lease_ms=" + std::to_string(lease.count()));

    TopicBroker broker(visibility, lease);
    HttpServer server("broker", [&broker](const HttpRequest& req) { return handle_broker_request(broker, req); });
    try {
        server.start(cfg.broker_port);
    } catch (const std::exception& e) {
        log_error("broker", e.what());
        return 1;
    }

    std::signal(SIGTERM, [](int){ g_stop = 1; });
    std::signal(SIGINT, [](int){ g_stop = 1; });
    while (!g_stop) pause();
    log_info("broker", "shutting down");
    server.stop();
    return 0;
}
