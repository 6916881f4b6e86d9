#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <set>
#include <string>
#include "../shared/cpp/common/include/config.hpp"
#include "../shared/cpp/common/include/errors.hpp"
#include "../shared/cpp/common/include/ids.hpp"
#include "../shared/cpp/common/include/log.hpp"
#include "../shared/cpp/common/include/util.hpp"

void test_log_levels() {
    std::cout << "Testing log levels..." << std::endl;
    assert(parse_log_level("debug") == LogLevel::Debug);
    assert(parse_log_level("WARN") == LogLevel::Warn);
    assert(parse_log_level("warning") == LogLevel::Warn);
    assert(parse_log_level("error") == LogLevel::Error);
    assert(parse_log_level("nonsense") == LogLevel::Info);

    LogLevel before = log_level();
    set_log_level(LogLevel::Error);
    assert(log_level() == LogLevel::Error);
    log_info("test", "suppressed");
    set_log_level(before);
    std::cout << "  PASS" << std::endl;
}

void test_ids() {
    std::cout << "Testing generate_id..." << std::endl;
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        std::string id = generate_id();
        assert(id.size() == 32);
        for (char c : id) assert((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'));
        seen.insert(id);
    }
    assert(seen.size() == 1000);
    std::cout << "  PASS" << std::endl;
}

void test_env_helpers() {
    std::cout << "Testing env helpers..." << std::endl;
    ::unsetenv("FLEET_TEST_VALUE");
    assert(getenv_or("FLEET_TEST_VALUE", "dflt") == "dflt");
    assert(getenv_int_or("FLEET_TEST_VALUE", 42) == 42);

    ::setenv("FLEET_TEST_VALUE", "17", 1);
    assert(getenv_or("FLEET_TEST_VALUE", "dflt") == "17");
    assert(getenv_int_or("FLEET_TEST_VALUE", 42) == 17);

    ::setenv("FLEET_TEST_VALUE", "17ms", 1);
    bool threw = false;
    try {
        getenv_int_or("FLEET_TEST_VALUE", 42);
    } catch (const InvalidArgument&) {
        threw = true;
    }
    assert(threw);
    ::unsetenv("FLEET_TEST_VALUE");

    auto tp = from_unix_ms(1700000000123);
    assert(to_unix_ms(tp) == 1700000000123);
    assert(to_lower("PhOTO.JPG") == "photo.jpg");
    std::cout << "  PASS" << std::endl;
}

void test_config_defaults_and_env() {
    std::cout << "Testing load_config..." << std::endl;
    ::unsetenv("FLEET_CONFIG");
    ::unsetenv("HEARTBEAT_MS");
    ::unsetenv("DISPATCH_RETRY_CEILING");
    FleetConfig cfg = load_config();
    assert(cfg.heartbeat_interval.count() == 5000);
    assert(cfg.dispatch_retry_ceiling == 3);
    assert(cfg.publish_max_attempts == 5);

    ::setenv("HEARTBEAT_MS", "250", 1);
    ::setenv("DISPATCH_RETRY_CEILING", "5", 1);
    cfg = load_config();
    assert(cfg.heartbeat_interval.count() == 250);
    assert(cfg.dispatch_retry_ceiling == 5);

    ::setenv("HEARTBEAT_MS", "0", 1);
    bool threw = false;
    try {
        load_config();
    } catch (const InvalidArgument&) {
        threw = true;
    }
    assert(threw);
    ::unsetenv("HEARTBEAT_MS");
    ::unsetenv("DISPATCH_RETRY_CEILING");
    std::cout << "  PASS" << std::endl;
}

void test_config_file() {
    std::cout << "Testing apply_config_file..." << std::endl;
    const std::string path = "fleet_test_config.json";
    {
        std::ofstream f(path);
        f << R"({"request_timeout_ms": 1200, "log_level": "debug",
                 "agent_types": {"photo-agent": ["photo"], "social-media-agent": ["social_media", "marketing"]}})";
    }
    FleetConfig cfg;
    apply_config_file(cfg, path);
    assert(cfg.request_timeout.count() == 1200);
    assert(cfg.log_level == "debug");
    assert(cfg.agent_types.size() == 2);
    assert(cfg.agent_types["social-media-agent"].count("marketing") == 1);
    // untouched keys keep their defaults
    assert(cfg.submission_deadline.count() == 60000);

    {
        std::ofstream f(path);
        f << "{not json";
    }
    bool threw = false;
    try {
        apply_config_file(cfg, path);
    } catch (const InvalidArgument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        apply_config_file(cfg, "does/not/exist.json");
    } catch (const InvalidArgument&) {
        threw = true;
    }
    assert(threw);
    std::remove(path.c_str());
    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== common tests ===" << std::endl;
    test_log_levels();
    test_ids();
    test_env_helpers();
    test_config_defaults_and_env();
    test_config_file();
    std::cout << "All common tests passed." << std::endl;
    return 0;
}
