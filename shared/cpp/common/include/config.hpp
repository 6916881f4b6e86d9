#pragma once
#include <chrono>
#include <map>
#include <set>
#include <string>

struct FleetConfig {
    std::string broker_url{"http://localhost:7100"};
    int broker_port{7100};
    int orchestrator_port{7200};
    std::string memory_db_path{"./data/memory.db"};

    std::chrono::milliseconds heartbeat_interval{5000};
    int dispatch_retry_ceiling{3};
    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds dispatch_poll_interval{500};
    std::chrono::milliseconds submission_deadline{60000};

    int publish_max_attempts{5};
    std::chrono::milliseconds publish_backoff{50};

    std::chrono::milliseconds working_sweep_interval{1000};
    std::chrono::milliseconds shutdown_grace{5000};

    std::string log_level{"info"};

    // Static catalogue: agent type -> capabilities it may advertise.
    std::map<std::string, std::set<std::string>> agent_types;
};

// Defaults, then environment, then the JSON file named by FLEET_CONFIG (if set).
// Throws InvalidArgument for malformed values.
FleetConfig load_config();

// Overlays the keys present in a JSON config file onto cfg.
void apply_config_file(FleetConfig& cfg, const std::string& path);
