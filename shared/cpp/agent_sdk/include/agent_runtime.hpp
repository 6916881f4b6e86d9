#pragma once
#include "agent.hpp"
#include "../../bus/include/recent_ids.hpp"
#include "../../common/include/config.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

enum class RuntimeState { Created, Starting, Running, Stopping, Stopped, Failed };

std::string to_string(RuntimeState s);

struct RuntimeConfig {
    // Empty: ask the orchestrator for an id at start().
    std::string agent_id;
    std::chrono::milliseconds heartbeat_interval{5000};
    std::chrono::milliseconds shutdown_grace{5000};
    std::chrono::milliseconds register_timeout{5000};
    std::size_t dedup_capacity{1024};

    static RuntimeConfig from(const FleetConfig& cfg);
};

// Drives one Agent over the bus:
//   Created -> Starting -> Running -> Stopping -> Stopped
//   Starting | Running -> Failed on an unrecoverable internal error.
// The bus and memory handles must outlive the runtime and any handler it
// abandons at shutdown.
class AgentRuntime {
public:
    AgentRuntime(std::shared_ptr<Agent> agent, MessageBus& bus, MemoryManager& memory, RuntimeConfig cfg = {});
    ~AgentRuntime();
    AgentRuntime(const AgentRuntime&) = delete;
    AgentRuntime& operator=(const AgentRuntime&) = delete;

    // Registers (when no id was configured), subscribes, sends the first
    // heartbeat and enters Running. On failure the runtime is Failed and
    // the error is rethrown.
    void start();
    // Drains in-flight handlers for at most the shutdown grace, then Stopped.
    // Safe to call repeatedly and from any thread.
    void stop();

    RuntimeState state() const;
    // Waits until the runtime reaches `target`; false on timeout.
    bool wait_for(RuntimeState target, std::chrono::milliseconds timeout) const;

    std::string agent_id() const;
    std::size_t in_flight() const;

    // Publishes payload as an event on the target agent's direct topic.
    void send_direct(const std::string& target_agent_id, nlohmann::json payload);

private:
    // Shared with bus handlers through weak_ptr so a late delivery never
    // touches a destroyed runtime.
    struct Core : std::enable_shared_from_this<Core> {
        Core(std::shared_ptr<Agent> a, MessageBus& b, MemoryManager& m, RuntimeConfig c);

        void start();
        void stop(const std::string& reason);
        void fail(const std::string& reason);

        void on_message(const Message& msg);
        void handle_request(const Message& msg);
        void handle_event(const Message& msg);
        void request_fatal_stop(const std::string& reason);

        void heartbeat_loop();
        void send_heartbeat();
        nlohmann::json heartbeat_payload();

        void set_state_locked(RuntimeState s);
        std::vector<Subscription> take_subscriptions_locked();
        void publish_quietly(const std::string& topic, nlohmann::json payload);

        // Correlation id -> cached reply; nullopt while still running.
        bool begin_request(const std::string& corr, std::optional<nlohmann::json>& cached);
        void finish_request(const std::string& corr, const nlohmann::json& reply);

        std::shared_ptr<Agent> agent;
        MessageBus& bus;
        MemoryManager& memory;
        RuntimeConfig cfg;
        std::string agent_id;

        std::mutex lifecycle_mtx;   // serializes start/stop
        mutable std::mutex mtx;
        mutable std::condition_variable cv;
        RuntimeState state{RuntimeState::Created};
        std::size_t in_flight{0};
        std::vector<Subscription> subs;
        bool hb_stop{false};
        std::thread heartbeat;
        std::thread fatal_stopper;
        bool fatal_requested{false};

        std::mutex dedup_mtx;
        std::unordered_map<std::string, std::optional<nlohmann::json>> replies;
        std::deque<std::string> reply_order;
        RecentIds seen_events;
    };

    std::shared_ptr<Core> core_;
};
