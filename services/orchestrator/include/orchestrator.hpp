#pragma once
#include "agent_registry.hpp"
#include "dispatch_queue.hpp"
#include "task.hpp"
#include "workflow.hpp"
#include "../../../shared/cpp/bus/include/bus.hpp"
#include "../../../shared/cpp/common/include/config.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

struct OrchestratorConfig {
    std::chrono::milliseconds heartbeat_interval{5000};
    int dispatch_retry_ceiling{3};                 // max dispatch attempts per task
    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds dispatch_poll_interval{500};
    std::chrono::milliseconds submission_deadline{60000};
    std::chrono::milliseconds stats_interval{30000}; // 0 disables system.stats
    std::size_t dispatch_workers{4};
    // Static catalogue; when non-empty, registrations must match it.
    std::map<std::string, std::set<std::string>> agent_types;
    WorkflowCatalogue workflows = default_workflows();

    static OrchestratorConfig from(const FleetConfig& cfg);
};

// Agent registry, health monitoring, task dispatch and recovery.
// Everything it learns about agents arrives over the bus; in-process
// callers may also use the methods directly.
class Orchestrator {
public:
    Orchestrator(MessageBus& bus, OrchestratorConfig cfg = {});
    ~Orchestrator();
    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Subscribes to the bus endpoints and starts dispatch and health threads.
    void start();
    void stop();

    // Throws InvalidArgument for an empty type or one the catalogue rejects.
    std::string register_agent(const std::string& agent_type, const std::set<std::string>& capabilities);
    bool deregister(const std::string& agent_id);
    // Heartbeat payload as published by runtimes. Unknown agents that state
    // their type are registered under the id they carry.
    void on_heartbeat(const nlohmann::json& payload);
    // Marks agents silent for more than 3 heartbeat intervals unhealthy.
    std::vector<std::string> check_health();

    // Throws InvalidArgument when the capability is empty.
    std::string submit_task(const std::string& description, const std::string& required_capability,
                            TaskPriority priority = TaskPriority::Low,
                            nlohmann::json input = nlohmann::json::object());
    // Throws NotFound.
    Task wait_for(const std::string& task_id, std::chrono::milliseconds timeout) const;
    // Fails a non-terminal task as cancelled. False when already terminal.
    // Throws NotFound.
    bool cancel_task(const std::string& task_id);

    // One task per step of a catalogued workflow, each tagged with the
    // returned workflow id. Throws InvalidArgument for unknown types.
    std::string submit_workflow(const std::string& type, nlohmann::json data = nlohmann::json::object(),
                                TaskPriority priority = TaskPriority::Low);
    // Aggregate status plus the step tasks; nullopt for unknown ids.
    std::optional<nlohmann::json> workflow(const std::string& workflow_id) const;

    std::optional<Task> task(const std::string& task_id) const;
    std::optional<AgentRecord> agent(const std::string& agent_id) const;
    // Throws NotFound.
    nlohmann::json ping(const std::string& agent_id) const;
    nlohmann::json status() const;

private:
    // Replies the dispatch workers hand off instead of waiting on them.
    struct AwaitedReply {
        std::string task_id;
        std::string agent_id;
        PendingRequest pending;
    };
    struct ReplyBoard {
        std::mutex mtx;
        std::condition_variable cv;
        std::vector<AwaitedReply> awaited;
        bool closed{false};
    };

    std::string enqueue_task(const std::string& description, const std::string& required_capability,
                             TaskPriority priority, nlohmann::json input, std::optional<std::string> workflow_id);
    void dispatch_loop();
    void dispatch_one(const DispatchEntry& entry);
    void collect_loop();
    void settle(AwaitedReply& r);
    std::optional<AgentRecord> pick_agent(const Task& t);
    void on_dispatch_failure(const std::string& task_id, const std::string& agent_id,
                             const std::string& correlation_id, ErrorKind kind, const std::string& error);
    void finish_failed(const Task& t);
    void monitor_loop();
    void publish_quietly(const std::string& topic, nlohmann::json payload);

    void on_register_request(const Message& msg);
    void on_submit_request(const Message& msg);
    void on_status_request(const Message& msg);
    void on_workflow_request(const Message& msg);
    void on_heartbeat_event(const Message& msg);
    void on_agent_stopped(const Message& msg);
    void on_task_started(const Message& msg);
    void reply(const Message& req, const std::function<nlohmann::json()>& fn);

    // Lets bus handlers outlive the orchestrator safely: once closed, late
    // deliveries return without touching it.
    struct HandlerGate;
    MessageHandler gated(void (Orchestrator::*fn)(const Message&), const char* what);

    MessageBus& bus_;
    OrchestratorConfig cfg_;
    AgentRegistry registry_;
    TaskTable tasks_;
    DispatchQueue queue_;

    mutable std::mutex wf_mtx_;
    std::map<std::string, Workflow> workflows_;

    std::mutex rr_mtx_;
    std::map<std::string, std::uint64_t> rr_last_;   // capability -> seq of last pick

    std::mutex run_mtx_;
    std::condition_variable run_cv_;
    bool running_{false};
    bool stopping_{false};
    std::vector<std::thread> workers_;
    std::thread monitor_;
    std::shared_ptr<ReplyBoard> replies_;
    std::thread collector_;
    std::shared_ptr<HandlerGate> gate_;
    std::vector<Subscription> subs_;
};
