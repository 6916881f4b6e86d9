#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include "test_support.hpp"
#include "../services/orchestrator/include/orchestrator.hpp"
#include "../shared/cpp/agent_sdk/include/agent_runtime.hpp"
#include "../shared/cpp/bus/include/in_memory_bus.hpp"
#include "../shared/cpp/bus/include/topics.hpp"
#include "../shared/cpp/common/include/errors.hpp"

using json = nlohmann::json;
using std::chrono::milliseconds;

namespace {
// Worker whose behaviour is fixed at construction: "ok", "fail" or "slow".
class WorkerAgent : public Agent {
public:
    WorkerAgent(std::string type, std::set<std::string> caps, std::string behaviour = "ok", int slow_ms = 0)
        : type_(std::move(type)), caps_(std::move(caps)), behaviour_(std::move(behaviour)), slow_ms_(slow_ms) {}

    std::string type() const override { return type_; }
    std::set<std::string> capabilities() const override { return caps_; }

    json receive(const Message& msg, AgentContext& ctx) override {
        if (msg.kind != MessageKind::Request) return json();
        {
            std::lock_guard<std::mutex> lock(mtx_);
            received_.push_back(msg.payload.value("task_id", std::string()));
        }
        if (behaviour_ == "fail") throw AgentHandlerError("worker refused");
        if (behaviour_ == "slow") sleep_ms(slow_ms_);
        return json{{"by", ctx.agent_id}, {"input", msg.payload.value("input", json())}};
    }

    std::vector<std::string> received() {
        std::lock_guard<std::mutex> lock(mtx_);
        return received_;
    }

private:
    std::string type_;
    std::set<std::string> caps_;
    std::string behaviour_;
    int slow_ms_;
    std::mutex mtx_;
    std::vector<std::string> received_;
};

OrchestratorConfig fast_config() {
    OrchestratorConfig oc;
    oc.heartbeat_interval = milliseconds(50);
    oc.dispatch_retry_ceiling = 3;
    oc.request_timeout = milliseconds(500);
    oc.dispatch_poll_interval = milliseconds(20);
    oc.submission_deadline = milliseconds(2000);
    oc.stats_interval = milliseconds(0);
    return oc;
}

RuntimeConfig agent_config(const std::string& id) {
    RuntimeConfig rc;
    rc.agent_id = id;
    rc.heartbeat_interval = milliseconds(50);
    rc.shutdown_grace = milliseconds(1000);
    rc.register_timeout = milliseconds(500);
    return rc;
}

struct Fleet {
    std::shared_ptr<InMemoryBroker> broker = std::make_shared<InMemoryBroker>();
    InMemoryBus orch_bus{broker, "orchestrator"};
    InMemoryBus agent_bus{broker, "agents"};
    InMemoryBus observer{broker, "observer"};
    MemoryManager memory{std::make_shared<SqliteDurableStore>(":memory:")};

    std::unique_ptr<AgentRuntime> spawn(std::shared_ptr<Agent> agent, const std::string& id) {
        auto rt = std::make_unique<AgentRuntime>(std::move(agent), agent_bus, memory, agent_config(id));
        rt->start();
        return rt;
    }
};

bool agent_in(const Orchestrator& orch, const std::string& id, AgentStatus status) {
    return wait_until([&]{
        auto a = orch.agent(id);
        return a && a->status == status;
    });
}

json photo_heartbeat(const std::string& id, const std::string& status = "ready") {
    return json{{"agent_id", id}, {"agent_type", "photo-agent"}, {"capabilities", {"photo"}}, {"status", status}};
}
}

void test_task_completes() {
    std::cout << "Testing task completion..." << std::endl;
    Fleet f;
    std::atomic<int> completed{0};
    auto s = f.observer.subscribe(kTopicTaskCompleted, [&](const Message&) { ++completed; });
    Orchestrator orch(f.orch_bus, fast_config());
    orch.start();

    // no configured id: the runtime registers over the bus
    auto rt = f.spawn(std::make_shared<WorkerAgent>("photo-agent", std::set<std::string>{"photo"}), "");
    std::string id = rt->agent_id();
    assert(!id.empty());
    assert(agent_in(orch, id, AgentStatus::Ready));
    assert(orch.agent(id)->agent_type == "photo-agent");

    std::string task_id = orch.submit_task("organize photos", "photo", TaskPriority::Low, json{{"path", "/tmp"}});
    Task t = orch.wait_for(task_id, milliseconds(2000));
    assert(t.status == TaskStatus::Completed);
    assert(t.assigned_agent && *t.assigned_agent == id);
    assert(t.attempts == 0);
    assert(t.result["by"] == id);
    assert(t.result["input"]["path"] == "/tmp");
    assert(wait_until([&]{ return completed == 1; }));

    json st = orch.status();
    assert(st["tasks"]["counts"]["completed"] == 1);
    assert(st["agents"].size() == 1);
    assert(st["tasks"]["items"][0]["status"] == "completed");
    std::cout << "  PASS" << std::endl;
}

void test_in_progress_state() {
    std::cout << "Testing in-progress tracking..." << std::endl;
    Fleet f;
    Orchestrator orch(f.orch_bus, fast_config());
    orch.start();
    auto rt = f.spawn(std::make_shared<WorkerAgent>("photo-agent", std::set<std::string>{"photo"}, "slow", 300), "slow-1");
    assert(agent_in(orch, "slow-1", AgentStatus::Ready));

    std::string task_id = orch.submit_task("slow job", "photo");
    assert(wait_until([&]{ return orch.task(task_id)->status == TaskStatus::InProgress; }));
    assert(agent_in(orch, "slow-1", AgentStatus::Busy));
    assert(orch.wait_for(task_id, milliseconds(2000)).status == TaskStatus::Completed);
    std::cout << "  PASS" << std::endl;
}

void test_no_eligible_agent() {
    std::cout << "Testing missing capability..." << std::endl;
    Fleet f;
    std::mutex mtx;
    json failed_event;
    auto s = f.observer.subscribe(kTopicTaskFailed, [&](const Message& m) {
        std::lock_guard<std::mutex> lock(mtx);
        failed_event = m.payload;
    });
    OrchestratorConfig oc = fast_config();
    oc.submission_deadline = milliseconds(300);
    Orchestrator orch(f.orch_bus, oc);
    orch.start();
    auto worker = std::make_shared<WorkerAgent>("photo-agent", std::set<std::string>{"photo"});
    auto rt = f.spawn(worker, "photo-1");

    auto t0 = std::chrono::steady_clock::now();
    std::string task_id = orch.submit_task("render video", "video");
    sleep_ms(50);
    assert(orch.task(task_id)->status == TaskStatus::Pending);

    Task t = orch.wait_for(task_id, milliseconds(2000));
    assert(t.status == TaskStatus::Failed);
    assert(t.error_kind == ErrorKind::NoEligibleAgent);
    assert(std::chrono::steady_clock::now() - t0 >= milliseconds(300));
    assert(wait_until([&]{ std::lock_guard<std::mutex> lock(mtx); return failed_event.is_object(); }));
    {
        std::lock_guard<std::mutex> lock(mtx);
        assert(failed_event["task_id"] == task_id);
        assert(failed_event["error_kind"] == "no_eligible_agent");
    }
    assert(worker->received().empty());
    std::cout << "  PASS" << std::endl;
}

void test_late_agent_picks_up_pending_task() {
    std::cout << "Testing pending task with late agent..." << std::endl;
    Fleet f;
    Orchestrator orch(f.orch_bus, fast_config());
    orch.start();
    std::string task_id = orch.submit_task("organize", "photo");
    sleep_ms(100);
    assert(orch.task(task_id)->status == TaskStatus::Pending);

    auto rt = f.spawn(std::make_shared<WorkerAgent>("photo-agent", std::set<std::string>{"photo"}), "late-1");
    Task t = orch.wait_for(task_id, milliseconds(2000));
    assert(t.status == TaskStatus::Completed);
    assert(*t.assigned_agent == "late-1");
    std::cout << "  PASS" << std::endl;
}

void test_unhealthy_and_recovery() {
    std::cout << "Testing health monitoring..." << std::endl;
    Fleet f;
    std::atomic<int> unhealthy_events{0};
    auto s = f.observer.subscribe(kTopicAgentUnhealthy, [&](const Message& m) {
        if (m.payload["agent_id"] == "ghost-1") ++unhealthy_events;
    });
    OrchestratorConfig oc = fast_config();
    oc.submission_deadline = milliseconds(300);
    Orchestrator orch(f.orch_bus, oc);
    orch.start();

    auto t0 = std::chrono::steady_clock::now();
    orch.on_heartbeat(photo_heartbeat("ghost-1"));
    assert(orch.agent("ghost-1")->status == AgentStatus::Ready);
    assert(orch.ping("ghost-1")["healthy"] == true);

    assert(agent_in(orch, "ghost-1", AgentStatus::Unhealthy));
    assert(std::chrono::steady_clock::now() - t0 >= milliseconds(150));
    assert(wait_until([&]{ return unhealthy_events == 1; }));
    assert(orch.ping("ghost-1")["healthy"] == false);

    // still listed, never dispatched to
    json st = orch.status();
    assert(st["agents"].size() == 1);
    assert(st["agents"][0]["status"] == "unhealthy");
    std::string task_id = orch.submit_task("organize", "photo");
    Task t = orch.wait_for(task_id, milliseconds(2000));
    assert(t.status == TaskStatus::Failed && t.error_kind == ErrorKind::NoEligibleAgent);

    orch.on_heartbeat(photo_heartbeat("ghost-1"));
    assert(orch.agent("ghost-1")->status == AgentStatus::Ready);
    std::cout << "  PASS" << std::endl;
}

void test_check_health_direct() {
    std::cout << "Testing check_health..." << std::endl;
    InMemoryBus bus("solo");
    Orchestrator orch(bus, fast_config());
    orch.on_heartbeat(photo_heartbeat("a1"));
    orch.on_heartbeat(photo_heartbeat("a2", "busy"));
    assert(orch.check_health().empty());
    assert(orch.agent("a2")->status == AgentStatus::Busy);
    sleep_ms(100);
    orch.on_heartbeat(photo_heartbeat("a2"));
    sleep_ms(80);
    // a1 silent for 180ms > 150ms, a2 for 80ms
    auto changed = orch.check_health();
    assert(changed.size() == 1 && changed[0] == "a1");
    assert(orch.check_health().empty());

    // heartbeat without a type from an unknown agent is ignored
    orch.on_heartbeat(json{{"agent_id", "stranger"}, {"status", "ready"}});
    assert(!orch.agent("stranger"));
    bool threw = false;
    try {
        orch.on_heartbeat(json{{"status", "ready"}});
    } catch (const InvalidArgument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "  PASS" << std::endl;
}

void test_redispatch_to_other_agent() {
    std::cout << "Testing redispatch after failure..." << std::endl;
    Fleet f;
    Orchestrator orch(f.orch_bus, fast_config());
    orch.start();
    auto flaky = std::make_shared<WorkerAgent>("photo-agent", std::set<std::string>{"photo"}, "fail");
    auto steady = std::make_shared<WorkerAgent>("photo-agent", std::set<std::string>{"photo"});
    auto r1 = f.spawn(flaky, "flaky-1");
    assert(agent_in(orch, "flaky-1", AgentStatus::Ready));
    auto r2 = f.spawn(steady, "steady-2");
    assert(agent_in(orch, "steady-2", AgentStatus::Ready));

    std::string task_id = orch.submit_task("organize", "photo");
    Task t = orch.wait_for(task_id, milliseconds(3000));
    assert(t.status == TaskStatus::Completed);
    assert(t.attempts == 1);
    assert(*t.assigned_agent == "steady-2");
    assert(t.last_failed_agent == "flaky-1");
    assert(flaky->received().size() == 1);
    assert(steady->received().size() == 1);
    // a non-fatal failure leaves the agent in service
    assert(r1->state() == RuntimeState::Running);
    std::cout << "  PASS" << std::endl;
}

void test_retry_ceiling() {
    std::cout << "Testing retry ceiling..." << std::endl;
    Fleet f;
    Orchestrator orch(f.orch_bus, fast_config());
    orch.start();
    auto flaky = std::make_shared<WorkerAgent>("photo-agent", std::set<std::string>{"photo"}, "fail");
    auto rt = f.spawn(flaky, "flaky-1");
    assert(agent_in(orch, "flaky-1", AgentStatus::Ready));

    std::string task_id = orch.submit_task("organize", "photo");
    Task t = orch.wait_for(task_id, milliseconds(3000));
    assert(t.status == TaskStatus::Failed);
    assert(t.attempts == 3);
    assert(t.error_kind == ErrorKind::Handler);
    assert(t.last_error == "worker refused");
    assert(flaky->received().size() == 3);
    std::cout << "  PASS" << std::endl;
}

void test_dispatch_timeout() {
    std::cout << "Testing dispatch timeout..." << std::endl;
    Fleet f;
    OrchestratorConfig oc = fast_config();
    oc.request_timeout = milliseconds(100);
    oc.dispatch_retry_ceiling = 1;
    Orchestrator orch(f.orch_bus, oc);
    orch.start();
    auto rt = f.spawn(std::make_shared<WorkerAgent>("photo-agent", std::set<std::string>{"photo"}, "slow", 300), "slow-1");
    assert(agent_in(orch, "slow-1", AgentStatus::Ready));

    std::string task_id = orch.submit_task("organize", "photo");
    Task t = orch.wait_for(task_id, milliseconds(2000));
    assert(t.status == TaskStatus::Failed);
    assert(t.error_kind == ErrorKind::Timeout);
    assert(t.attempts == 1);
    // the late reply does not resurrect the task
    sleep_ms(350);
    assert(orch.task(task_id)->status == TaskStatus::Failed);
    std::cout << "  PASS" << std::endl;
}

void test_round_robin() {
    std::cout << "Testing round-robin dispatch..." << std::endl;
    Fleet f;
    Orchestrator orch(f.orch_bus, fast_config());
    orch.start();
    std::vector<std::unique_ptr<AgentRuntime>> runtimes;
    for (const std::string id : {"rr-a", "rr-b", "rr-c"}) {
        runtimes.push_back(f.spawn(std::make_shared<WorkerAgent>("photo-agent", std::set<std::string>{"photo"}), id));
        assert(agent_in(orch, id, AgentStatus::Ready));
    }

    std::vector<std::string> order;
    for (int i = 0; i < 6; ++i) {
        Task t = orch.wait_for(orch.submit_task("job", "photo"), milliseconds(2000));
        assert(t.status == TaskStatus::Completed);
        order.push_back(*t.assigned_agent);
    }
    std::vector<std::string> expected = {"rr-a", "rr-b", "rr-c", "rr-a", "rr-b", "rr-c"};
    assert(order == expected);
    std::cout << "  PASS" << std::endl;
}

void test_priority_order() {
    std::cout << "Testing high priority first..." << std::endl;
    Fleet f;
    OrchestratorConfig oc = fast_config();
    oc.dispatch_workers = 1;
    Orchestrator orch(f.orch_bus, oc);
    auto worker = std::make_shared<WorkerAgent>("photo-agent", std::set<std::string>{"photo"});
    auto rt = f.spawn(worker, "prio-1");
    orch.on_heartbeat(photo_heartbeat("prio-1"));

    std::string low1 = orch.submit_task("low one", "photo", TaskPriority::Low);
    std::string low2 = orch.submit_task("low two", "photo", TaskPriority::Low);
    std::string high = orch.submit_task("urgent", "photo", TaskPriority::High);
    assert(orch.status()["queued"] == 3);
    orch.start();

    for (const auto& id : {low1, low2, high}) {
        assert(orch.wait_for(id, milliseconds(3000)).status == TaskStatus::Completed);
    }
    auto got = worker->received();
    assert(got.size() == 3);
    assert(got[0] == high);
    std::cout << "  PASS" << std::endl;
}

void test_slow_agents_do_not_block_dispatch() {
    std::cout << "Testing dispatch past slow agents..." << std::endl;
    Fleet f;
    OrchestratorConfig oc = fast_config();
    oc.dispatch_workers = 1;
    oc.request_timeout = milliseconds(3000);
    Orchestrator orch(f.orch_bus, oc);
    orch.start();
    auto ra = f.spawn(std::make_shared<WorkerAgent>("photo-agent", std::set<std::string>{"photo"}, "slow", 1000), "slow-a");
    auto rb = f.spawn(std::make_shared<WorkerAgent>("photo-agent", std::set<std::string>{"photo"}, "slow", 1000), "slow-b");
    auto rc = f.spawn(std::make_shared<WorkerAgent>("calendar-agent", std::set<std::string>{"calendar"}), "cal-1");
    for (const std::string id : {"slow-a", "slow-b", "cal-1"}) assert(agent_in(orch, id, AgentStatus::Ready));

    std::string p1 = orch.submit_task("organize", "photo");
    std::string p2 = orch.submit_task("organize", "photo");
    assert(wait_until([&]{
        return orch.task(p1)->status != TaskStatus::Pending && orch.task(p2)->status != TaskStatus::Pending;
    }));

    auto begin = std::chrono::steady_clock::now();
    Task cal = orch.wait_for(orch.submit_task("schedule", "calendar"), milliseconds(2000));
    auto took = std::chrono::duration_cast<milliseconds>(std::chrono::steady_clock::now() - begin);
    assert(cal.status == TaskStatus::Completed);
    assert(took.count() < 500);
    assert(!is_terminal(orch.task(p1)->status));

    assert(orch.wait_for(p1, milliseconds(3000)).status == TaskStatus::Completed);
    assert(orch.wait_for(p2, milliseconds(3000)).status == TaskStatus::Completed);
    std::cout << "  PASS" << std::endl;
}

void test_cancel() {
    std::cout << "Testing cancellation..." << std::endl;
    Fleet f;
    Orchestrator orch(f.orch_bus, fast_config());
    orch.start();
    std::string task_id = orch.submit_task("never runs", "photo");
    assert(orch.cancel_task(task_id));
    Task t = orch.wait_for(task_id, milliseconds(100));
    assert(t.status == TaskStatus::Failed);
    assert(t.error_kind == ErrorKind::Cancelled);
    assert(!orch.cancel_task(task_id));

    // an agent arriving afterwards gets nothing
    auto worker = std::make_shared<WorkerAgent>("photo-agent", std::set<std::string>{"photo"});
    auto rt = f.spawn(worker, "photo-1");
    assert(agent_in(orch, "photo-1", AgentStatus::Ready));
    sleep_ms(100);
    assert(worker->received().empty());

    bool threw = false;
    try {
        orch.cancel_task("no-such-task");
    } catch (const NotFound&) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        orch.wait_for("no-such-task", milliseconds(10));
    } catch (const NotFound&) {
        threw = true;
    }
    assert(threw);
    std::cout << "  PASS" << std::endl;
}

void test_catalogue_and_registration() {
    std::cout << "Testing registration rules..." << std::endl;
    Fleet f;
    OrchestratorConfig oc = fast_config();
    oc.agent_types["photo-agent"] = {"photo"};
    Orchestrator orch(f.orch_bus, oc);
    orch.start();

    std::string id = orch.register_agent("photo-agent", {"photo"});
    assert(orch.agent(id)->status == AgentStatus::Starting);
    auto rejected = [&](const std::string& type, const std::set<std::string>& caps) {
        try {
            orch.register_agent(type, caps);
        } catch (const InvalidArgument&) {
            return true;
        }
        return false;
    };
    assert(rejected("video-agent", {"video"}));
    assert(rejected("photo-agent", {"photo", "video"}));
    assert(rejected("", {"photo"}));

    // over the bus the rejection reaches the runtime
    AgentRuntime rt(std::make_shared<WorkerAgent>("video-agent", std::set<std::string>{"video"}),
                    f.agent_bus, f.memory, agent_config(""));
    bool threw = false;
    try {
        rt.start();
    } catch (const FleetError&) {
        threw = true;
    }
    assert(threw);
    assert(rt.state() == RuntimeState::Failed);

    assert(orch.deregister(id));
    assert(!orch.deregister(id));
    assert(!orch.agent(id));
    threw = false;
    try {
        orch.ping(id);
    } catch (const NotFound&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        orch.submit_task("no capability", "");
    } catch (const InvalidArgument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "  PASS" << std::endl;
}

void test_agent_stopped() {
    std::cout << "Testing agent stop notification..." << std::endl;
    Fleet f;
    Orchestrator orch(f.orch_bus, fast_config());
    orch.start();
    auto rt = f.spawn(std::make_shared<WorkerAgent>("photo-agent", std::set<std::string>{"photo"}), "photo-1");
    assert(agent_in(orch, "photo-1", AgentStatus::Ready));
    rt->stop();
    assert(agent_in(orch, "photo-1", AgentStatus::Stopped));
    // stopped agents are not flagged unhealthy
    sleep_ms(200);
    assert(orch.agent("photo-1")->status == AgentStatus::Stopped);
    assert(orch.ping("photo-1")["healthy"] == false);
    std::cout << "  PASS" << std::endl;
}

void test_bus_endpoints() {
    std::cout << "Testing orchestrator bus endpoints..." << std::endl;
    Fleet f;
    std::atomic<int> stats{0}, started{0};
    auto s1 = f.observer.subscribe(kTopicSystemStats, [&](const Message& m) {
        if (m.payload.contains("tasks")) ++stats;
    });
    auto s2 = f.observer.subscribe(kTopicSystemStarted, [&](const Message&) { ++started; });
    OrchestratorConfig oc = fast_config();
    oc.stats_interval = milliseconds(50);
    Orchestrator orch(f.orch_bus, oc);
    orch.start();
    assert(wait_until([&]{ return started == 1; }));

    bool threw = false;
    try {
        orch.start();
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    auto rt = f.spawn(std::make_shared<WorkerAgent>("photo-agent", std::set<std::string>{"photo"}), "photo-1");
    assert(agent_in(orch, "photo-1", AgentStatus::Ready));

    Message r = f.observer.request(kTopicSubmit, json{{"description", "organize"}, {"capability", "photo"},
                                                      {"priority", "high"}}, milliseconds(1000));
    assert(is_ok_payload(r.payload));
    std::string task_id = r.payload["result"]["task_id"].get<std::string>();
    assert(orch.wait_for(task_id, milliseconds(2000)).status == TaskStatus::Completed);

    Message bad = f.observer.request(kTopicSubmit, json{{"description", "x"}}, milliseconds(1000));
    assert(!is_ok_payload(bad.payload));
    assert(bad.payload["kind"] == "invalid_argument");
    Message bad_prio = f.observer.request(kTopicSubmit, json{{"capability", "photo"}, {"priority", "urgent"}},
                                          milliseconds(1000));
    assert(bad_prio.payload["kind"] == "invalid_argument");

    Message st = f.observer.request(kTopicStatus, json::object(), milliseconds(1000));
    assert(is_ok_payload(st.payload));
    assert(st.payload["result"]["tasks"]["counts"]["completed"] == 1);
    assert(st.payload["result"]["agents"][0]["agent_id"] == "photo-1");

    assert(wait_until([&]{ return stats >= 2; }));
    std::cout << "  PASS" << std::endl;
}

void test_workflow_status_rules() {
    std::cout << "Testing workflow status aggregation..." << std::endl;
    auto steps = [](std::vector<TaskStatus> statuses) {
        std::vector<Task> out;
        for (auto st : statuses) {
            Task t;
            t.status = st;
            out.push_back(t);
        }
        return out;
    };
    assert(workflow_status(steps({TaskStatus::Pending, TaskStatus::Pending})) == WorkflowStatus::Pending);
    assert(workflow_status(steps({TaskStatus::Dispatched, TaskStatus::Pending})) == WorkflowStatus::Running);
    assert(workflow_status(steps({TaskStatus::Completed, TaskStatus::Pending})) == WorkflowStatus::Running);
    assert(workflow_status(steps({TaskStatus::Failed, TaskStatus::InProgress})) == WorkflowStatus::Running);
    assert(workflow_status(steps({TaskStatus::Failed, TaskStatus::Completed})) == WorkflowStatus::Failed);
    assert(workflow_status(steps({TaskStatus::Completed, TaskStatus::Completed})) == WorkflowStatus::Completed);

    WorkflowStep step{"photo", "organize_photos", "organize", json{{"recursive", true}}};
    json in = step_input(step, json{{"path", "/srv/shoot"}, {"type", "ignored"}}, "wf-1");
    assert(in["path"] == "/srv/shoot");
    assert(in["recursive"] == true);
    assert(in["type"] == "organize_photos");
    assert(in["workflow_id"] == "wf-1");

    auto cat = parse_workflow_catalogue(json{{"shoot", json::array({json{{"capability", "photo"}, {"action", "organize_photos"}}})}});
    assert(cat.at("shoot").size() == 1);
    assert(cat.at("shoot")[0].description == "organize_photos");
    bool threw = false;
    try {
        parse_workflow_catalogue(json{{"empty", json::array()}});
    } catch (const InvalidArgument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "  PASS" << std::endl;
}

void test_workflows() {
    std::cout << "Testing workflows..." << std::endl;
    Fleet f;
    OrchestratorConfig oc = fast_config();
    oc.workflows["shoot_and_render"] = {{"photo", "organize_photos", "organize"}, {"video", "render", "render"}};
    Orchestrator orch(f.orch_bus, oc);
    orch.start();

    std::string wf = orch.submit_workflow("complete_photo_workflow", json{{"path", "/srv/shoot"}});
    auto view = orch.workflow(wf);
    assert(view);
    assert((*view)["type"] == "complete_photo_workflow");
    assert((*view)["status"] == "pending");
    assert((*view)["tasks"].size() == 3);

    auto photo = std::make_shared<WorkerAgent>("photo-agent", std::set<std::string>{"photo"});
    auto social = std::make_shared<WorkerAgent>("social-media-agent", std::set<std::string>{"marketing", "social_media"});
    auto rt1 = f.spawn(photo, "photo-1");
    auto rt2 = f.spawn(social, "social-1");
    assert(wait_until([&]{ return (*orch.workflow(wf))["status"] == "completed"; }));

    view = orch.workflow(wf);
    const std::vector<std::string> caps = {"photo", "marketing", "social_media"};
    const std::vector<std::string> actions = {"organize_photos", "suggest_content", "schedule_posts"};
    for (std::size_t i = 0; i < 3; ++i) {
        const auto& t = (*view)["tasks"][i];
        assert(t["workflow_id"] == wf);
        assert(t["required_capability"] == caps[i]);
        assert(t["result"]["input"]["type"] == actions[i]);
        assert(t["result"]["input"]["workflow_id"] == wf);
        assert(t["result"]["input"]["path"] == "/srv/shoot");
        auto task = orch.task(t["task_id"].get<std::string>());
        assert(task && task->workflow_id && *task->workflow_id == wf);
    }
    assert(photo->received().size() == 1);
    assert(social->received().size() == 2);

    // a cancelled step fails the workflow once every step has settled
    std::string doomed = orch.submit_workflow("shoot_and_render");
    std::string render = (*orch.workflow(doomed))["tasks"][1]["task_id"].get<std::string>();
    assert(orch.cancel_task(render));
    assert(wait_until([&]{ return (*orch.workflow(doomed))["status"] == "failed"; }));
    assert((*orch.workflow(doomed))["tasks"][0]["status"] == "completed");

    auto rejected = [&](const std::string& type, const json& data) {
        try {
            orch.submit_workflow(type, data);
        } catch (const InvalidArgument&) {
            return true;
        }
        return false;
    };
    assert(rejected("world_tour", json::object()));
    assert(rejected("complete_photo_workflow", json::array()));
    assert(!orch.workflow("no-such-workflow"));

    Message r = f.observer.request(kTopicWorkflow, json{{"type", "complete_photo_workflow"},
                                                        {"data", {{"path", "/srv/other"}}}}, milliseconds(1000));
    assert(is_ok_payload(r.payload));
    std::string over_bus = r.payload["result"]["workflow_id"].get<std::string>();
    assert(wait_until([&]{ return (*orch.workflow(over_bus))["status"] == "completed"; }));
    Message look = f.observer.request(kTopicWorkflow, json{{"workflow_id", over_bus}}, milliseconds(1000));
    assert(look.payload["result"]["status"] == "completed");
    Message bad = f.observer.request(kTopicWorkflow, json{{"type", "world_tour"}}, milliseconds(1000));
    assert(bad.payload["kind"] == "invalid_argument");
    Message missing = f.observer.request(kTopicWorkflow, json{{"workflow_id", "nope"}}, milliseconds(1000));
    assert(missing.payload["kind"] == "not_found");

    assert(orch.status()["workflows"] == 3);
    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== orchestrator tests ===" << std::endl;
    test_task_completes();
    test_in_progress_state();
    test_no_eligible_agent();
    test_late_agent_picks_up_pending_task();
    test_unhealthy_and_recovery();
    test_check_health_direct();
    test_redispatch_to_other_agent();
    test_retry_ceiling();
    test_dispatch_timeout();
    test_round_robin();
    test_priority_order();
    test_slow_agents_do_not_block_dispatch();
    test_cancel();
    test_catalogue_and_registration();
    test_agent_stopped();
    test_bus_endpoints();
    test_workflow_status_rules();
    test_workflows();
    std::cout << "All orchestrator tests passed." << std::endl;
    return 0;
}
