#include "../include/orchestrator.hpp"
#include "../../../shared/cpp/bus/include/topics.hpp"
#include "../../../shared/cpp/common/include/errors.hpp"
#include "../../../shared/cpp/common/include/ids.hpp"
#include "../../../shared/cpp/common/include/log.hpp"
#include <algorithm>
#include <stdexcept>

using json = nlohmann::json;
using SteadyClock = std::chrono::steady_clock;

struct Orchestrator::HandlerGate {
    std::mutex mtx;
    std::condition_variable cv;
    bool open{false};
    std::size_t active{0};
};

OrchestratorConfig OrchestratorConfig::from(const FleetConfig& cfg) {
    OrchestratorConfig oc;
    oc.heartbeat_interval = cfg.heartbeat_interval;
    oc.dispatch_retry_ceiling = cfg.dispatch_retry_ceiling;
    oc.request_timeout = cfg.request_timeout;
    oc.dispatch_poll_interval = cfg.dispatch_poll_interval;
    oc.submission_deadline = cfg.submission_deadline;
    oc.agent_types = cfg.agent_types;
    return oc;
}

Orchestrator::Orchestrator(MessageBus& bus, OrchestratorConfig cfg)
    : bus_(bus), cfg_(std::move(cfg)), replies_(std::make_shared<ReplyBoard>()),
      gate_(std::make_shared<HandlerGate>()) {
    if (cfg_.dispatch_retry_ceiling < 1) throw InvalidArgument("dispatch retry ceiling must be >= 1");
    if (cfg_.heartbeat_interval.count() <= 0) throw InvalidArgument("heartbeat interval must be positive");
    if (cfg_.dispatch_workers == 0) cfg_.dispatch_workers = 1;
}

Orchestrator::~Orchestrator() {
    stop();
}

MessageHandler Orchestrator::gated(void (Orchestrator::*fn)(const Message&), const char* what) {
    auto gate = gate_;
    std::string name = what;
    return [this, gate, fn, name](const Message& m) {
        {
            std::lock_guard<std::mutex> lock(gate->mtx);
            if (!gate->open) return;
            ++gate->active;
        }
        try {
            (this->*fn)(m);
        } catch (const std::exception& e) {
            log_error("orchestrator", name + " handler failed for message " + m.id + ": " + e.what());
        }
        {
            std::lock_guard<std::mutex> lock(gate->mtx);
            --gate->active;
        }
        gate->cv.notify_all();
    };
}

void Orchestrator::start() {
    {
        std::lock_guard<std::mutex> lock(run_mtx_);
        if (running_ || stopping_) throw std::logic_error("orchestrator can only be started once");
        running_ = true;
    }
    {
        std::lock_guard<std::mutex> lock(gate_->mtx);
        gate_->open = true;
    }

    auto group = SubscribeOptions::consumer_group("orchestrator");
    subs_.push_back(bus_.subscribe(kTopicRegister, gated(&Orchestrator::on_register_request, "register"), group));
    subs_.push_back(bus_.subscribe(kTopicSubmit, gated(&Orchestrator::on_submit_request, "submit"), group));
    subs_.push_back(bus_.subscribe(kTopicStatus, gated(&Orchestrator::on_status_request, "status"), group));
    subs_.push_back(bus_.subscribe(kTopicWorkflow, gated(&Orchestrator::on_workflow_request, "workflow"), group));
    subs_.push_back(bus_.subscribe(kTopicHeartbeat, gated(&Orchestrator::on_heartbeat_event, "heartbeat")));
    subs_.push_back(bus_.subscribe(kTopicAgentStopped, gated(&Orchestrator::on_agent_stopped, "agent.stopped")));
    subs_.push_back(bus_.subscribe(kTopicTaskStarted, gated(&Orchestrator::on_task_started, "task.started")));

    for (std::size_t i = 0; i < cfg_.dispatch_workers; ++i) {
        workers_.emplace_back([this]{ dispatch_loop(); });
    }
    monitor_ = std::thread([this]{ monitor_loop(); });
    collector_ = std::thread([this]{ collect_loop(); });

    log_info("orchestrator", "Started. heartbeat_ms=" + std::to_string(cfg_.heartbeat_interval.count()) +
             " retry_ceiling=" + std::to_string(cfg_.dispatch_retry_ceiling) +
             " workers=" + std::to_string(cfg_.dispatch_workers));
    publish_quietly(kTopicSystemStarted, {{"agents", registry_.size()}});
}

void Orchestrator::stop() {
    {
        std::lock_guard<std::mutex> lock(run_mtx_);
        if (!running_) return;
        running_ = false;
        stopping_ = true;
    }
    run_cv_.notify_all();
    log_info("orchestrator", "Stopping");
    publish_quietly(kTopicSystemStopping, json::object());

    {
        std::unique_lock<std::mutex> lock(gate_->mtx);
        gate_->open = false;
        gate_->cv.wait(lock, [this]{ return gate_->active == 0; });
    }
    subs_.clear();

    queue_.close();
    for (auto& w : workers_) {
        if (w.joinable()) w.join();
    }
    workers_.clear();
    if (monitor_.joinable()) monitor_.join();

    std::vector<AwaitedReply> abandoned;
    {
        std::lock_guard<std::mutex> lock(replies_->mtx);
        replies_->closed = true;
        abandoned.swap(replies_->awaited);
    }
    replies_->cv.notify_all();
    if (collector_.joinable()) collector_.join();
    for (auto& r : abandoned) r.pending.cancel();
}

void Orchestrator::publish_quietly(const std::string& topic, json payload) {
    try {
        bus_.publish(topic, std::move(payload));
    } catch (const BusUnavailable& e) {
        log_warn("orchestrator", "Could not publish " + topic + ": " + e.what());
    }
}

std::string Orchestrator::register_agent(const std::string& agent_type, const std::set<std::string>& capabilities) {
    if (agent_type.empty()) throw InvalidArgument("agent_type required");
    if (!cfg_.agent_types.empty()) {
        auto it = cfg_.agent_types.find(agent_type);
        if (it == cfg_.agent_types.end()) throw InvalidArgument("unknown agent type: " + agent_type);
        for (const auto& c : capabilities) {
            if (!it->second.count(c)) throw InvalidArgument("agent type " + agent_type + " may not advertise " + c);
        }
    }
    auto rec = registry_.add(agent_type, capabilities);
    log_info("orchestrator", "Registered agent " + rec.agent_id + " (" + agent_type + ")");
    return rec.agent_id;
}

bool Orchestrator::deregister(const std::string& agent_id) {
    bool removed = registry_.remove(agent_id);
    if (removed) log_info("orchestrator", "Deregistered agent " + agent_id);
    return removed;
}

void Orchestrator::on_heartbeat(const json& payload) {
    if (!payload.is_object() || !payload.contains("agent_id") || !payload["agent_id"].is_string()) {
        throw InvalidArgument("heartbeat without agent_id");
    }
    std::string id = payload["agent_id"].get<std::string>();
    auto reported = payload.value("status", std::string("ready")) == "busy" ? AgentStatus::Busy : AgentStatus::Ready;
    auto now = SteadyClock::now();

    auto prev = registry_.heartbeat(id, reported, now);
    if (!prev) {
        std::string type = payload.value("agent_type", std::string());
        if (type.empty()) {
            log_warn("orchestrator", "Heartbeat from unknown agent " + id);
            return;
        }
        auto caps = payload.value("capabilities", json::array()).get<std::set<std::string>>();
        if (!cfg_.agent_types.empty()) {
            auto it = cfg_.agent_types.find(type);
            if (it == cfg_.agent_types.end()) throw InvalidArgument("unknown agent type: " + type);
        }
        try {
            registry_.add(type, caps, id);
            log_info("orchestrator", "Agent " + id + " (" + type + ") joined via heartbeat");
        } catch (const InvalidArgument&) {
            // registered concurrently; the heartbeat below still applies
        }
        registry_.heartbeat(id, reported, now);
        return;
    }
    if (*prev == AgentStatus::Unhealthy) {
        log_info("orchestrator", "Agent " + id + " recovered, now " + to_string(reported));
    } else if (*prev == AgentStatus::Starting || *prev == AgentStatus::Stopped) {
        log_info("orchestrator", "Agent " + id + " " + to_string(*prev) + " -> " + to_string(reported));
    }
}

std::vector<std::string> Orchestrator::check_health() {
    auto now = SteadyClock::now();
    auto changed = registry_.mark_stale(now, cfg_.heartbeat_interval * 3);
    for (const auto& id : changed) {
        auto rec = registry_.get(id);
        log_warn("orchestrator", "Agent " + id + " unhealthy: no heartbeat within " +
                 std::to_string((cfg_.heartbeat_interval * 3).count()) + "ms");
        json ev = {{"agent_id", id}};
        if (rec) ev = agent_to_json(*rec, now);
        publish_quietly(kTopicAgentUnhealthy, ev);
    }
    return changed;
}

std::string Orchestrator::submit_task(const std::string& description, const std::string& required_capability,
                                      TaskPriority priority, json input) {
    return enqueue_task(description, required_capability, priority, std::move(input), std::nullopt);
}

std::string Orchestrator::enqueue_task(const std::string& description, const std::string& required_capability,
                                       TaskPriority priority, json input, std::optional<std::string> workflow_id) {
    if (required_capability.empty()) throw InvalidArgument("required_capability must not be empty");
    Task t;
    t.task_id = generate_id();
    t.description = description;
    t.required_capability = required_capability;
    t.priority = priority;
    t.input = input.is_null() ? json::object() : std::move(input);
    t.workflow_id = std::move(workflow_id);
    t.submitted_at = std::chrono::system_clock::now();
    t.updated_at = t.submitted_at;
    t.deadline = SteadyClock::now() + cfg_.submission_deadline;
    std::string id = t.task_id;
    tasks_.add(std::move(t));
    queue_.push(id, priority);
    log_info("orchestrator", "Task " + id + " submitted (capability=" + required_capability +
             " priority=" + to_string(priority) + ")");
    return id;
}

std::string Orchestrator::submit_workflow(const std::string& type, json data, TaskPriority priority) {
    auto it = cfg_.workflows.find(type);
    if (it == cfg_.workflows.end()) throw InvalidArgument("unknown workflow type: " + type);
    if (!data.is_null() && !data.is_object()) throw InvalidArgument("workflow data must be an object");

    Workflow w;
    w.workflow_id = generate_id();
    w.type = type;
    w.submitted_at = std::chrono::system_clock::now();
    for (const auto& step : it->second) {
        w.task_ids.push_back(enqueue_task(step.description, step.capability, priority,
                                          step_input(step, data, w.workflow_id), w.workflow_id));
    }
    std::string id = w.workflow_id;
    log_info("orchestrator", "Workflow " + id + " (" + type + ") submitted with " +
             std::to_string(w.task_ids.size()) + " task(s)");
    std::lock_guard<std::mutex> lock(wf_mtx_);
    workflows_[id] = std::move(w);
    return id;
}

std::optional<json> Orchestrator::workflow(const std::string& workflow_id) const {
    Workflow w;
    {
        std::lock_guard<std::mutex> lock(wf_mtx_);
        auto it = workflows_.find(workflow_id);
        if (it == workflows_.end()) return std::nullopt;
        w = it->second;
    }
    std::vector<Task> steps;
    for (const auto& id : w.task_ids) {
        if (auto t = tasks_.get(id)) steps.push_back(std::move(*t));
    }
    return workflow_to_json(w, steps);
}

Task Orchestrator::wait_for(const std::string& task_id, std::chrono::milliseconds timeout) const {
    auto t = tasks_.wait_terminal(task_id, timeout);
    if (!t) throw NotFound("unknown task " + task_id);
    return *t;
}

bool Orchestrator::cancel_task(const std::string& task_id) {
    bool cancelled = false;
    auto t = tasks_.update(task_id, [&](Task& x) {
        if (is_terminal(x.status)) return;
        x.status = TaskStatus::Failed;
        x.error_kind = ErrorKind::Cancelled;
        x.last_error = "cancelled";
        x.correlation_id.clear();
        cancelled = true;
    });
    if (!t) throw NotFound("unknown task " + task_id);
    if (!cancelled) return false;
    queue_.remove(task_id);
    finish_failed(*t);
    return true;
}

std::optional<Task> Orchestrator::task(const std::string& task_id) const {
    return tasks_.get(task_id);
}

std::optional<AgentRecord> Orchestrator::agent(const std::string& agent_id) const {
    return registry_.get(agent_id);
}

json Orchestrator::ping(const std::string& agent_id) const {
    auto rec = registry_.get(agent_id);
    if (!rec) throw NotFound("unknown agent " + agent_id);
    auto j = agent_to_json(*rec, SteadyClock::now());
    j["healthy"] = rec->status != AgentStatus::Unhealthy && rec->status != AgentStatus::Stopped;
    return j;
}

json Orchestrator::status() const {
    auto now = SteadyClock::now();
    json agents = json::array();
    for (const auto& rec : registry_.snapshot()) agents.push_back(agent_to_json(rec, now));

    auto counts = tasks_.counts();
    json by_status = json::object();
    for (auto s : {TaskStatus::Pending, TaskStatus::Dispatched, TaskStatus::InProgress,
                   TaskStatus::Completed, TaskStatus::Failed}) {
        auto it = counts.find(s);
        by_status[to_string(s)] = it == counts.end() ? 0 : it->second;
    }
    json items = json::array();
    for (const auto& t : tasks_.snapshot()) items.push_back(task_to_json(t));

    std::size_t workflows;
    {
        std::lock_guard<std::mutex> lock(wf_mtx_);
        workflows = workflows_.size();
    }

    return json{
        {"agents", agents},
        {"tasks", {{"counts", by_status}, {"items", items}}},
        {"queued", queue_.size()},
        {"workflows", workflows}
    };
}

void Orchestrator::dispatch_loop() {
    while (auto entry = queue_.pop()) {
        try {
            dispatch_one(*entry);
        } catch (const std::exception& e) {
            log_error("orchestrator", "Dispatch of task " + entry->task_id + " failed: " + e.what());
            auto t = tasks_.get(entry->task_id);
            if (t && !is_terminal(t->status)) {
                on_dispatch_failure(t->task_id, t->assigned_agent.value_or(std::string()), t->correlation_id,
                                    ErrorKind::Handler, e.what());
            }
        }
    }
}

std::optional<AgentRecord> Orchestrator::pick_agent(const Task& t) {
    auto candidates = registry_.eligible(t.required_capability);
    if (candidates.empty()) return std::nullopt;
    if (!t.last_failed_agent.empty() && candidates.size() > 1) {
        candidates.erase(std::remove_if(candidates.begin(), candidates.end(), [&](const AgentRecord& r) {
            return r.agent_id == t.last_failed_agent;
        }), candidates.end());
    }
    std::lock_guard<std::mutex> lock(rr_mtx_);
    auto& last = rr_last_[t.required_capability];
    auto it = std::find_if(candidates.begin(), candidates.end(), [&](const AgentRecord& r) { return r.seq > last; });
    const AgentRecord& chosen = it != candidates.end() ? *it : candidates.front();
    last = chosen.seq;
    return chosen;
}

void Orchestrator::dispatch_one(const DispatchEntry& entry) {
    const std::string& id = entry.task_id;
    auto t = tasks_.get(id);
    if (!t || t->status != TaskStatus::Pending) return;

    auto agent = pick_agent(*t);
    if (!agent) {
        auto now = SteadyClock::now();
        if (now >= t->deadline) {
            bool failed = false;
            auto updated = tasks_.update(id, [&](Task& x) {
                if (x.status != TaskStatus::Pending) return;
                x.status = TaskStatus::Failed;
                x.error_kind = ErrorKind::NoEligibleAgent;
                x.last_error = "no eligible agent with capability '" + x.required_capability +
                               "' before the submission deadline";
                failed = true;
            });
            if (failed) finish_failed(*updated);
        } else {
            queue_.push(id, t->priority, std::min(now + cfg_.dispatch_poll_interval, t->deadline));
        }
        return;
    }

    json payload = {
        {"task_id", id},
        {"description", t->description},
        {"capability", t->required_capability},
        {"input", t->input},
        {"attempt", t->attempts + 1}
    };
    // Claim before publishing: task.started can arrive before request_async returns.
    const std::string corr = generate_id();
    bool claimed = false;
    tasks_.update(id, [&](Task& x) {
        if (x.status != TaskStatus::Pending) return;
        x.status = TaskStatus::Dispatched;
        x.assigned_agent = agent->agent_id;
        x.correlation_id = corr;
        claimed = true;
    });
    if (!claimed) return;

    std::weak_ptr<ReplyBoard> board = replies_;
    PendingRequest pending;
    try {
        pending = bus_.request_async(dispatch_topic(agent->agent_id), payload, cfg_.request_timeout, corr, [board]{
            if (auto b = board.lock()) {
                std::lock_guard<std::mutex> lock(b->mtx);
                b->cv.notify_all();
            }
        });
    } catch (const BusUnavailable& e) {
        on_dispatch_failure(id, agent->agent_id, corr, ErrorKind::BusUnavailable, e.what());
        return;
    }
    log_info("orchestrator", "Task " + id + " dispatched to " + agent->agent_id +
             " (attempt " + std::to_string(t->attempts + 1) + ")");

    bool accepted = false;
    {
        std::lock_guard<std::mutex> lock(replies_->mtx);
        if (!replies_->closed) {
            replies_->awaited.push_back(AwaitedReply{id, agent->agent_id, std::move(pending)});
            accepted = true;
        }
    }
    if (accepted) replies_->cv.notify_all();
    else pending.cancel();
}

void Orchestrator::collect_loop() {
    auto& board = *replies_;
    std::unique_lock<std::mutex> lock(board.mtx);
    while (!board.closed) {
        auto now = SteadyClock::now();
        auto next = SteadyClock::time_point::max();
        std::vector<AwaitedReply> due;
        for (auto it = board.awaited.begin(); it != board.awaited.end();) {
            if (it->pending.ready() || it->pending.deadline() <= now) {
                due.push_back(std::move(*it));
                it = board.awaited.erase(it);
            } else {
                next = std::min(next, it->pending.deadline());
                ++it;
            }
        }
        if (due.empty()) {
            if (next == SteadyClock::time_point::max()) board.cv.wait(lock);
            else board.cv.wait_until(lock, next);
            continue;
        }
        lock.unlock();
        for (auto& r : due) {
            try {
                settle(r);
            } catch (const std::exception& e) {
                log_error("orchestrator", "Settling task " + r.task_id + " failed: " + e.what());
            }
        }
        due.clear();
        lock.lock();
    }
}

void Orchestrator::settle(AwaitedReply& r) {
    const std::string& id = r.task_id;
    const std::string corr = r.pending.correlation_id();
    Message resp;
    try {
        resp = r.pending.get();
    } catch (const TimeoutError& e) {
        on_dispatch_failure(id, r.agent_id, corr, ErrorKind::Timeout, e.what());
        return;
    }

    if (!is_ok_payload(resp.payload)) {
        std::string err = resp.payload.is_object() ? resp.payload.value("error", std::string("agent reported failure"))
                                                   : std::string("malformed reply");
        on_dispatch_failure(id, r.agent_id, corr, ErrorKind::Handler, err);
        return;
    }

    bool done = false;
    auto updated = tasks_.update(id, [&](Task& x) {
        if (is_terminal(x.status) || x.correlation_id != corr) return;
        x.status = TaskStatus::Completed;
        x.result = resp.payload.value("result", json());
        x.error_kind = ErrorKind::None;
        x.correlation_id.clear();
        done = true;
    });
    if (!done) {
        log_debug("orchestrator", "Ignoring late reply " + corr + " for task " + id);
        return;
    }
    log_info("orchestrator", "Task " + id + " completed by " + r.agent_id);
    publish_quietly(kTopicTaskCompleted, {{"task_id", id}, {"agent_id", r.agent_id},
                                          {"result", updated->result}, {"attempts", updated->attempts}});
}

void Orchestrator::on_dispatch_failure(const std::string& task_id, const std::string& agent_id,
                                       const std::string& correlation_id, ErrorKind kind, const std::string& error) {
    bool failed = false;
    bool requeue = false;
    auto t = tasks_.update(task_id, [&](Task& x) {
        if (is_terminal(x.status)) return;
        if (correlation_id.empty() ? x.status != TaskStatus::Pending : x.correlation_id != correlation_id) return;
        x.attempts += 1;
        x.last_error = error;
        x.error_kind = kind;
        if (!agent_id.empty()) x.last_failed_agent = agent_id;
        x.assigned_agent.reset();
        x.correlation_id.clear();
        if (x.attempts >= cfg_.dispatch_retry_ceiling) {
            x.status = TaskStatus::Failed;
            failed = true;
        } else {
            x.status = TaskStatus::Pending;
            requeue = true;
        }
    });
    if (!failed && !requeue) return;
    log_warn("orchestrator", "Task " + task_id + " attempt " + std::to_string(t->attempts) + "/" +
             std::to_string(cfg_.dispatch_retry_ceiling) + " failed on " +
             (agent_id.empty() ? std::string("<none>") : agent_id) + " (" + to_string(kind) + "): " + error);
    if (failed) finish_failed(*t);
    if (requeue) queue_.push(task_id, t->priority);
}

void Orchestrator::finish_failed(const Task& t) {
    log_warn("orchestrator", "Task " + t.task_id + " failed (" + to_string(t.error_kind) + "): " + t.last_error);
    publish_quietly(kTopicTaskFailed, {{"task_id", t.task_id}, {"error", t.last_error},
                                       {"error_kind", to_string(t.error_kind)}, {"attempts", t.attempts}});
}

void Orchestrator::monitor_loop() {
    auto tick = std::max(cfg_.heartbeat_interval / 4, std::chrono::milliseconds(10));
    auto next_stats = SteadyClock::now() + cfg_.stats_interval;
    std::unique_lock<std::mutex> lock(run_mtx_);
    while (!stopping_) {
        run_cv_.wait_for(lock, tick, [this]{ return stopping_; });
        if (stopping_) break;
        lock.unlock();
        check_health();
        auto now = SteadyClock::now();
        if (cfg_.stats_interval.count() > 0 && now >= next_stats) {
            publish_quietly(kTopicSystemStats, status());
            next_stats = now + cfg_.stats_interval;
        }
        lock.lock();
    }
}

void Orchestrator::reply(const Message& req, const std::function<json()>& fn) {
    if (!req.reply_to) {
        log_warn("orchestrator", "Request on " + req.topic + " has no reply_to, dropping");
        return;
    }
    json out;
    try {
        out = ok_payload(fn());
    } catch (const InvalidArgument& e) {
        out = error_payload(e.what(), "invalid_argument");
    } catch (const json::exception& e) {
        out = error_payload(e.what(), "invalid_argument");
    } catch (const NotFound& e) {
        out = error_payload(e.what(), "not_found");
    } catch (const std::exception& e) {
        out = error_payload(e.what(), "internal");
    }
    bus_.respond(req, out);
}

void Orchestrator::on_register_request(const Message& msg) {
    reply(msg, [&]{
        const auto& p = msg.payload;
        std::string type = p.at("agent_type").get<std::string>();
        auto caps = p.value("capabilities", json::array()).get<std::set<std::string>>();
        return json{{"agent_id", register_agent(type, caps)}};
    });
}

void Orchestrator::on_submit_request(const Message& msg) {
    reply(msg, [&]{
        const auto& p = msg.payload;
        std::string id = submit_task(p.value("description", std::string()),
                                     p.at("capability").get<std::string>(),
                                     parse_task_priority(p.value("priority", std::string("low"))),
                                     p.value("input", json::object()));
        return json{{"task_id", id}};
    });
}

void Orchestrator::on_status_request(const Message& msg) {
    reply(msg, [&]{ return status(); });
}

// {"workflow_id": id} looks a workflow up; anything else submits one.
void Orchestrator::on_workflow_request(const Message& msg) {
    reply(msg, [&]{
        const auto& p = msg.payload;
        if (p.contains("workflow_id")) {
            std::string id = p.at("workflow_id").get<std::string>();
            auto view = workflow(id);
            if (!view) throw NotFound("unknown workflow " + id);
            return *view;
        }
        std::string id = submit_workflow(p.at("type").get<std::string>(), p.value("data", json::object()),
                                         parse_task_priority(p.value("priority", std::string("low"))));
        return *workflow(id);
    });
}

void Orchestrator::on_heartbeat_event(const Message& msg) {
    on_heartbeat(msg.payload);
}

void Orchestrator::on_agent_stopped(const Message& msg) {
    std::string id = msg.payload.value("agent_id", std::string());
    if (id.empty()) return;
    if (registry_.set_status(id, AgentStatus::Stopped)) {
        log_info("orchestrator", "Agent " + id + " stopped (" + msg.payload.value("reason", std::string("no reason")) + ")");
    }
}

void Orchestrator::on_task_started(const Message& msg) {
    const auto& p = msg.payload;
    if (!p.is_object() || !p.contains("task_id") || !p["task_id"].is_string()) return;
    std::string id = p["task_id"].get<std::string>();
    std::string corr = p.value("correlation_id", std::string());
    tasks_.update(id, [&](Task& x) {
        if (x.status == TaskStatus::Dispatched && x.correlation_id == corr) x.status = TaskStatus::InProgress;
    });
}
