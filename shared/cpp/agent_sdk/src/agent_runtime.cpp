#include "../include/agent_runtime.hpp"
#include "../../bus/include/topics.hpp"
#include "../../common/include/errors.hpp"
#include "../../common/include/log.hpp"
#include <stdexcept>

using json = nlohmann::json;

std::string to_string(RuntimeState s) {
    switch (s) {
        case RuntimeState::Created: return "created";
        case RuntimeState::Starting: return "starting";
        case RuntimeState::Running: return "running";
        case RuntimeState::Stopping: return "stopping";
        case RuntimeState::Stopped: return "stopped";
        case RuntimeState::Failed: return "failed";
    }
    return "unknown";
}

RuntimeConfig RuntimeConfig::from(const FleetConfig& cfg) {
    RuntimeConfig rc;
    rc.heartbeat_interval = cfg.heartbeat_interval;
    rc.shutdown_grace = cfg.shutdown_grace;
    rc.register_timeout = cfg.request_timeout;
    return rc;
}

AgentRuntime::AgentRuntime(std::shared_ptr<Agent> agent, MessageBus& bus, MemoryManager& memory, RuntimeConfig cfg) {
    if (!agent) throw InvalidArgument("AgentRuntime requires an agent");
    if (cfg.heartbeat_interval.count() <= 0) throw InvalidArgument("heartbeat interval must be positive");
    core_ = std::make_shared<Core>(std::move(agent), bus, memory, std::move(cfg));
}

AgentRuntime::~AgentRuntime() {
    core_->stop("shutdown");
    std::thread t;
    {
        std::lock_guard<std::mutex> lock(core_->mtx);
        t = std::move(core_->fatal_stopper);
    }
    if (t.joinable()) t.join();
}

void AgentRuntime::start() { core_->start(); }

void AgentRuntime::stop() { core_->stop("stop requested"); }

RuntimeState AgentRuntime::state() const {
    std::lock_guard<std::mutex> lock(core_->mtx);
    return core_->state;
}

bool AgentRuntime::wait_for(RuntimeState target, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(core_->mtx);
    return core_->cv.wait_for(lock, timeout, [this, target]{ return core_->state == target; });
}

std::string AgentRuntime::agent_id() const {
    std::lock_guard<std::mutex> lock(core_->mtx);
    return core_->agent_id;
}

std::size_t AgentRuntime::in_flight() const {
    std::lock_guard<std::mutex> lock(core_->mtx);
    return core_->in_flight;
}

void AgentRuntime::send_direct(const std::string& target_agent_id, json payload) {
    if (target_agent_id.empty()) throw InvalidArgument("send_direct requires a target agent id");
    std::string from = agent_id();
    if (from.empty()) throw InvalidArgument("send_direct before the agent has an id");
    Message m = make_event(direct_topic(target_agent_id), std::move(payload));
    m.sender = from;
    core_->bus.publish(std::move(m));
}

AgentRuntime::Core::Core(std::shared_ptr<Agent> a, MessageBus& b, MemoryManager& m, RuntimeConfig c)
    : agent(std::move(a)), bus(b), memory(m), cfg(std::move(c)), agent_id(cfg.agent_id),
      seen_events(cfg.dedup_capacity) {}

void AgentRuntime::Core::set_state_locked(RuntimeState s) {
    log_info(agent->type(), "Agent " + (agent_id.empty() ? std::string("<unregistered>") : agent_id) + " " +
             to_string(state) + " -> " + to_string(s));
    state = s;
    cv.notify_all();
}

std::vector<Subscription> AgentRuntime::Core::take_subscriptions_locked() {
    std::vector<Subscription> out;
    out.swap(subs);
    return out;
}

void AgentRuntime::Core::publish_quietly(const std::string& topic, json payload) {
    try {
        bus.publish(topic, std::move(payload));
    } catch (const BusUnavailable& e) {
        log_warn(agent->type(), "Could not publish " + topic + ": " + e.what());
    }
}

void AgentRuntime::Core::start() {
    std::lock_guard<std::mutex> life(lifecycle_mtx);
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (state != RuntimeState::Created) {
            throw std::logic_error("agent runtime cannot start from state " + to_string(state));
        }
        set_state_locked(RuntimeState::Starting);
    }

    try {
        if (cfg.agent_id.empty()) {
            json req = {{"agent_type", agent->type()}, {"capabilities", agent->capabilities()}};
            auto resp = bus.request(kTopicRegister, req, cfg.register_timeout);
            if (!is_ok_payload(resp.payload)) {
                throw FleetError("registration rejected: " + resp.payload.value("error", std::string("unknown error")));
            }
            std::string id = resp.payload.at("result").at("agent_id").get<std::string>();
            std::lock_guard<std::mutex> lock(mtx);
            agent_id = id;
        }

        std::weak_ptr<Core> weak = shared_from_this();
        MessageHandler handler = [weak](const Message& m) {
            if (auto self = weak.lock()) self->on_message(m);
        };
        std::vector<Subscription> fresh;
        fresh.push_back(bus.subscribe(dispatch_topic(agent_id), handler));
        fresh.push_back(bus.subscribe(direct_topic(agent_id), handler));
        for (const auto& t : agent->topics()) fresh.push_back(bus.subscribe(t, handler));
        {
            std::lock_guard<std::mutex> lock(mtx);
            for (auto& s : fresh) subs.push_back(std::move(s));
        }

        send_heartbeat();
        {
            std::lock_guard<std::mutex> lock(mtx);
            set_state_locked(RuntimeState::Running);
        }
    } catch (const std::exception& e) {
        std::vector<Subscription> dead;
        {
            std::lock_guard<std::mutex> lock(mtx);
            dead = take_subscriptions_locked();
            set_state_locked(RuntimeState::Failed);
        }
        log_error(agent->type(), std::string("Start failed: ") + e.what());
        throw;
    }

    publish_quietly(kTopicAgentStarted, {{"agent_id", agent_id}, {"agent_type", agent->type()},
                                         {"capabilities", agent->capabilities()}});
    std::weak_ptr<Core> weak = shared_from_this();
    heartbeat = std::thread([weak]{
        if (auto self = weak.lock()) self->heartbeat_loop();
    });
}

void AgentRuntime::Core::stop(const std::string& reason) {
    std::lock_guard<std::mutex> life(lifecycle_mtx);
    std::vector<Subscription> dead;
    std::thread hb;
    bool drain = false;
    {
        std::lock_guard<std::mutex> lock(mtx);
        switch (state) {
            case RuntimeState::Created:
                set_state_locked(RuntimeState::Stopped);
                return;
            case RuntimeState::Running:
                set_state_locked(RuntimeState::Stopping);
                drain = true;
                break;
            case RuntimeState::Failed:
                break;
            default:
                return;
        }
        dead = take_subscriptions_locked();
        hb_stop = true;
        hb = std::move(heartbeat);
    }
    cv.notify_all();
    dead.clear();
    if (hb.joinable()) {
        if (hb.get_id() == std::this_thread::get_id()) hb.detach();
        else hb.join();
    }
    if (!drain) return;

    {
        std::unique_lock<std::mutex> lock(mtx);
        bool drained = cv.wait_for(lock, cfg.shutdown_grace, [this]{ return in_flight == 0; });
        if (!drained) {
            log_warn(agent->type(), "Shutdown grace elapsed, abandoning " + std::to_string(in_flight) +
                     " in-flight handler(s)");
        }
    }
    publish_quietly(kTopicAgentStopped, {{"agent_id", agent_id}, {"agent_type", agent->type()}, {"reason", reason}});
    std::lock_guard<std::mutex> lock(mtx);
    set_state_locked(RuntimeState::Stopped);
}

void AgentRuntime::Core::fail(const std::string& reason) {
    std::vector<Subscription> dead;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (state != RuntimeState::Running && state != RuntimeState::Starting) return;
        log_error(agent->type(), reason);
        set_state_locked(RuntimeState::Failed);
        dead = take_subscriptions_locked();
        hb_stop = true;
    }
    cv.notify_all();
}

void AgentRuntime::Core::request_fatal_stop(const std::string& reason) {
    std::lock_guard<std::mutex> lock(mtx);
    if (fatal_requested || state != RuntimeState::Running) return;
    fatal_requested = true;
    std::weak_ptr<Core> weak = shared_from_this();
    // stop() drains in-flight handlers, so it cannot run on this handler's thread.
    fatal_stopper = std::thread([weak, reason]{
        if (auto self = weak.lock()) self->stop(reason);
    });
}

void AgentRuntime::Core::on_message(const Message& msg) {
    if (msg.kind == MessageKind::Request && (!msg.reply_to || msg.reply_to->empty())) {
        log_warn(agent->type(), "Dropping request " + msg.id + " on " + msg.topic + ": no reply_to");
        return;
    }
    if (msg.kind == MessageKind::Response) {
        log_warn(agent->type(), "Dropping unexpected response " + msg.id + " on " + msg.topic);
        return;
    }
    const bool is_request = msg.kind == MessageKind::Request;
    {
        std::unique_lock<std::mutex> lock(mtx);
        cv.wait(lock, [this]{ return state != RuntimeState::Starting; });
        if (state != RuntimeState::Running) {
            lock.unlock();
            if (is_request) {
                try {
                    bus.respond(msg, error_payload("agent " + agent_id + " is not running", "unavailable"));
                } catch (const BusUnavailable& e) {
                    log_warn(agent->type(), std::string("Could not reject request: ") + e.what());
                }
            }
            return;
        }
        ++in_flight;
    }

    try {
        if (is_request) handle_request(msg);
        else if (msg.kind == MessageKind::Event) handle_event(msg);
    } catch (const BusUnavailable& e) {
        fail(std::string("bus unavailable while handling ") + msg.topic + ": " + e.what());
    } catch (const std::exception& e) {
        log_error(agent->type(), "Failed to handle message " + msg.id + " on " + msg.topic + ": " + e.what());
    }

    std::lock_guard<std::mutex> lock(mtx);
    --in_flight;
    cv.notify_all();
}

bool AgentRuntime::Core::begin_request(const std::string& corr, std::optional<json>& cached) {
    if (corr.empty()) return true;
    std::lock_guard<std::mutex> lock(dedup_mtx);
    auto it = replies.find(corr);
    if (it != replies.end()) {
        cached = it->second;
        return false;
    }
    replies.emplace(corr, std::nullopt);
    reply_order.push_back(corr);
    while (reply_order.size() > cfg.dedup_capacity) {
        replies.erase(reply_order.front());
        reply_order.pop_front();
    }
    return true;
}

void AgentRuntime::Core::finish_request(const std::string& corr, const json& reply) {
    if (corr.empty()) return;
    std::lock_guard<std::mutex> lock(dedup_mtx);
    auto it = replies.find(corr);
    if (it != replies.end()) it->second = reply;
}

void AgentRuntime::Core::handle_request(const Message& msg) {
    std::optional<json> cached;
    if (!begin_request(msg.correlation_id, cached)) {
        if (cached) {
            log_debug(agent->type(), "Replaying reply for duplicate request " + msg.correlation_id);
            bus.respond(msg, *cached);
        } else {
            log_debug(agent->type(), "Ignoring duplicate of in-progress request " + msg.correlation_id);
        }
        return;
    }

    json task_id = msg.payload.is_object() ? msg.payload.value("task_id", json()) : json();
    publish_quietly(kTopicTaskStarted, {{"agent_id", agent_id}, {"task_id", task_id},
                                        {"correlation_id", msg.correlation_id}, {"topic", msg.topic}});

    json reply;
    bool fatal = false;
    try {
        AgentContext ctx{bus, memory, agent_id};
        reply = ok_payload(agent->receive(msg, ctx));
    } catch (const AgentHandlerError& e) {
        log_warn(agent->type(), std::string(e.fatal() ? "Fatal handler error: " : "Handler error: ") + e.what());
        reply = error_payload(e.what(), "handler", e.fatal());
        fatal = e.fatal();
    } catch (const std::exception& e) {
        log_warn(agent->type(), std::string("Handler error: ") + e.what());
        reply = error_payload(e.what(), "handler", false);
    }
    finish_request(msg.correlation_id, reply);
    bus.respond(msg, reply);
    if (fatal) request_fatal_stop("fatal handler error: " + reply.value("error", std::string()));
}

void AgentRuntime::Core::handle_event(const Message& msg) {
    if (!msg.id.empty() && !seen_events.insert(msg.id)) {
        log_debug(agent->type(), "Ignoring duplicate event " + msg.id);
        return;
    }
    std::string error;
    bool fatal = false;
    try {
        AgentContext ctx{bus, memory, agent_id};
        agent->receive(msg, ctx);
        return;
    } catch (const AgentHandlerError& e) {
        error = e.what();
        fatal = e.fatal();
    } catch (const std::exception& e) {
        error = e.what();
    }
    log_error(agent->type(), "Event handler for " + msg.topic + " failed: " + error);
    publish_quietly(kTopicAgentError, {{"agent_id", agent_id}, {"topic", msg.topic}, {"message_id", msg.id},
                                       {"error", error}, {"fatal", fatal}});
    if (fatal) request_fatal_stop("fatal event handler error: " + error);
}

json AgentRuntime::Core::heartbeat_payload() {
    std::size_t busy;
    {
        std::lock_guard<std::mutex> lock(mtx);
        busy = in_flight;
    }
    return json{
        {"agent_id", agent_id},
        {"agent_type", agent->type()},
        {"capabilities", agent->capabilities()},
        {"status", busy > 0 ? "busy" : "ready"},
        {"in_flight", busy}
    };
}

void AgentRuntime::Core::send_heartbeat() {
    bus.publish(kTopicHeartbeat, heartbeat_payload());
}

void AgentRuntime::Core::heartbeat_loop() {
    std::unique_lock<std::mutex> lock(mtx);
    while (!hb_stop) {
        cv.wait_for(lock, cfg.heartbeat_interval, [this]{ return hb_stop; });
        if (hb_stop) break;
        lock.unlock();
        try {
            send_heartbeat();
        } catch (const BusUnavailable& e) {
            fail(std::string("Heartbeat failed: ") + e.what());
            return;
        }
        lock.lock();
    }
}
