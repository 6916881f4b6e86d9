#include "../include/bus.hpp"
#include "../../common/include/config.hpp"
#include "../../common/include/errors.hpp"
#include "../../common/include/ids.hpp"
#include "../../common/include/log.hpp"
#include <algorithm>
#include <thread>

using json = nlohmann::json;

namespace {
struct ReplyState {
    std::promise<Message> promise;
    std::atomic<bool> settled{false};
};
}

RetryPolicy RetryPolicy::from(const FleetConfig& cfg) {
    RetryPolicy r;
    r.max_attempts = cfg.publish_max_attempts;
    r.initial_backoff = cfg.publish_backoff;
    return r;
}

Message PendingRequest::get() {
    if (cancelled_ || !response_.valid()) {
        throw TimeoutError("request " + correlation_id_ + " on " + topic_ + " was cancelled");
    }
    auto st = response_.wait_until(deadline_);
    reply_sub_.cancel();
    if (st != std::future_status::ready) {
        cancelled_ = true;
        throw TimeoutError("no response on " + topic_ + " for request " + correlation_id_);
    }
    return response_.get();
}

bool PendingRequest::ready() const {
    return !cancelled_ && response_.valid() &&
           response_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

void PendingRequest::cancel() {
    cancelled_ = true;
    reply_sub_.cancel();
}

MessageBus::MessageBus(std::string client_id, RetryPolicy retry)
    : client_id_(client_id.empty() ? generate_id() : std::move(client_id)), retry_(retry) {
    if (retry_.max_attempts < 1) retry_.max_attempts = 1;
}

void MessageBus::with_retry(const std::string& what, const std::function<void()>& op) {
    auto backoff = retry_.initial_backoff;
    std::string last_error;
    for (int attempt = 1; attempt <= retry_.max_attempts; ++attempt) {
        try {
            op();
            return;
        } catch (const TransportError& e) {
            last_error = e.what();
            log_warn("bus", what + " attempt " + std::to_string(attempt) + "/" +
                     std::to_string(retry_.max_attempts) + " failed: " + last_error);
        }
        if (attempt < retry_.max_attempts) {
            std::this_thread::sleep_for(backoff);
            auto next = std::chrono::milliseconds((long long)(backoff.count() * retry_.multiplier));
            backoff = std::min(next, retry_.max_backoff);
        }
    }
    throw BusUnavailable(what + " failed after " + std::to_string(retry_.max_attempts) +
                         " attempts: " + last_error);
}

void MessageBus::publish(Message msg) {
    if (msg.topic.empty()) throw InvalidArgument("publish requires a topic");
    if (msg.id.empty()) msg.id = generate_id();
    if (msg.sender.empty()) msg.sender = client_id_;
    if (msg.sent_at == std::chrono::system_clock::time_point{}) msg.sent_at = std::chrono::system_clock::now();
    with_retry("publish " + msg.topic, [&]{ do_publish(msg); });
}

void MessageBus::publish(const std::string& topic, json payload) {
    publish(make_event(topic, std::move(payload)));
}

Subscription MessageBus::subscribe(const std::string& topic, MessageHandler handler, SubscribeOptions opts) {
    if (topic.empty()) throw InvalidArgument("subscribe requires a topic");
    if (!handler) throw InvalidArgument("subscribe requires a handler");
    if (opts.mode == SubscriptionMode::ConsumerGroup && opts.group.empty()) {
        throw InvalidArgument("consumer-group subscription on " + topic + " needs a group name");
    }
    Subscription sub;
    with_retry("subscribe " + topic, [&]{ sub = do_subscribe(topic, handler, opts); });
    return sub;
}

PendingRequest MessageBus::request_async(const std::string& topic, json payload, std::chrono::milliseconds timeout,
                                         std::string correlation_id, std::function<void()> on_response) {
    PendingRequest pending;
    pending.topic_ = topic;
    pending.correlation_id_ = correlation_id.empty() ? generate_id() : std::move(correlation_id);
    pending.deadline_ = std::chrono::steady_clock::now() + timeout;

    auto state = std::make_shared<ReplyState>();
    pending.response_ = state->promise.get_future();

    const std::string reply_topic = "_reply." + client_id_ + "." + pending.correlation_id_;
    const std::string corr = pending.correlation_id_;
    // Subscribe before publishing so a fast responder cannot beat us.
    pending.reply_sub_ = subscribe(reply_topic, [state, corr, on_response](const Message& m) {
        if (m.kind != MessageKind::Response || m.correlation_id != corr) {
            log_debug("bus", "discarding uncorrelated message on reply topic " + m.topic);
            return;
        }
        bool expected = false;
        if (state->settled.compare_exchange_strong(expected, true)) {
            state->promise.set_value(m);
            if (on_response) on_response();
        }
    });

    Message req;
    req.topic = topic;
    req.kind = MessageKind::Request;
    req.payload = std::move(payload);
    req.correlation_id = corr;
    req.reply_to = reply_topic;
    publish(std::move(req));
    return pending;
}

Message MessageBus::request(const std::string& topic, json payload, std::chrono::milliseconds timeout) {
    auto pending = request_async(topic, std::move(payload), timeout);
    return pending.get();
}

void MessageBus::respond(const Message& request, json payload) {
    if (!request.reply_to || request.reply_to->empty()) {
        throw InvalidArgument("message " + request.id + " on " + request.topic + " has no reply_to");
    }
    Message resp;
    resp.topic = *request.reply_to;
    resp.kind = MessageKind::Response;
    resp.payload = std::move(payload);
    resp.correlation_id = request.correlation_id;
    publish(std::move(resp));
}
