#pragma once
#include "message.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>

using MessageHandler = std::function<void(const Message&)>;

enum class SubscriptionMode {
    Broadcast,      // every subscriber gets a copy
    ConsumerGroup   // exactly one member of the group gets each message
};

struct SubscribeOptions {
    SubscriptionMode mode{SubscriptionMode::Broadcast};
    std::string group;

    static SubscribeOptions broadcast() { return {}; }
    static SubscribeOptions consumer_group(std::string group) {
        return SubscribeOptions{SubscriptionMode::ConsumerGroup, std::move(group)};
    }
};

// Handle returned by subscribe(). Cancels the subscription when destroyed.
// After cancel() returns no further message is handed to the handler
// (a delivery already running may still complete).
class Subscription {
public:
    Subscription() = default;
    explicit Subscription(std::function<void()> cancel) : cancel_(std::move(cancel)) {}
    ~Subscription() { cancel(); }

    Subscription(Subscription&& o) noexcept : cancel_(std::move(o.cancel_)) { o.cancel_ = nullptr; }
    Subscription& operator=(Subscription&& o) noexcept {
        if (this != &o) {
            cancel();
            cancel_ = std::move(o.cancel_);
            o.cancel_ = nullptr;
        }
        return *this;
    }
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void cancel() {
        if (cancel_) {
            auto f = std::move(cancel_);
            cancel_ = nullptr;
            f();
        }
    }
    bool active() const { return static_cast<bool>(cancel_); }

private:
    std::function<void()> cancel_;
};

struct FleetConfig;

struct RetryPolicy {
    int max_attempts{5};
    std::chrono::milliseconds initial_backoff{50};
    double multiplier{2.0};
    std::chrono::milliseconds max_backoff{2000};

    static RetryPolicy from(const FleetConfig& cfg);
};

// In-flight request: a future for the correlated response plus the
// ephemeral reply subscription acting as its cancellation token.
class PendingRequest {
public:
    PendingRequest() = default;
    PendingRequest(PendingRequest&&) = default;
    PendingRequest& operator=(PendingRequest&&) = default;

    // Blocks until the correlated response arrives or the deadline passes.
    // Either way the reply subscription is torn down. Throws TimeoutError.
    Message get();
    // Drops interest in the response; a later get() throws TimeoutError.
    void cancel();

    // True once the response has arrived; get() will not block.
    bool ready() const;
    std::chrono::steady_clock::time_point deadline() const { return deadline_; }
    const std::string& correlation_id() const { return correlation_id_; }
    const std::string& topic() const { return topic_; }

private:
    friend class MessageBus;
    std::string topic_;
    std::string correlation_id_;
    std::future<Message> response_;
    Subscription reply_sub_;
    std::chrono::steady_clock::time_point deadline_;
    bool cancelled_{false};
};

// Transport-independent bus client. Implementations provide the raw
// transport (do_publish / do_subscribe); retry, request/response and
// respond are built on top here.
class MessageBus {
public:
    explicit MessageBus(std::string client_id = {}, RetryPolicy retry = {});
    virtual ~MessageBus() = default;
    MessageBus(const MessageBus&) = delete;
    MessageBus& operator=(const MessageBus&) = delete;

    const std::string& client_id() const { return client_id_; }

    // Fills id, sender and sent_at when empty, then hands the message to the
    // transport, retrying TransportError with exponential backoff.
    // Throws BusUnavailable once retries are exhausted.
    void publish(Message msg);
    void publish(const std::string& topic, nlohmann::json payload);

    // Same retry policy as publish. Throws BusUnavailable.
    Subscription subscribe(const std::string& topic, MessageHandler handler,
                           SubscribeOptions opts = SubscribeOptions::broadcast());

    // A fresh correlation id is generated when none is given. on_response,
    // when set, runs on the delivering thread right after the response lands.
    PendingRequest request_async(const std::string& topic, nlohmann::json payload,
                                 std::chrono::milliseconds timeout, std::string correlation_id = {},
                                 std::function<void()> on_response = {});
    // Throws TimeoutError or BusUnavailable.
    Message request(const std::string& topic, nlohmann::json payload, std::chrono::milliseconds timeout);

    // Throws InvalidArgument when the request carries no reply_to.
    void respond(const Message& request, nlohmann::json payload);

protected:
    virtual void do_publish(const Message& msg) = 0;
    virtual Subscription do_subscribe(const std::string& topic, MessageHandler handler,
                                      const SubscribeOptions& opts) = 0;

    // Runs op until it stops throwing TransportError or retries are exhausted.
    void with_retry(const std::string& what, const std::function<void()>& op);

private:
    std::string client_id_;
    RetryPolicy retry_;
};
