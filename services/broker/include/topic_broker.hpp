#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

struct QueuedMessage {
    std::string id;
    nlohmann::json body;   // wire form of the message, opaque to the broker
    int deliveries{0};
};

struct SubscriptionInfo {
    std::string id;
    std::string topic;
    std::string group;     // empty for broadcast
    std::size_t queued{0};
    std::size_t inflight{0};
};

struct BrokerSnapshot {
    std::vector<SubscriptionInfo> subscriptions;
    std::uint64_t published{0};
    std::uint64_t delivered{0};
    std::uint64_t redelivered{0};
    std::uint64_t unrouted{0};
    std::uint64_t expired{0};
};

// Pull-based topic broker behind the HTTP broker service.
// publish copies a message into the queue of every broadcast subscription on
// the topic and into one member queue per consumer group (round-robin).
// poll hands messages out and parks them in-flight until acked; anything not
// acked within the visibility timeout goes back to the head of the queue.
// A subscription that neither polls nor acks for longer than the lease is
// dropped as if unsubscribed (a lease of zero keeps subscriptions forever).
class TopicBroker {
public:
    explicit TopicBroker(std::chrono::milliseconds visibility_timeout = std::chrono::seconds(30),
                         std::chrono::milliseconds subscription_lease = std::chrono::seconds(60));

    std::string subscribe(const std::string& topic, const std::string& group = {});
    // Queued and in-flight messages of a departing group member move to the
    // remaining members. Returns false for unknown ids.
    bool unsubscribe(const std::string& sub_id);

    // Throws InvalidArgument when body lacks "topic" or "id".
    std::size_t publish(const nlohmann::json& body);

    // Throws NotFound for unknown subscriptions.
    std::vector<QueuedMessage> poll(const std::string& sub_id, std::size_t max);
    bool ack(const std::string& sub_id, const std::string& message_id);

    BrokerSnapshot snapshot();

private:
    struct Inflight {
        QueuedMessage msg;
        std::chrono::steady_clock::time_point deadline;
    };

    struct Sub {
        std::string id;
        std::string topic;
        std::string group;
        std::deque<QueuedMessage> queue;
        std::unordered_map<std::string, Inflight> inflight;
        std::chrono::steady_clock::time_point last_seen;
    };

    struct GroupCursor {
        std::vector<std::string> members;
        std::size_t next{0};
    };

    void requeue_expired_locked(Sub& s, std::chrono::steady_clock::time_point now);
    bool unsubscribe_locked(const std::string& sub_id);
    void expire_idle_locked(std::chrono::steady_clock::time_point now);

    std::chrono::milliseconds visibility_;
    std::chrono::milliseconds lease_;
    std::chrono::steady_clock::time_point next_lease_check_;
    std::mutex mtx_;
    std::unordered_map<std::string, Sub> subs_;
    std::unordered_map<std::string, std::vector<std::string>> broadcast_;          // topic -> sub ids
    std::unordered_map<std::string, std::map<std::string, GroupCursor>> groups_;    // topic -> group -> members
    std::uint64_t published_{0};
    std::uint64_t delivered_{0};
    std::uint64_t redelivered_{0};
    std::uint64_t unrouted_{0};
    std::uint64_t expired_{0};
};
