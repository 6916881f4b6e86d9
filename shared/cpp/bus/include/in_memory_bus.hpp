#pragma once
#include "bus.hpp"
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

// Single-process broker shared by any number of InMemoryBus clients.
// Each subscription owns a mailbox drained by its own delivery thread, so
// handlers for different subscriptions run in parallel and a blocking
// handler only stalls its own subscription. Routing happens under one lock,
// which keeps per-(publisher, topic) order intact in every mailbox.
class InMemoryBroker {
public:
    InMemoryBroker() = default;
    ~InMemoryBroker();
    InMemoryBroker(const InMemoryBroker&) = delete;
    InMemoryBroker& operator=(const InMemoryBroker&) = delete;

    std::uint64_t add(const std::string& topic, const SubscribeOptions& opts, MessageHandler handler);
    void remove(std::uint64_t id);
    // Returns the number of mailboxes the message was queued on.
    std::size_t route(const Message& msg);

    std::size_t subscriber_count(const std::string& topic) const;

private:
    struct Mailbox {
        std::uint64_t id{0};
        std::string topic;
        std::mutex mtx;
        std::condition_variable cv;
        std::deque<Message> queue;
        bool closed{false};
        std::atomic<bool> finished{false};
        MessageHandler handler;
        std::thread worker;
    };

    struct Group {
        std::vector<std::shared_ptr<Mailbox>> members;
        std::size_t next{0};
    };

    struct TopicEntry {
        std::vector<std::shared_ptr<Mailbox>> broadcast;
        std::map<std::string, Group> groups;
    };

    static void run(const std::shared_ptr<Mailbox>& mb);
    static void close(const std::shared_ptr<Mailbox>& mb);
    static void enqueue(const std::shared_ptr<Mailbox>& mb, const Message& msg);
    void reap_locked();

    mutable std::mutex mtx_;
    std::unordered_map<std::string, TopicEntry> topics_;
    std::unordered_map<std::uint64_t, std::pair<std::shared_ptr<Mailbox>, std::string>> by_id_; // id -> (mailbox, group)
    std::vector<std::shared_ptr<Mailbox>> retired_;
    std::uint64_t next_id_{1};
};

// MessageBus client over an InMemoryBroker. Clients sharing a broker see each
// other's messages; each client has its own sender id and reachability switch.
class InMemoryBus : public MessageBus {
public:
    explicit InMemoryBus(std::string client_id = {}, RetryPolicy retry = {});
    InMemoryBus(std::shared_ptr<InMemoryBroker> broker, std::string client_id = {}, RetryPolicy retry = {});

    // When false every transport attempt fails, as if the broker were down.
    void set_reachable(bool reachable) { reachable_.store(reachable); }
    bool reachable() const { return reachable_.load(); }

    const std::shared_ptr<InMemoryBroker>& broker() const { return broker_; }

protected:
    void do_publish(const Message& msg) override;
    Subscription do_subscribe(const std::string& topic, MessageHandler handler,
                              const SubscribeOptions& opts) override;

private:
    std::shared_ptr<InMemoryBroker> broker_;
    std::atomic<bool> reachable_{true};
};
