#pragma once
#include "bus.hpp"
#include "recent_ids.hpp"
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

struct HttpBusOptions {
    std::chrono::milliseconds poll_interval{100};
    std::size_t poll_batch{32};
    long http_timeout_ms{5000};
};

// MessageBus client for the broker service. Publishing is a POST to
// /publish; every subscription is a broker-side queue drained by one poll
// thread that hands messages to the handler in order and acks them after.
// Redelivered messages (handler crashed before ack, visibility timeout) are
// filtered by message id.
// Cancelling a subscription never waits for its handler: the broker-side
// queue is deleted at once and the poll thread is retired, to be joined once
// it has finished or when the bus is destroyed.
class HttpBus : public MessageBus {
public:
    explicit HttpBus(std::string broker_url, std::string client_id = {}, RetryPolicy retry = {},
                     HttpBusOptions opts = {});
    ~HttpBus() override;

protected:
    void do_publish(const Message& msg) override;
    Subscription do_subscribe(const std::string& topic, MessageHandler handler,
                              const SubscribeOptions& opts) override;

private:
    struct Poller {
        std::string topic;
        std::string group;
        std::string sub_id;
        MessageHandler handler;
        std::mutex mtx;
        std::condition_variable cv;
        bool stop{false};
        std::atomic<bool> finished{false};
        std::thread thread;
        RecentIds seen;
    };

    std::string open_subscription(const std::string& topic, const std::string& group);
    void close_subscription(const std::string& sub_id);
    void poll_loop(const std::shared_ptr<Poller>& p);
    // Flags the poller and deletes its broker subscription. Does not join.
    void stop_poller(const std::shared_ptr<Poller>& p);
    void reap_locked();
    void ack(const std::string& sub_id, const std::string& message_id);

    std::string base_;
    HttpBusOptions opts_;
    std::mutex mtx_;
    std::vector<std::shared_ptr<Poller>> pollers_;
    std::vector<std::shared_ptr<Poller>> retired_;
};
