#include "../include/in_memory_bus.hpp"
#include "../../common/include/errors.hpp"
#include "../../common/include/log.hpp"
#include <algorithm>

InMemoryBroker::~InMemoryBroker() {
    std::vector<std::shared_ptr<Mailbox>> all;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        for (auto& kv : by_id_) all.push_back(kv.second.first);
        for (auto& mb : retired_) all.push_back(mb);
        by_id_.clear();
        topics_.clear();
        retired_.clear();
    }
    for (auto& mb : all) close(mb);
    for (auto& mb : all) {
        if (!mb->worker.joinable()) continue;
        if (mb->worker.get_id() == std::this_thread::get_id()) mb->worker.detach();
        else mb->worker.join();
    }
}

void InMemoryBroker::run(const std::shared_ptr<Mailbox>& mb) {
    for (;;) {
        Message m;
        {
            std::unique_lock<std::mutex> lock(mb->mtx);
            mb->cv.wait(lock, [&]{ return mb->closed || !mb->queue.empty(); });
            if (mb->closed) break;
            m = std::move(mb->queue.front());
            mb->queue.pop_front();
        }
        try {
            mb->handler(m);
        } catch (const std::exception& e) {
            log_error("bus", "handler on " + mb->topic + " threw for message " + m.id + ": " + e.what());
        }
    }
    // Drop captured state now rather than when the broker is destroyed.
    mb->handler = nullptr;
    mb->finished.store(true);
}

void InMemoryBroker::close(const std::shared_ptr<Mailbox>& mb) {
    {
        std::lock_guard<std::mutex> lock(mb->mtx);
        mb->closed = true;
        mb->queue.clear();
    }
    mb->cv.notify_all();
}

void InMemoryBroker::enqueue(const std::shared_ptr<Mailbox>& mb, const Message& msg) {
    {
        std::lock_guard<std::mutex> lock(mb->mtx);
        if (mb->closed) return;
        mb->queue.push_back(msg);
    }
    mb->cv.notify_one();
}

void InMemoryBroker::reap_locked() {
    auto it = std::remove_if(retired_.begin(), retired_.end(), [](const std::shared_ptr<Mailbox>& mb) {
        if (!mb->finished.load()) return false;
        if (mb->worker.joinable()) mb->worker.join();
        return true;
    });
    retired_.erase(it, retired_.end());
}

std::uint64_t InMemoryBroker::add(const std::string& topic, const SubscribeOptions& opts, MessageHandler handler) {
    auto mb = std::make_shared<Mailbox>();
    mb->topic = topic;
    mb->handler = std::move(handler);

    std::lock_guard<std::mutex> lock(mtx_);
    reap_locked();
    mb->id = next_id_++;
    auto& entry = topics_[topic];
    std::string group;
    if (opts.mode == SubscriptionMode::ConsumerGroup) {
        group = opts.group;
        entry.groups[group].members.push_back(mb);
    } else {
        entry.broadcast.push_back(mb);
    }
    by_id_[mb->id] = {mb, group};
    mb->worker = std::thread([mb]{ run(mb); });
    return mb->id;
}

void InMemoryBroker::remove(std::uint64_t id) {
    std::shared_ptr<Mailbox> mb;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = by_id_.find(id);
        if (it == by_id_.end()) return;
        mb = it->second.first;
        const std::string group = it->second.second;
        by_id_.erase(it);

        auto t = topics_.find(mb->topic);
        if (t != topics_.end()) {
            auto drop = [&](std::vector<std::shared_ptr<Mailbox>>& v) {
                v.erase(std::remove(v.begin(), v.end(), mb), v.end());
            };
            if (group.empty()) {
                drop(t->second.broadcast);
            } else {
                auto g = t->second.groups.find(group);
                if (g != t->second.groups.end()) {
                    drop(g->second.members);
                    if (g->second.members.empty()) t->second.groups.erase(g);
                }
            }
            if (t->second.broadcast.empty() && t->second.groups.empty()) topics_.erase(t);
        }
        retired_.push_back(mb);
    }
    // Not joined here: cancel may be called from the handler itself, and a
    // handler still running after cancel is allowed to finish on its own.
    close(mb);
}

std::size_t InMemoryBroker::route(const Message& msg) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto t = topics_.find(msg.topic);
    if (t == topics_.end()) return 0;
    std::size_t n = 0;
    for (auto& mb : t->second.broadcast) {
        enqueue(mb, msg);
        ++n;
    }
    for (auto& kv : t->second.groups) {
        auto& g = kv.second;
        if (g.members.empty()) continue;
        auto& mb = g.members[g.next % g.members.size()];
        g.next = (g.next + 1) % g.members.size();
        enqueue(mb, msg);
        ++n;
    }
    return n;
}

std::size_t InMemoryBroker::subscriber_count(const std::string& topic) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto t = topics_.find(topic);
    if (t == topics_.end()) return 0;
    std::size_t n = t->second.broadcast.size();
    for (const auto& kv : t->second.groups) n += kv.second.members.size();
    return n;
}

InMemoryBus::InMemoryBus(std::string client_id, RetryPolicy retry)
    : InMemoryBus(std::make_shared<InMemoryBroker>(), std::move(client_id), retry) {}

InMemoryBus::InMemoryBus(std::shared_ptr<InMemoryBroker> broker, std::string client_id, RetryPolicy retry)
    : MessageBus(std::move(client_id), retry), broker_(std::move(broker)) {}

void InMemoryBus::do_publish(const Message& msg) {
    if (!reachable_.load()) throw TransportError("in-memory broker unreachable");
    broker_->route(msg);
}

Subscription InMemoryBus::do_subscribe(const std::string& topic, MessageHandler handler, const SubscribeOptions& opts) {
    if (!reachable_.load()) throw TransportError("in-memory broker unreachable");
    auto id = broker_->add(topic, opts, std::move(handler));
    std::weak_ptr<InMemoryBroker> weak = broker_;
    return Subscription([weak, id]{
        if (auto b = weak.lock()) b->remove(id);
    });
}
