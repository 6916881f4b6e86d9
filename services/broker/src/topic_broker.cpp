#include "../include/topic_broker.hpp"
#include "../../../shared/cpp/common/include/errors.hpp"
#include "../../../shared/cpp/common/include/ids.hpp"
#include "../../../shared/cpp/common/include/log.hpp"
#include <algorithm>

using json = nlohmann::json;

using Clock = std::chrono::steady_clock;

TopicBroker::TopicBroker(std::chrono::milliseconds visibility_timeout, std::chrono::milliseconds subscription_lease)
    : visibility_(visibility_timeout), lease_(subscription_lease) {}

std::string TopicBroker::subscribe(const std::string& topic, const std::string& group) {
    if (topic.empty()) throw InvalidArgument("topic required");
    std::lock_guard<std::mutex> lock(mtx_);
    Sub s;
    s.id = generate_id();
    s.topic = topic;
    s.group = group;
    s.last_seen = Clock::now();
    if (group.empty()) broadcast_[topic].push_back(s.id);
    else groups_[topic][group].members.push_back(s.id);
    std::string id = s.id;
    subs_.emplace(id, std::move(s));
    return id;
}

bool TopicBroker::unsubscribe(const std::string& sub_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    return unsubscribe_locked(sub_id);
}

bool TopicBroker::unsubscribe_locked(const std::string& sub_id) {
    auto it = subs_.find(sub_id);
    if (it == subs_.end()) return false;
    Sub gone = std::move(it->second);
    subs_.erase(it);

    if (gone.group.empty()) {
        auto& v = broadcast_[gone.topic];
        v.erase(std::remove(v.begin(), v.end(), sub_id), v.end());
        if (v.empty()) broadcast_.erase(gone.topic);
        return true;
    }

    auto& topic_groups = groups_[gone.topic];
    auto& cursor = topic_groups[gone.group];
    cursor.members.erase(std::remove(cursor.members.begin(), cursor.members.end(), sub_id), cursor.members.end());
    if (cursor.members.empty()) {
        topic_groups.erase(gone.group);
        if (topic_groups.empty()) groups_.erase(gone.topic);
        return true;
    }
    // Hand unacknowledged work to the survivors.
    std::deque<QueuedMessage> orphans;
    for (auto& kv : gone.inflight) orphans.push_back(std::move(kv.second.msg));
    for (auto& m : gone.queue) orphans.push_back(std::move(m));
    for (auto& m : orphans) {
        auto& target = subs_[cursor.members[cursor.next % cursor.members.size()]];
        cursor.next = (cursor.next + 1) % cursor.members.size();
        target.queue.push_back(std::move(m));
    }
    return true;
}

void TopicBroker::expire_idle_locked(Clock::time_point now) {
    if (lease_.count() <= 0 || now < next_lease_check_) return;
    next_lease_check_ = now + std::max(lease_ / 4, std::chrono::milliseconds(1));
    std::vector<std::string> idle;
    for (const auto& kv : subs_) {
        if (now - kv.second.last_seen > lease_) idle.push_back(kv.first);
    }
    for (const auto& id : idle) {
        const std::string topic = subs_[id].topic;
        unsubscribe_locked(id);
        ++expired_;
        log_info("broker", "Subscription " + id + " on " + topic + " expired after " +
                 std::to_string(lease_.count()) + "ms without a poll");
    }
}

std::size_t TopicBroker::publish(const json& body) {
    if (!body.is_object() || !body.contains("topic") || !body["topic"].is_string()) {
        throw InvalidArgument("message requires a string topic");
    }
    if (!body.contains("id") || !body["id"].is_string() || body["id"].get<std::string>().empty()) {
        throw InvalidArgument("message requires an id");
    }
    const std::string topic = body["topic"].get<std::string>();
    QueuedMessage qm{body["id"].get<std::string>(), body, 0};

    std::lock_guard<std::mutex> lock(mtx_);
    expire_idle_locked(Clock::now());
    ++published_;
    std::size_t n = 0;
    auto b = broadcast_.find(topic);
    if (b != broadcast_.end()) {
        for (const auto& id : b->second) {
            subs_[id].queue.push_back(qm);
            ++n;
        }
    }
    auto g = groups_.find(topic);
    if (g != groups_.end()) {
        for (auto& kv : g->second) {
            auto& cursor = kv.second;
            if (cursor.members.empty()) continue;
            subs_[cursor.members[cursor.next % cursor.members.size()]].queue.push_back(qm);
            cursor.next = (cursor.next + 1) % cursor.members.size();
            ++n;
        }
    }
    if (n == 0) ++unrouted_;
    return n;
}

void TopicBroker::requeue_expired_locked(Sub& s, std::chrono::steady_clock::time_point now) {
    std::vector<QueuedMessage> expired;
    for (auto it = s.inflight.begin(); it != s.inflight.end();) {
        if (it->second.deadline <= now) {
            expired.push_back(std::move(it->second.msg));
            it = s.inflight.erase(it);
        } else {
            ++it;
        }
    }
    // Oldest first at the head of the queue.
    std::sort(expired.begin(), expired.end(), [](const QueuedMessage& a, const QueuedMessage& b) {
        return a.body.value("sent_at_ms", (std::int64_t)0) < b.body.value("sent_at_ms", (std::int64_t)0);
    });
    for (auto it = expired.rbegin(); it != expired.rend(); ++it) {
        s.queue.push_front(std::move(*it));
        ++redelivered_;
    }
}

std::vector<QueuedMessage> TopicBroker::poll(const std::string& sub_id, std::size_t max) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto now = Clock::now();
    expire_idle_locked(now);
    auto it = subs_.find(sub_id);
    if (it == subs_.end()) throw NotFound("unknown subscription " + sub_id);
    auto& s = it->second;
    s.last_seen = now;
    requeue_expired_locked(s, now);

    std::vector<QueuedMessage> out;
    while (!s.queue.empty() && out.size() < max) {
        QueuedMessage m = std::move(s.queue.front());
        s.queue.pop_front();
        ++m.deliveries;
        ++delivered_;
        out.push_back(m);
        s.inflight[m.id] = Inflight{std::move(m), now + visibility_};
    }
    return out;
}

bool TopicBroker::ack(const std::string& sub_id, const std::string& message_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = subs_.find(sub_id);
    if (it == subs_.end()) return false;
    it->second.last_seen = Clock::now();
    return it->second.inflight.erase(message_id) > 0;
}

BrokerSnapshot TopicBroker::snapshot() {
    std::lock_guard<std::mutex> lock(mtx_);
    expire_idle_locked(Clock::now());
    BrokerSnapshot snap;
    snap.subscriptions.reserve(subs_.size());
    for (const auto& kv : subs_) {
        const auto& s = kv.second;
        snap.subscriptions.push_back(SubscriptionInfo{s.id, s.topic, s.group, s.queue.size(), s.inflight.size()});
    }
    snap.published = published_;
    snap.delivered = delivered_;
    snap.redelivered = redelivered_;
    snap.unrouted = unrouted_;
    snap.expired = expired_;
    return snap;
}
