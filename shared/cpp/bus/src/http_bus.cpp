#include "../include/http_bus.hpp"
#include "../../common/include/errors.hpp"
#include "../../common/include/log.hpp"
#include "../../http/include/http_client.hpp"
#include <algorithm>

using json = nlohmann::json;

namespace {
void check_status(const HttpResponse& r, const std::string& what) {
    if (r.status >= 500) {
        throw TransportError(what + ": broker returned " + std::to_string(r.status));
    }
    if (r.status < 200 || r.status >= 300) {
        std::string err = r.body;
        try {
            err = json::parse(r.body).value("error", r.body);
        } catch (const json::exception&) {
            // body is not JSON; report it verbatim
        }
        throw InvalidArgument(what + ": broker rejected request (" + std::to_string(r.status) + "): " + err);
    }
}
}

HttpBus::HttpBus(std::string broker_url, std::string client_id, RetryPolicy retry, HttpBusOptions opts)
    : MessageBus(std::move(client_id), retry), base_(std::move(broker_url)), opts_(opts) {
    if (!base_.empty() && base_.back() == '/') base_.pop_back();
}

HttpBus::~HttpBus() {
    std::vector<std::shared_ptr<Poller>> all;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        for (auto& p : pollers_) all.push_back(p);
        pollers_.clear();
        for (auto& p : retired_) all.push_back(p);
        retired_.clear();
    }
    for (auto& p : all) stop_poller(p);
    // Pollers call back into this object, so every one of them is joined here.
    for (auto& p : all) {
        if (!p->thread.joinable()) continue;
        if (p->thread.get_id() == std::this_thread::get_id()) p->thread.detach();
        else p->thread.join();
    }
}

void HttpBus::do_publish(const Message& msg) {
    auto r = http_post_json(base_ + "/publish", message_to_json(msg).dump(), opts_.http_timeout_ms);
    check_status(r, "publish " + msg.topic);
}

std::string HttpBus::open_subscription(const std::string& topic, const std::string& group) {
    json body = {{"topic", topic}};
    if (!group.empty()) body["group"] = group;
    auto r = http_post_json(base_ + "/subscriptions", body.dump(), opts_.http_timeout_ms);
    check_status(r, "subscribe " + topic);
    return json::parse(r.body).at("id").get<std::string>();
}

void HttpBus::close_subscription(const std::string& sub_id) {
    try {
        auto r = http_delete(base_ + "/subscriptions/" + url_encode(sub_id), opts_.http_timeout_ms);
        if (r.status != 200 && r.status != 404) {
            log_warn("http-bus", "unsubscribe " + sub_id + " returned " + std::to_string(r.status));
        }
    } catch (const TransportError& e) {
        log_warn("http-bus", "unsubscribe " + sub_id + " failed: " + e.what());
    }
}

void HttpBus::ack(const std::string& sub_id, const std::string& message_id) {
    try {
        auto r = http_post_json(base_ + "/ack?sub=" + url_encode(sub_id) + "&id=" + url_encode(message_id), "{}",
                                opts_.http_timeout_ms);
        if (r.status != 200) log_warn("http-bus", "ack " + message_id + " returned " + std::to_string(r.status));
    } catch (const TransportError& e) {
        // Unacked messages come back after the visibility timeout and are deduplicated.
        log_warn("http-bus", "ack " + message_id + " failed: " + e.what());
    }
}

Subscription HttpBus::do_subscribe(const std::string& topic, MessageHandler handler, const SubscribeOptions& opts) {
    auto p = std::make_shared<Poller>();
    p->topic = topic;
    p->group = opts.mode == SubscriptionMode::ConsumerGroup ? opts.group : std::string();
    p->handler = std::move(handler);
    p->sub_id = open_subscription(topic, p->group);
    {
        std::lock_guard<std::mutex> lock(mtx_);
        reap_locked();
        pollers_.push_back(p);
        p->thread = std::thread([this, p]{ poll_loop(p); });
    }
    std::weak_ptr<Poller> weak = p;
    return Subscription([this, weak]{
        auto p = weak.lock();
        if (!p) return;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            auto it = std::find(pollers_.begin(), pollers_.end(), p);
            if (it == pollers_.end()) return;
            pollers_.erase(it);
            retired_.push_back(p);
            reap_locked();
        }
        stop_poller(p);
    });
}

void HttpBus::reap_locked() {
    auto it = std::remove_if(retired_.begin(), retired_.end(), [](const std::shared_ptr<Poller>& p) {
        if (!p->finished.load()) return false;
        if (p->thread.joinable()) p->thread.join();
        return true;
    });
    retired_.erase(it, retired_.end());
}

void HttpBus::stop_poller(const std::shared_ptr<Poller>& p) {
    std::string sub_id;
    {
        std::lock_guard<std::mutex> lock(p->mtx);
        if (p->stop) return;
        p->stop = true;
        sub_id = p->sub_id;
    }
    p->cv.notify_all();
    close_subscription(sub_id);
}

void HttpBus::poll_loop(const std::shared_ptr<Poller>& p) {
    auto stopped = [&p]{
        std::lock_guard<std::mutex> lock(p->mtx);
        return p->stop;
    };
    auto idle = [&p](std::chrono::milliseconds d) {
        std::unique_lock<std::mutex> lock(p->mtx);
        p->cv.wait_for(lock, d, [&p]{ return p->stop; });
    };

    auto current_sub = [&p]{
        std::lock_guard<std::mutex> lock(p->mtx);
        return p->sub_id;
    };

    auto backoff = opts_.poll_interval;
    while (!stopped()) {
        const std::string sub_id = current_sub();
        HttpResponse r;
        try {
            r = http_get(base_ + "/poll?sub=" + url_encode(sub_id) + "&max=" + std::to_string(opts_.poll_batch),
                         opts_.http_timeout_ms);
        } catch (const TransportError& e) {
            log_warn("http-bus", "poll " + p->topic + " failed: " + e.what());
            idle(backoff);
            backoff = std::min(backoff * 2, std::chrono::milliseconds(5000));
            continue;
        }
        backoff = opts_.poll_interval;

        if (r.status == 404) {
            if (stopped()) break;
            // Broker lost the subscription (restart or lease expiry); open a new one.
            log_warn("http-bus", "subscription on " + p->topic + " lost, resubscribing");
            std::string fresh;
            try {
                fresh = open_subscription(p->topic, p->group);
            } catch (const std::exception& e) {
                log_error("http-bus", "resubscribe " + p->topic + " failed: " + e.what());
                idle(opts_.poll_interval);
                continue;
            }
            bool raced;
            {
                std::lock_guard<std::mutex> lock(p->mtx);
                raced = p->stop;
                if (!raced) p->sub_id = fresh;
            }
            if (raced) {
                close_subscription(fresh);
                break;
            }
            continue;
        }
        if (r.status != 200) {
            idle(opts_.poll_interval);
            continue;
        }

        json batch;
        try {
            batch = json::parse(r.body).at("messages");
        } catch (const json::exception& e) {
            log_error("http-bus", std::string("malformed poll reply: ") + e.what());
            idle(opts_.poll_interval);
            continue;
        }
        for (const auto& raw : batch) {
            if (stopped()) break;
            Message m;
            try {
                m = message_from_json(raw);
            } catch (const InvalidArgument& e) {
                log_error("http-bus", std::string("dropping malformed message: ") + e.what());
                if (raw.contains("id") && raw["id"].is_string()) ack(sub_id, raw["id"].get<std::string>());
                continue;
            }
            if (p->seen.insert(m.id)) {
                try {
                    p->handler(m);
                } catch (const std::exception& e) {
                    log_error("http-bus", "handler on " + p->topic + " threw for message " + m.id + ": " + e.what());
                }
            }
            ack(sub_id, m.id);
        }
    }
    p->finished.store(true);
}
