#include "../include/broker_routes.hpp"
#include "../../../shared/cpp/common/include/errors.hpp"
#include "../../../shared/cpp/common/include/log.hpp"
#include <map>
#include <string>

using json = nlohmann::json;

namespace {
std::size_t parse_max(const std::string& s) {
    if (s.empty()) return 32;
    try {
        long long v = std::stoll(s);
        if (v <= 0) throw InvalidArgument("max must be > 0");
        return (std::size_t)v;
    } catch (const std::logic_error&) {
        throw InvalidArgument("max must be a positive integer");
    }
}

std::string require(const HttpRequest& req, const char* key) {
    auto v = req.param(key);
    if (v.empty()) throw InvalidArgument(std::string(key) + " query parameter required");
    return v;
}
}

HttpReply handle_broker_request(TopicBroker& broker, const HttpRequest& req) {
    const std::string& path = req.path;
    if (req.method == "POST" && path == "/publish") {
        auto j = json::parse(req.body);
        std::size_t routed = broker.publish(j);
        return json_reply(200, json{{"routed", routed}});
    }
    if (req.method == "POST" && path == "/subscriptions") {
        auto j = json::parse(req.body);
        std::string topic = j.at("topic").get<std::string>();
        std::string group = j.value("group", std::string());
        std::string id = broker.subscribe(topic, group);
        log_debug("broker", "subscription " + id + " on " + topic + (group.empty() ? "" : " group=" + group));
        return json_reply(200, json{{"id", id}});
    }
    if (req.method == "DELETE" && path.rfind("/subscriptions/", 0) == 0) {
        std::string id = path.substr(std::string("/subscriptions/").size());
        if (id.empty()) throw InvalidArgument("id required");
        if (!broker.unsubscribe(id)) throw NotFound("unknown subscription " + id);
        return json_reply(200, json{{"ok", true}});
    }
    if (req.method == "GET" && path == "/poll") {
        auto batch = broker.poll(require(req, "sub"), parse_max(req.param("max")));
        if (batch.empty()) return no_content();
        json arr = json::array();
        for (auto& m : batch) arr.push_back(m.body);
        return json_reply(200, json{{"messages", arr}});
    }
    if (req.method == "POST" && path == "/ack") {
        bool acked = broker.ack(require(req, "sub"), require(req, "id"));
        return json_reply(200, json{{"ok", acked}});
    }
    if (req.method == "GET" && path == "/stats") {
        auto s = broker.snapshot();
        json subs = json::array();
        std::map<std::string, json> by_topic;
        for (const auto& info : s.subscriptions) {
            subs.push_back({
                {"id", info.id},
                {"topic", info.topic},
                {"group", info.group},
                {"queued", info.queued},
                {"inflight", info.inflight}
            });
            auto& t = by_topic[info.topic];
            if (t.is_null()) t = json({{"subscribers", 0}, {"queued", 0}, {"inflight", 0}});
            t["subscribers"] = t["subscribers"].get<int>() + 1;
            t["queued"] = t["queued"].get<std::size_t>() + info.queued;
            t["inflight"] = t["inflight"].get<std::size_t>() + info.inflight;
        }
        json out = {
            {"subscriptions", subs},
            {"by_topic", by_topic},
            {"metrics", {
                {"published", s.published},
                {"delivered", s.delivered},
                {"redelivered", s.redelivered},
                {"unrouted", s.unrouted},
                {"expired", s.expired}
            }}
        };
        return json_reply(200, out);
    }
    return json_reply(404, json{{"error", "not found"}});
}
