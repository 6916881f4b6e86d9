#include "../include/message.hpp"
#include "../../common/include/errors.hpp"
#include "../../common/include/util.hpp"

using json = nlohmann::json;

std::string to_string(MessageKind kind) {
    switch (kind) {
        case MessageKind::Request: return "request";
        case MessageKind::Response: return "response";
        default: return "event";
    }
}

MessageKind parse_message_kind(const std::string& s) {
    if (s == "event") return MessageKind::Event;
    if (s == "request") return MessageKind::Request;
    if (s == "response") return MessageKind::Response;
    throw InvalidArgument("unknown message kind: " + s);
}

Message make_event(const std::string& topic, json payload) {
    Message m;
    m.topic = topic;
    m.kind = MessageKind::Event;
    m.payload = std::move(payload);
    return m;
}

json message_to_json(const Message& m) {
    json j = {
        {"id", m.id},
        {"topic", m.topic},
        {"kind", to_string(m.kind)},
        {"payload", m.payload},
        {"correlation_id", m.correlation_id},
        {"sender", m.sender},
        {"sent_at_ms", to_unix_ms(m.sent_at)}
    };
    j["reply_to"] = m.reply_to ? json(*m.reply_to) : json(nullptr);
    return j;
}

Message message_from_json(const json& j) {
    if (!j.is_object()) throw InvalidArgument("message must be a JSON object");
    try {
        Message m;
        m.id = j.value("id", std::string());
        m.topic = j.at("topic").get<std::string>();
        m.kind = parse_message_kind(j.value("kind", std::string("event")));
        m.payload = j.value("payload", json());
        m.correlation_id = j.value("correlation_id", std::string());
        if (j.contains("reply_to") && !j["reply_to"].is_null()) {
            m.reply_to = j["reply_to"].get<std::string>();
        }
        m.sender = j.value("sender", std::string());
        m.sent_at = from_unix_ms(j.value("sent_at_ms", (std::int64_t)0));
        if (m.topic.empty()) throw InvalidArgument("message topic is empty");
        return m;
    } catch (const json::exception& e) {
        throw InvalidArgument(std::string("malformed message: ") + e.what());
    }
}

json ok_payload(json result) {
    return json{{"ok", true}, {"result", std::move(result)}};
}

json error_payload(const std::string& error, const std::string& kind, bool fatal) {
    return json{{"ok", false}, {"error", error}, {"kind", kind}, {"fatal", fatal}};
}

bool is_ok_payload(const json& payload) {
    return payload.is_object() && payload.value("ok", false);
}
