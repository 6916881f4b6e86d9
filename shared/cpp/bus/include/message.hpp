#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

enum class MessageKind { Event, Request, Response };

std::string to_string(MessageKind kind);
// Throws InvalidArgument for unknown names.
MessageKind parse_message_kind(const std::string& s);

// Wire-level unit of communication. Built by the sender and never modified
// after publish; handlers only ever see const references.
struct Message {
    std::string id;             // unique per publish, for deduplication
    std::string topic;          // "<domain>.<event>"
    MessageKind kind{MessageKind::Event};
    nlohmann::json payload;
    std::string correlation_id; // requests: fresh id; responses: echoed from the request
    std::optional<std::string> reply_to;
    std::string sender;         // publisher id
    std::chrono::system_clock::time_point sent_at;
};

Message make_event(const std::string& topic, nlohmann::json payload);

nlohmann::json message_to_json(const Message& m);
// Throws InvalidArgument when required fields are missing or mistyped.
Message message_from_json(const nlohmann::json& j);

// Payload helpers for the reply convention used by runtimes and the orchestrator:
//   success {"ok": true, "result": ...}
//   failure {"ok": false, "error": "...", "kind": "...", "fatal": bool}
nlohmann::json ok_payload(nlohmann::json result);
nlohmann::json error_payload(const std::string& error, const std::string& kind, bool fatal = false);
bool is_ok_payload(const nlohmann::json& payload);
