#include "../include/memory_types.hpp"
#include "../../common/include/errors.hpp"
#include "../../common/include/util.hpp"

using json = nlohmann::json;

std::string to_string(MemoryType t) {
    switch (t) {
        case MemoryType::Episodic: return "episodic";
        case MemoryType::Semantic: return "semantic";
        case MemoryType::Procedural: return "procedural";
        case MemoryType::Emotional: return "emotional";
        case MemoryType::Working: return "working";
    }
    return "unknown";
}

MemoryType parse_memory_type(const std::string& s) {
    auto l = to_lower(s);
    for (auto t : kAllMemoryTypes) {
        if (to_string(t) == l) return t;
    }
    throw InvalidArgument("unknown memory type: " + s);
}

namespace {
bool field_matches(const json& actual, const json& wanted) {
    if (wanted.is_string()) {
        std::string hay = actual.is_string() ? actual.get<std::string>() : actual.dump();
        return to_lower(hay).find(to_lower(wanted.get<std::string>())) != std::string::npos;
    }
    return actual == wanted;
}
}

bool MemoryFilter::matches(const MemoryItem& item) const {
    if (key_prefix && item.key.compare(0, key_prefix->size(), *key_prefix) != 0) return false;
    if (stored_after && !(item.stored_at > *stored_after)) return false;
    if (stored_before && !(item.stored_at < *stored_before)) return false;
    for (const auto& kv : metadata) {
        auto it = item.metadata.find(kv.first);
        if (it == item.metadata.end() || it->second != kv.second) return false;
    }
    if (fields.is_object() && !fields.empty()) {
        if (!item.value.is_object()) return false;
        for (auto it = fields.begin(); it != fields.end(); ++it) {
            auto f = item.value.find(it.key());
            if (f == item.value.end() || !field_matches(*f, it.value())) return false;
        }
    }
    return true;
}

json memory_item_to_json(const MemoryItem& item) {
    json j = {
        {"type", to_string(item.type)},
        {"key", item.key},
        {"value", item.value},
        {"stored_at_ms", to_unix_ms(item.stored_at)},
        {"metadata", item.metadata}
    };
    j["ttl_ms"] = item.ttl ? json(item.ttl->count()) : json(nullptr);
    return j;
}

json memory_stats_to_json(const MemoryStats& stats) {
    json by_type = json::object();
    for (const auto& kv : stats.by_type) {
        const auto& s = kv.second;
        by_type[to_string(kv.first)] = {
            {"count", s.count},
            {"oldest_ms", s.oldest ? json(to_unix_ms(*s.oldest)) : json(nullptr)},
            {"newest_ms", s.newest ? json(to_unix_ms(*s.newest)) : json(nullptr)}
        };
    }
    return json{{"by_type", by_type}, {"total", stats.total}};
}
