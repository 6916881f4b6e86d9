#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

enum class MemoryType { Episodic, Semantic, Procedural, Emotional, Working };

constexpr std::array<MemoryType, 5> kAllMemoryTypes = {
    MemoryType::Episodic, MemoryType::Semantic, MemoryType::Procedural,
    MemoryType::Emotional, MemoryType::Working
};

std::string to_string(MemoryType t);
// Throws InvalidArgument for unknown names.
MemoryType parse_memory_type(const std::string& s);
inline bool is_durable(MemoryType t) { return t != MemoryType::Working; }

struct MemoryItem {
    MemoryType type{MemoryType::Episodic};
    std::string key;
    nlohmann::json value;
    std::chrono::system_clock::time_point stored_at;
    std::optional<std::chrono::milliseconds> ttl;   // working memory only
    std::map<std::string, std::string> metadata;

    std::optional<std::chrono::system_clock::time_point> expires_at() const {
        if (!ttl) return std::nullopt;
        return stored_at + *ttl;
    }
    bool expired(std::chrono::system_clock::time_point now) const {
        auto e = expires_at();
        return e && now >= *e;
    }
};

// Position in the (stored_at, key) order used by list().
struct ListCursor {
    std::int64_t stored_at_ms{0};
    std::string key;
};

inline bool before(const MemoryItem& a, const MemoryItem& b) {
    if (a.stored_at != b.stored_at) return a.stored_at < b.stored_at;
    return a.key < b.key;
}

// Simple structured filter, all present criteria must hold.
// fields: each entry is compared with the same top-level field of the item's
// value; strings match as case-insensitive substrings, everything else by
// equality.
struct MemoryFilter {
    std::optional<std::string> key_prefix;
    std::map<std::string, std::string> metadata;
    nlohmann::json fields = nlohmann::json::object();
    std::optional<std::chrono::system_clock::time_point> stored_after;
    std::optional<std::chrono::system_clock::time_point> stored_before;
    std::optional<std::size_t> limit;

    bool matches(const MemoryItem& item) const;
};

struct MemoryTypeStats {
    std::size_t count{0};
    std::optional<std::chrono::system_clock::time_point> oldest;
    std::optional<std::chrono::system_clock::time_point> newest;
};

struct MemoryStats {
    std::map<MemoryType, MemoryTypeStats> by_type;
    std::size_t total{0};
};

nlohmann::json memory_item_to_json(const MemoryItem& item);
nlohmann::json memory_stats_to_json(const MemoryStats& stats);
