#pragma once
#include "memory_types.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Ephemeral TTL-bearing store for working memory. Never persisted.
// Reads check expiry themselves, so an expired item is invisible even
// before sweep() removes it.
class WorkingMemory {
public:
    using Clock = std::chrono::system_clock;

    void put(MemoryItem item);
    // Erases the item if it has expired.
    std::optional<MemoryItem> get(const std::string& key, Clock::time_point now);
    bool erase(const std::string& key);
    // Live items in (stored_at, key) order.
    std::vector<MemoryItem> snapshot(Clock::time_point now) const;
    // Removes expired items, returns how many.
    std::size_t sweep(Clock::time_point now);
    MemoryTypeStats stats(Clock::time_point now) const;
    void clear();

private:
    mutable std::mutex mtx_;
    std::unordered_map<std::string, MemoryItem> items_;
};
