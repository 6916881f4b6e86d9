#include "../include/working_memory.hpp"
#include <algorithm>

void WorkingMemory::put(MemoryItem item) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::string key = item.key;
    items_[key] = std::move(item);
}

std::optional<MemoryItem> WorkingMemory::get(const std::string& key, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = items_.find(key);
    if (it == items_.end()) return std::nullopt;
    if (it->second.expired(now)) {
        items_.erase(it);
        return std::nullopt;
    }
    return it->second;
}

bool WorkingMemory::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    return items_.erase(key) > 0;
}

std::vector<MemoryItem> WorkingMemory::snapshot(Clock::time_point now) const {
    std::vector<MemoryItem> out;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        out.reserve(items_.size());
        for (const auto& kv : items_) {
            if (!kv.second.expired(now)) out.push_back(kv.second);
        }
    }
    std::sort(out.begin(), out.end(), before);
    return out;
}

std::size_t WorkingMemory::sweep(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::size_t removed = 0;
    for (auto it = items_.begin(); it != items_.end();) {
        if (it->second.expired(now)) {
            it = items_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

MemoryTypeStats WorkingMemory::stats(Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mtx_);
    MemoryTypeStats s;
    for (const auto& kv : items_) {
        const auto& item = kv.second;
        if (item.expired(now)) continue;
        ++s.count;
        if (!s.oldest || item.stored_at < *s.oldest) s.oldest = item.stored_at;
        if (!s.newest || item.stored_at > *s.newest) s.newest = item.stored_at;
    }
    return s;
}

void WorkingMemory::clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    items_.clear();
}
