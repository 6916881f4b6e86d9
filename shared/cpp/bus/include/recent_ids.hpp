#pragma once
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_set>

// Bounded set of recently seen message ids for at-least-once consumers.
class RecentIds {
public:
    explicit RecentIds(std::size_t capacity = 4096) : capacity_(capacity ? capacity : 1) {}

    // Returns false when the id was already seen.
    bool insert(const std::string& id) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!set_.insert(id).second) return false;
        order_.push_back(id);
        if (order_.size() > capacity_) {
            set_.erase(order_.front());
            order_.pop_front();
        }
        return true;
    }

private:
    std::size_t capacity_;
    std::mutex mtx_;
    std::deque<std::string> order_;
    std::unordered_set<std::string> set_;
};
