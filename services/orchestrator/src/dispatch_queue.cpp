#include "../include/dispatch_queue.hpp"
#include <algorithm>

void DispatchQueue::push(const std::string& task_id, TaskPriority priority, Clock::time_point not_before) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (closed_) return;
    DispatchEntry e{task_id, priority, not_before};
    if (priority == TaskPriority::High) {
        high_.push_back(e);
    } else {
        low_.push_back(e);
    }
    cv_.notify_one();
}

std::optional<DispatchEntry> DispatchQueue::take_due_locked(Clock::time_point now) {
    auto pop_from = [&](std::deque<DispatchEntry>& q) -> std::optional<DispatchEntry> {
        for (auto it = q.begin(); it != q.end(); ++it) {
            if (it->not_before <= now) {
                DispatchEntry e = *it;
                q.erase(it);
                return e;
            }
        }
        return std::nullopt;
    };
    if (auto e = pop_from(high_)) return e;
    if (auto e = pop_from(low_)) return e;
    return std::nullopt;
}

std::optional<DispatchQueue::Clock::time_point> DispatchQueue::next_due_locked() const {
    std::optional<Clock::time_point> next;
    for (const auto* q : {&high_, &low_}) {
        for (const auto& e : *q) {
            if (!next || e.not_before < *next) next = e.not_before;
        }
    }
    return next;
}

std::optional<DispatchEntry> DispatchQueue::pop() {
    std::unique_lock<std::mutex> lock(mtx_);
    for (;;) {
        if (closed_) return std::nullopt;
        if (auto e = take_due_locked(Clock::now())) return e;
        auto next = next_due_locked();
        if (next) cv_.wait_until(lock, *next);
        else cv_.wait(lock);
    }
}

std::size_t DispatchQueue::remove(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto remove_from = [&](std::deque<DispatchEntry>& q) -> std::size_t {
        std::size_t before = q.size();
        q.erase(std::remove_if(q.begin(), q.end(), [&](const DispatchEntry& e){ return e.task_id == task_id; }), q.end());
        return before - q.size();
    };
    std::size_t removed = 0;
    removed += remove_from(high_);
    removed += remove_from(low_);
    return removed;
}

void DispatchQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        closed_ = true;
        high_.clear();
        low_.clear();
    }
    cv_.notify_all();
}

std::size_t DispatchQueue::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return high_.size() + low_.size();
}
