#pragma once
#include "task.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

struct DispatchEntry {
    std::string task_id;
    TaskPriority priority{TaskPriority::Low};
    std::chrono::steady_clock::time_point not_before;
};

// Two-lane queue of task ids waiting for dispatch. High is served before
// low, FIFO within a lane, skipping entries whose not_before is still in
// the future.
class DispatchQueue {
public:
    using Clock = std::chrono::steady_clock;

    void push(const std::string& task_id, TaskPriority priority, Clock::time_point not_before = Clock::time_point{});
    // Blocks until an entry is due or the queue is closed (nullopt).
    std::optional<DispatchEntry> pop();
    // Drops queued entries for the task. Returns how many were removed.
    std::size_t remove(const std::string& task_id);
    void close();
    std::size_t size() const;

private:
    std::optional<DispatchEntry> take_due_locked(Clock::time_point now);
    std::optional<Clock::time_point> next_due_locked() const;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<DispatchEntry> high_;
    std::deque<DispatchEntry> low_;
    bool closed_{false};
};
