#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

enum class TaskStatus { Pending, Dispatched, InProgress, Completed, Failed };
enum class TaskPriority { High, Low };
enum class ErrorKind { None, Timeout, Handler, NoEligibleAgent, BusUnavailable, Cancelled };

std::string to_string(TaskStatus s);
std::string to_string(TaskPriority p);
std::string to_string(ErrorKind k);
// "high" | "low"; throws InvalidArgument otherwise.
TaskPriority parse_task_priority(const std::string& s);

inline bool is_terminal(TaskStatus s) { return s == TaskStatus::Completed || s == TaskStatus::Failed; }

struct Task {
    std::string task_id;
    std::string description;
    std::string required_capability;
    TaskPriority priority{TaskPriority::Low};
    nlohmann::json input = nlohmann::json::object();
    std::optional<std::string> workflow_id;

    TaskStatus status{TaskStatus::Pending};
    std::optional<std::string> assigned_agent;
    int attempts{0};                // failed dispatches so far
    nlohmann::json result;
    std::string last_error;
    ErrorKind error_kind{ErrorKind::None};
    std::string last_failed_agent;

    std::string correlation_id;     // of the dispatch currently awaited
    std::chrono::system_clock::time_point submitted_at;
    std::chrono::system_clock::time_point updated_at;
    std::chrono::steady_clock::time_point deadline;
};

nlohmann::json task_to_json(const Task& t);

// Owns every Task. Mutations go through update() so waiters see each change.
class TaskTable {
public:
    void add(Task t);
    std::optional<Task> get(const std::string& id) const;
    // Applies fn under the table lock when the task exists; returns the
    // updated copy, nullopt for unknown ids.
    std::optional<Task> update(const std::string& id, const std::function<void(Task&)>& fn);
    // Blocks until the task is terminal or the timeout passes.
    // Returns the latest copy, nullopt for unknown ids.
    std::optional<Task> wait_terminal(const std::string& id, std::chrono::milliseconds timeout) const;

    std::map<TaskStatus, std::size_t> counts() const;
    std::vector<Task> snapshot() const;

private:
    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
    std::unordered_map<std::string, Task> tasks_;
};
