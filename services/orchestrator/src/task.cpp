#include "../include/task.hpp"
#include "../../../shared/cpp/common/include/errors.hpp"
#include "../../../shared/cpp/common/include/util.hpp"
#include <algorithm>

using json = nlohmann::json;

std::string to_string(TaskStatus s) {
    switch (s) {
        case TaskStatus::Pending: return "pending";
        case TaskStatus::Dispatched: return "dispatched";
        case TaskStatus::InProgress: return "in_progress";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed: return "failed";
    }
    return "unknown";
}

std::string to_string(TaskPriority p) {
    return p == TaskPriority::High ? "high" : "low";
}

std::string to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::None: return "none";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Handler: return "handler";
        case ErrorKind::NoEligibleAgent: return "no_eligible_agent";
        case ErrorKind::BusUnavailable: return "bus_unavailable";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

TaskPriority parse_task_priority(const std::string& s) {
    auto l = to_lower(s);
    if (l == "high") return TaskPriority::High;
    if (l == "low" || l.empty()) return TaskPriority::Low;
    throw InvalidArgument("priority must be high or low, got: " + s);
}

json task_to_json(const Task& t) {
    json j = {
        {"task_id", t.task_id},
        {"description", t.description},
        {"required_capability", t.required_capability},
        {"priority", to_string(t.priority)},
        {"status", to_string(t.status)},
        {"attempts", t.attempts},
        {"submitted_at_ms", to_unix_ms(t.submitted_at)},
        {"updated_at_ms", to_unix_ms(t.updated_at)}
    };
    j["assigned_agent"] = t.assigned_agent ? json(*t.assigned_agent) : json(nullptr);
    if (t.workflow_id) j["workflow_id"] = *t.workflow_id;
    if (t.status == TaskStatus::Completed) j["result"] = t.result;
    if (!t.last_error.empty()) {
        j["error"] = t.last_error;
        j["error_kind"] = to_string(t.error_kind);
    }
    return j;
}

void TaskTable::add(Task t) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::string id = t.task_id;
    tasks_[id] = std::move(t);
    cv_.notify_all();
}

std::optional<Task> TaskTable::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return std::nullopt;
    return it->second;
}

std::optional<Task> TaskTable::update(const std::string& id, const std::function<void(Task&)>& fn) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return std::nullopt;
    fn(it->second);
    it->second.updated_at = std::chrono::system_clock::now();
    cv_.notify_all();
    return it->second;
}

std::optional<Task> TaskTable::wait_terminal(const std::string& id, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mtx_);
    auto done = [&]{
        auto it = tasks_.find(id);
        return it == tasks_.end() || is_terminal(it->second.status);
    };
    cv_.wait_for(lock, timeout, done);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return std::nullopt;
    return it->second;
}

std::map<TaskStatus, std::size_t> TaskTable::counts() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::map<TaskStatus, std::size_t> out;
    for (const auto& kv : tasks_) ++out[kv.second.status];
    return out;
}

std::vector<Task> TaskTable::snapshot() const {
    std::vector<Task> out;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        out.reserve(tasks_.size());
        for (const auto& kv : tasks_) out.push_back(kv.second);
    }
    std::sort(out.begin(), out.end(), [](const Task& a, const Task& b) { return a.submitted_at < b.submitted_at; });
    return out;
}
