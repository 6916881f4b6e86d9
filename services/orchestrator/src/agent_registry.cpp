#include "../include/agent_registry.hpp"
#include "../../../shared/cpp/common/include/errors.hpp"
#include "../../../shared/cpp/common/include/ids.hpp"
#include "../../../shared/cpp/common/include/util.hpp"
#include <algorithm>

using json = nlohmann::json;

std::string to_string(AgentStatus s) {
    switch (s) {
        case AgentStatus::Starting: return "starting";
        case AgentStatus::Ready: return "ready";
        case AgentStatus::Busy: return "busy";
        case AgentStatus::Unhealthy: return "unhealthy";
        case AgentStatus::Stopped: return "stopped";
    }
    return "unknown";
}

json agent_to_json(const AgentRecord& r, std::chrono::steady_clock::time_point now) {
    auto silent = std::chrono::duration_cast<std::chrono::milliseconds>(now - r.last_heartbeat).count();
    return json{
        {"agent_id", r.agent_id},
        {"agent_type", r.agent_type},
        {"capabilities", r.capabilities},
        {"status", to_string(r.status)},
        {"ms_since_heartbeat", silent},
        {"registered_at_ms", to_unix_ms(r.registered_at)}
    };
}

AgentRecord AgentRegistry::add(const std::string& agent_type, const std::set<std::string>& capabilities,
                               const std::string& agent_id) {
    auto e = std::make_shared<Entry>();
    e->rec.agent_id = agent_id.empty() ? generate_id() : agent_id;
    e->rec.agent_type = agent_type;
    e->rec.capabilities = capabilities;
    e->rec.status = AgentStatus::Starting;
    e->rec.last_heartbeat = Clock::now();
    e->rec.registered_at = std::chrono::system_clock::now();

    std::unique_lock<std::shared_mutex> lock(mtx_);
    if (agents_.count(e->rec.agent_id)) throw InvalidArgument("agent " + e->rec.agent_id + " is already registered");
    e->rec.seq = next_seq_++;
    agents_[e->rec.agent_id] = e;
    return e->rec;
}

bool AgentRegistry::remove(const std::string& agent_id) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    return agents_.erase(agent_id) > 0;
}

std::shared_ptr<AgentRegistry::Entry> AgentRegistry::find(const std::string& agent_id) const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    auto it = agents_.find(agent_id);
    return it == agents_.end() ? nullptr : it->second;
}

std::optional<AgentRecord> AgentRegistry::get(const std::string& agent_id) const {
    auto e = find(agent_id);
    if (!e) return std::nullopt;
    std::lock_guard<std::mutex> lock(e->mtx);
    return e->rec;
}

std::optional<AgentStatus> AgentRegistry::heartbeat(const std::string& agent_id, AgentStatus reported,
                                                    Clock::time_point now) {
    auto e = find(agent_id);
    if (!e) return std::nullopt;
    std::lock_guard<std::mutex> lock(e->mtx);
    auto prev = e->rec.status;
    e->rec.last_heartbeat = now;
    e->rec.status = reported;
    return prev;
}

std::optional<AgentStatus> AgentRegistry::set_status(const std::string& agent_id, AgentStatus status) {
    auto e = find(agent_id);
    if (!e) return std::nullopt;
    std::lock_guard<std::mutex> lock(e->mtx);
    auto prev = e->rec.status;
    e->rec.status = status;
    return prev;
}

std::vector<std::string> AgentRegistry::mark_stale(Clock::time_point now, std::chrono::milliseconds limit) {
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::shared_lock<std::shared_mutex> lock(mtx_);
        for (const auto& kv : agents_) entries.push_back(kv.second);
    }
    std::vector<std::string> changed;
    for (auto& e : entries) {
        std::lock_guard<std::mutex> lock(e->mtx);
        auto s = e->rec.status;
        if (s == AgentStatus::Unhealthy || s == AgentStatus::Stopped) continue;
        if (now - e->rec.last_heartbeat > limit) {
            e->rec.status = AgentStatus::Unhealthy;
            changed.push_back(e->rec.agent_id);
        }
    }
    return changed;
}

std::vector<AgentRecord> AgentRegistry::eligible(const std::string& capability) const {
    std::vector<AgentRecord> out;
    for (auto& rec : snapshot()) {
        if (rec.status == AgentStatus::Ready && rec.capabilities.count(capability)) out.push_back(std::move(rec));
    }
    return out;
}

std::vector<AgentRecord> AgentRegistry::snapshot() const {
    std::vector<std::shared_ptr<Entry>> entries;
    {
        std::shared_lock<std::shared_mutex> lock(mtx_);
        for (const auto& kv : agents_) entries.push_back(kv.second);
    }
    std::vector<AgentRecord> out;
    out.reserve(entries.size());
    for (auto& e : entries) {
        std::lock_guard<std::mutex> lock(e->mtx);
        out.push_back(e->rec);
    }
    std::sort(out.begin(), out.end(), [](const AgentRecord& a, const AgentRecord& b) { return a.seq < b.seq; });
    return out;
}

std::size_t AgentRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    return agents_.size();
}
