#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class AgentStatus { Starting, Ready, Busy, Unhealthy, Stopped };

std::string to_string(AgentStatus s);

struct AgentRecord {
    std::string agent_id;
    std::string agent_type;
    std::set<std::string> capabilities;
    AgentStatus status{AgentStatus::Starting};
    std::chrono::steady_clock::time_point last_heartbeat;
    std::chrono::system_clock::time_point registered_at;
    std::uint64_t seq{0};   // registration order, used for round-robin
};

nlohmann::json agent_to_json(const AgentRecord& r, std::chrono::steady_clock::time_point now);

// Agent records keyed by id. The map itself is guarded by a shared lock;
// each record has its own mutex, so heartbeats for different agents never
// contend with each other.
class AgentRegistry {
public:
    using Clock = std::chrono::steady_clock;

    // Generates an id when none is given. Throws InvalidArgument when the id
    // is already registered.
    AgentRecord add(const std::string& agent_type, const std::set<std::string>& capabilities,
                    const std::string& agent_id = {});
    bool remove(const std::string& agent_id);
    std::optional<AgentRecord> get(const std::string& agent_id) const;

    // Records a heartbeat with the reported status. Returns the previous
    // status, nullopt for unknown agents.
    std::optional<AgentStatus> heartbeat(const std::string& agent_id, AgentStatus reported, Clock::time_point now);
    // Returns the previous status, nullopt for unknown agents.
    std::optional<AgentStatus> set_status(const std::string& agent_id, AgentStatus status);

    // Marks live agents silent for longer than limit as unhealthy and
    // returns the ids that changed.
    std::vector<std::string> mark_stale(Clock::time_point now, std::chrono::milliseconds limit);

    // Ready agents advertising the capability, in registration order.
    std::vector<AgentRecord> eligible(const std::string& capability) const;
    std::vector<AgentRecord> snapshot() const;
    std::size_t size() const;

private:
    struct Entry {
        mutable std::mutex mtx;
        AgentRecord rec;
    };

    std::shared_ptr<Entry> find(const std::string& agent_id) const;

    mutable std::shared_mutex mtx_;
    std::map<std::string, std::shared_ptr<Entry>> agents_;
    std::uint64_t next_seq_{1};
};
