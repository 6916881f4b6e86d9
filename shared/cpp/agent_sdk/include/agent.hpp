#pragma once
#include "../../bus/include/bus.hpp"
#include "../../memory/include/memory_manager.hpp"
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// Handles passed to an agent on every delivery. The runtime owns neither.
struct AgentContext {
    MessageBus& bus;
    MemoryManager& memory;
    std::string agent_id;
};

// Capability interface every concrete agent implements. Agents keep their
// own state; the runtime only drives them.
class Agent {
public:
    virtual ~Agent() = default;

    virtual std::string type() const = 0;
    virtual std::set<std::string> capabilities() const = 0;
    // Extra event topics to listen on besides dispatch and direct messages.
    virtual std::vector<std::string> topics() const { return {}; }

    // Handles one inbound request or event. For requests the returned value
    // is sent back as the result. Throw AgentHandlerError to report a domain
    // failure; mark it fatal to stop the agent.
    virtual nlohmann::json receive(const Message& msg, AgentContext& ctx) = 0;
};
