#pragma once
#include <string>

// Well-known topics shared by runtimes and the orchestrator.
constexpr const char* kTopicRegister = "orchestrator.register";
constexpr const char* kTopicSubmit = "orchestrator.submit";
constexpr const char* kTopicStatus = "orchestrator.status";
constexpr const char* kTopicWorkflow = "orchestrator.workflow";

constexpr const char* kTopicHeartbeat = "agent.heartbeat";
constexpr const char* kTopicAgentStarted = "agent.started";
constexpr const char* kTopicAgentStopped = "agent.stopped";
constexpr const char* kTopicAgentError = "agent.error";
constexpr const char* kTopicAgentUnhealthy = "agent.unhealthy";

constexpr const char* kTopicTaskStarted = "task.started";
constexpr const char* kTopicTaskCompleted = "task.completed";
constexpr const char* kTopicTaskFailed = "task.failed";

constexpr const char* kTopicSystemStarted = "system.started";
constexpr const char* kTopicSystemStopping = "system.stopping";
constexpr const char* kTopicSystemStats = "system.stats";

// Requests the orchestrator sends to one agent.
inline std::string dispatch_topic(const std::string& agent_id) { return "agent." + agent_id + ".dispatch"; }
// Agent-to-agent events.
inline std::string direct_topic(const std::string& agent_id) { return "agent." + agent_id + ".direct"; }
