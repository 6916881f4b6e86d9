#pragma once
#include "task.hpp"
#include <chrono>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// One task of a workflow. The task input is the submission data with
// `input` laid over it, plus "type" = action and the workflow id.
struct WorkflowStep {
    std::string capability;
    std::string action;
    std::string description;
    nlohmann::json input = nlohmann::json::object();
};

using WorkflowCatalogue = std::map<std::string, std::vector<WorkflowStep>>;

// complete_photo_workflow, marketing_campaign_launch, client_onboarding.
WorkflowCatalogue default_workflows();
// {"<type>": [{"capability": ..., "action": ..., "description": ..., "input": {...}}, ...]}
// Throws InvalidArgument.
WorkflowCatalogue parse_workflow_catalogue(const nlohmann::json& j);

enum class WorkflowStatus { Pending, Running, Completed, Failed };

std::string to_string(WorkflowStatus s);

struct Workflow {
    std::string workflow_id;
    std::string type;
    std::vector<std::string> task_ids;
    std::chrono::system_clock::time_point submitted_at;
};

nlohmann::json step_input(const WorkflowStep& step, const nlohmann::json& data, const std::string& workflow_id);

// pending until a step leaves Pending, completed when every step completed,
// failed once every step is terminal and one of them failed, else running.
WorkflowStatus workflow_status(const std::vector<Task>& steps);

nlohmann::json workflow_to_json(const Workflow& w, const std::vector<Task>& steps);
