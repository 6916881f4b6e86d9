#include "../include/workflow.hpp"
#include "../../../shared/cpp/common/include/errors.hpp"
#include "../../../shared/cpp/common/include/util.hpp"

using json = nlohmann::json;

WorkflowCatalogue default_workflows() {
    return {
        {"complete_photo_workflow", {
            {"photo", "organize_photos", "Organize the session photos"},
            {"marketing", "suggest_content", "Suggest content for the new photos"},
            {"social_media", "schedule_posts", "Schedule posts for the suggested content"}
        }},
        {"marketing_campaign_launch", {
            {"marketing", "create_campaign", "Create the campaign"},
            {"social_media", "prepare_campaign_posts", "Prepare the campaign posts"},
            {"crm", "segment_audience", "Segment the campaign audience"}
        }},
        {"client_onboarding", {
            {"crm", "register_client", "Register the client"},
            {"photo", "create_client_folder", "Create the client photo folder"},
            {"calendar", "schedule_consultation", "Schedule the first consultation"}
        }}
    };
}

WorkflowCatalogue parse_workflow_catalogue(const json& j) {
    if (!j.is_object()) throw InvalidArgument("workflows must be an object of step lists");
    WorkflowCatalogue out;
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_array() || it.value().empty()) {
            throw InvalidArgument("workflow " + it.key() + " needs a non-empty step list");
        }
        std::vector<WorkflowStep> steps;
        for (const auto& s : it.value()) {
            WorkflowStep step;
            try {
                step.capability = s.at("capability").get<std::string>();
                step.action = s.at("action").get<std::string>();
                step.description = s.value("description", step.action);
                step.input = s.value("input", json::object());
            } catch (const json::exception& e) {
                throw InvalidArgument("workflow " + it.key() + ": " + e.what());
            }
            if (step.capability.empty() || step.action.empty()) {
                throw InvalidArgument("workflow " + it.key() + ": capability and action must not be empty");
            }
            if (!step.input.is_object()) throw InvalidArgument("workflow " + it.key() + ": step input must be an object");
            steps.push_back(std::move(step));
        }
        out[it.key()] = std::move(steps);
    }
    return out;
}

std::string to_string(WorkflowStatus s) {
    switch (s) {
        case WorkflowStatus::Pending: return "pending";
        case WorkflowStatus::Running: return "running";
        case WorkflowStatus::Completed: return "completed";
        case WorkflowStatus::Failed: return "failed";
    }
    return "unknown";
}

json step_input(const WorkflowStep& step, const json& data, const std::string& workflow_id) {
    json in = data.is_object() ? data : json::object();
    for (auto it = step.input.begin(); it != step.input.end(); ++it) in[it.key()] = it.value();
    in["type"] = step.action;
    in["workflow_id"] = workflow_id;
    return in;
}

WorkflowStatus workflow_status(const std::vector<Task>& steps) {
    bool all_pending = true, all_terminal = true, all_completed = true, any_failed = false;
    for (const auto& t : steps) {
        if (t.status != TaskStatus::Pending) all_pending = false;
        if (!is_terminal(t.status)) all_terminal = false;
        if (t.status != TaskStatus::Completed) all_completed = false;
        if (t.status == TaskStatus::Failed) any_failed = true;
    }
    if (all_completed) return WorkflowStatus::Completed;
    if (all_terminal && any_failed) return WorkflowStatus::Failed;
    if (all_pending) return WorkflowStatus::Pending;
    return WorkflowStatus::Running;
}

json workflow_to_json(const Workflow& w, const std::vector<Task>& steps) {
    json tasks = json::array();
    for (const auto& t : steps) tasks.push_back(task_to_json(t));
    return json{
        {"workflow_id", w.workflow_id},
        {"type", w.type},
        {"status", to_string(workflow_status(steps))},
        {"submitted_at_ms", to_unix_ms(w.submitted_at)},
        {"tasks", tasks}
    };
}
