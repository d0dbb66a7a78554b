#include "workflow_engine/workflow_serialization.h"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <ctime>

namespace archflow::workflow_engine {

std::string formatTimestamp(std::chrono::system_clock::time_point timePoint) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(timePoint);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}Z", fmt::gmtime(seconds));
}

void to_json(nlohmann::json& j, const WorkflowDecision& decision) {
    j = nlohmann::json{
        {"task", decision.task},
        {"decision", decision.decision},
        {"reason", decision.reason},
        {"timestamp", formatTimestamp(decision.timestamp)}
    };
}

void to_json(nlohmann::json& j, const TemplateSummary& summary) {
    j = nlohmann::json{
        {"workflowType", summary.workflowType},
        {"name", summary.name},
        {"description", summary.description},
        {"projectTypes", summary.projectTypes},
        {"phases", summary.phaseCount},
        {"estimatedTime", summary.estimatedTime}
    };
}

void to_json(nlohmann::json& j, const PhaseSummary& summary) {
    j = nlohmann::json{
        {"tasksCompleted", summary.tasksCompleted},
        {"tasksFailed", summary.tasksFailed},
        {"decisionsCount", summary.decisionsCount}
    };
}

nlohmann::json phaseSummariesToJson(const std::vector<PhaseSummary>& phases) {
    nlohmann::json result = nlohmann::json::object();
    for (const auto& phase : phases) {
        result[phase.name] = phase;
    }
    return result;
}

void to_json(nlohmann::json& j, const WorkflowRunSummary& summary) {
    j = nlohmann::json{
        {"workflowId", summary.workflowId},
        {"workflowType", summary.workflowType},
        {"status", toString(summary.status)},
        {"tasksCompleted", summary.tasksCompleted},
        {"tasksFailed", summary.tasksFailed},
        {"decisionsMade", summary.decisionsMade},
        {"executionTime", summary.executionTimeSeconds},
        {"summary", phaseSummariesToJson(summary.phases)}
    };
}

void to_json(nlohmann::json& j, const WorkflowSnapshot& snapshot) {
    j = nlohmann::json{
        {"workflowId", snapshot.workflowId},
        {"workflowType", snapshot.workflowType},
        {"projectType", snapshot.projectType},
        {"buildingCode", snapshot.buildingCode},
        {"status", toString(snapshot.status)},
        {"currentPhase", snapshot.currentPhase},
        {"tasksCompleted", snapshot.completedTasks},
        {"tasksFailed", snapshot.failedTasks},
        {"decisionsMade", snapshot.decisions},
        {"context", snapshot.context},
        {"startTime", formatTimestamp(snapshot.startTime)},
        {"runtime", snapshot.runtimeSeconds},
        {"isPaused", snapshot.isPaused}
    };
}

void to_json(nlohmann::json& j, const WorkflowListEntry& entry) {
    j = nlohmann::json{
        {"workflowId", entry.workflowId},
        {"workflowType", entry.workflowType},
        {"status", toString(entry.status)},
        {"currentPhase", entry.currentPhase},
        {"tasksCompleted", entry.tasksCompleted},
        {"runtime", entry.runtimeSeconds}
    };
}

void to_json(nlohmann::json& j, const OperationInfo& info) {
    j = nlohmann::json{
        {"name", info.name},
        {"description", info.description}
    };
    if (info.aliasOf) {
        j["aliasOf"] = *info.aliasOf;
    }
}

} // namespace archflow::workflow_engine
