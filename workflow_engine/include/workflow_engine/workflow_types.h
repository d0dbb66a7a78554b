#pragma once

/**
 * @file workflow_types.h
 * @brief Workflow engine value types
 */

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace archflow::workflow_engine {

/**
 * @brief Workflow status
 *
 * Forward-only apart from Running <-> Paused.
 */
enum class WorkflowStatus {
    Running,
    Paused,
    CompletedSuccessfully,
    CompletedWithErrors
};

/**
 * @brief Returns the display text of a status, e.g. "Completed with errors"
 */
std::string toString(WorkflowStatus status);

/**
 * @brief Whether the status is one of the two completed states
 */
inline bool isTerminal(WorkflowStatus status) {
    return status == WorkflowStatus::CompletedSuccessfully ||
           status == WorkflowStatus::CompletedWithErrors;
}

/**
 * @brief Audit record of an autonomous choice attributed to a task
 */
struct WorkflowDecision {
    std::string task;
    std::string decision;
    std::string reason;
    std::chrono::system_clock::time_point timestamp;
};

// ===================================================================
// Template model
// ===================================================================

/**
 * @brief One declarative task of a phase
 */
struct TaskDefinition {
    std::string id;
    std::string description;
    std::string method;                        ///< operation name, "custom" or empty
    nlohmann::json parameters = nlohmann::json::object();
    std::optional<std::string> autonomousDecision;

    /// Method is empty or "custom": the task is not dispatched.
    bool isCustom() const {
        return method.empty() || method == "custom";
    }
};

struct PhaseDefinition {
    std::string name;
    std::vector<TaskDefinition> tasks;
};

/**
 * @brief Immutable phase/task plan loaded from a template document
 */
struct WorkflowTemplate {
    std::string workflowType;
    std::string name;
    std::string description;
    std::vector<std::string> projectTypes;
    std::string estimatedTime;
    std::vector<PhaseDefinition> phases;

    size_t taskCount() const {
        size_t count = 0;
        for (const auto& phase : phases) {
            count += phase.tasks.size();
        }
        return count;
    }
};

/**
 * @brief Template listing entry
 */
struct TemplateSummary {
    std::string workflowType;
    std::string name;
    std::string description;
    std::vector<std::string> projectTypes;
    size_t phaseCount = 0;
    std::string estimatedTime;
};

// ===================================================================
// Execution results
// ===================================================================

/**
 * @brief Outcome of one task execution, folded into the workflow state
 */
struct TaskResult {
    bool success = false;
    std::optional<WorkflowDecision> decision;
    std::optional<std::string> error;
    nlohmann::json contextUpdates = nlohmann::json::object(); ///< written on success
};

/**
 * @brief Per-phase counters, accumulated across resumed runs
 */
struct PhaseSummary {
    std::string name;
    int tasksCompleted = 0;
    int tasksFailed = 0;
    int decisionsCount = 0;
};

/**
 * @brief Result of driving a workflow
 */
struct WorkflowRunSummary {
    std::string workflowId;
    std::string workflowType;
    WorkflowStatus status = WorkflowStatus::Running;
    int tasksCompleted = 0;
    int tasksFailed = 0;
    int decisionsMade = 0;
    double executionTimeSeconds = 0.0;
    std::vector<PhaseSummary> phases;
};

/**
 * @brief Point-in-time copy of a workflow state
 */
struct WorkflowSnapshot {
    std::string workflowId;
    std::string workflowType;
    std::string projectType;
    std::string buildingCode;
    WorkflowStatus status = WorkflowStatus::Running;
    std::string currentPhase;
    std::vector<std::string> completedTasks;
    std::vector<std::string> failedTasks;
    std::vector<WorkflowDecision> decisions;
    nlohmann::json context = nlohmann::json::object();
    bool isPaused = false;
    std::chrono::system_clock::time_point startTime;
    double runtimeSeconds = 0.0;
    size_t phaseIndex = 0;
    size_t taskIndex = 0;
};

/**
 * @brief Lightweight entry of the workflow listing
 */
struct WorkflowListEntry {
    std::string workflowId;
    std::string workflowType;
    WorkflowStatus status = WorkflowStatus::Running;
    std::string currentPhase;
    int tasksCompleted = 0;
    double runtimeSeconds = 0.0;
};

/**
 * @brief Workflow creation request
 */
struct WorkflowRequest {
    std::string workflowType;
    std::string projectType = "General";
    std::string buildingCode = "IBC_2021";
    nlohmann::json customParameters = nlohmann::json::object();
};

} // namespace archflow::workflow_engine
