#pragma once

/**
 * @file workflow_state.h
 * @brief Mutable state of one workflow run
 */

#include "workflow_engine/workflow_context.h"
#include "workflow_engine/workflow_types.h"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace archflow::workflow_engine {

/**
 * @brief Result of WorkflowState::finishRun()
 */
struct RunOutcome {
    bool driveReleased = false;     ///< false: the caller still drives and must continue
    WorkflowRunSummary summary;
};

/**
 * @class WorkflowState
 * @brief State of a running or completed workflow.
 *
 * All mutation goes through methods that take the state mutex, so a
 * concurrent snapshot() never observes lists and counters out of step.
 * Classification fields and the template are immutable after construction.
 *
 * The execution cursor (phaseIndex, taskIndex) names the next task to
 * attempt; a resumed run starts there.
 */
class WorkflowState {
public:
    WorkflowState(std::string workflowId,
                  WorkflowRequest request,
                  std::shared_ptr<const WorkflowTemplate> workflowTemplate);

    WorkflowState(const WorkflowState&) = delete;
    WorkflowState& operator=(const WorkflowState&) = delete;

    const std::string& id() const { return m_workflowId; }
    const std::string& workflowType() const { return m_request.workflowType; }
    const std::string& projectType() const { return m_request.projectType; }
    const std::string& buildingCode() const { return m_request.buildingCode; }
    std::chrono::system_clock::time_point startTime() const { return m_startTime; }

    std::shared_ptr<const WorkflowTemplate> workflowTemplate() const { return m_template; }

    WorkflowContext& context() { return m_context; }
    const WorkflowContext& context() const { return m_context; }

    WorkflowStatus status() const;
    bool isPaused() const;
    bool isDriving() const;
    std::string currentPhase() const;
    std::pair<size_t, size_t> cursor() const;

    /**
     * @brief Time since creation, frozen once the workflow completes.
     */
    double runtimeSeconds() const;

    // === Control ===

    /**
     * @brief Requests a pause, observed at the next task boundary.
     * @throw common_utils::InvalidStateException if the workflow has completed
     */
    void pause();

    /**
     * @brief Clears a pause.
     * @throw common_utils::InvalidStateException if the workflow has completed
     */
    void resume();

    /**
     * @brief Claims the right to drive execution.
     * @throw common_utils::InvalidStateException if completed or already driven
     */
    void beginDrive();

    /**
     * @brief Like beginDrive(), but returns false if another caller drives.
     * @throw common_utils::InvalidStateException if completed
     */
    bool tryBeginDrive();

    void endDrive();

    // === Execution bookkeeping (driver only) ===

    void enterPhase(size_t phaseIndex, const std::string& phaseName);

    /**
     * @brief Folds one task outcome into lists, counters, decisions, context
     *        and advances the cursor past the task, as one step.
     */
    void recordTaskOutcome(size_t phaseIndex, size_t taskIndex,
                           const TaskDefinition& task, const TaskResult& result);

    /**
     * @brief Moves the cursor to the start of the next phase.
     */
    void completePhase(size_t phaseIndex);

    /**
     * @brief Ends a drive in one locked step.
     *
     * Sets the terminal status once all phases are done. A paused or
     * completed run releases the drive claim. A run that is neither (a
     * resume arrived after the driver observed the pause) keeps the claim,
     * since no other caller can take it over.
     */
    RunOutcome finishRun();

    // === Views ===

    WorkflowSnapshot snapshot() const;
    WorkflowListEntry listEntry() const;

    /**
     * @brief Display label of a task: its description, else its id.
     */
    static std::string taskLabel(const TaskDefinition& task);

private:
    bool allPhasesDone() const;
    double elapsedSeconds() const;
    WorkflowRunSummary summaryLocked() const;

    const std::string m_workflowId;
    const WorkflowRequest m_request;
    const std::shared_ptr<const WorkflowTemplate> m_template;
    const std::chrono::system_clock::time_point m_startTime;
    const std::chrono::steady_clock::time_point m_startClock;

    WorkflowContext m_context;

    mutable std::mutex m_stateMutex;
    WorkflowStatus m_status = WorkflowStatus::Running;
    bool m_isPaused = false;
    bool m_isDriving = false;
    std::string m_currentPhase;
    std::vector<std::string> m_completedTasks;
    std::vector<std::string> m_failedTasks;
    std::vector<WorkflowDecision> m_decisions;
    std::vector<std::optional<PhaseSummary>> m_phaseSummaries;
    size_t m_phaseIndex = 0;
    size_t m_taskIndex = 0;
    std::optional<double> m_finalRuntime;
};

} // namespace archflow::workflow_engine
