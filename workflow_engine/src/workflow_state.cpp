#include "workflow_engine/workflow_state.h"
#include "common_utils/utilities/exceptions.h"

namespace archflow::workflow_engine {

WorkflowState::WorkflowState(std::string workflowId,
                             WorkflowRequest request,
                             std::shared_ptr<const WorkflowTemplate> workflowTemplate)
    : m_workflowId(std::move(workflowId)),
      m_request(std::move(request)),
      m_template(std::move(workflowTemplate)),
      m_startTime(std::chrono::system_clock::now()),
      m_startClock(std::chrono::steady_clock::now()) {
    if (m_workflowId.empty()) {
        throw common_utils::ValidationException("Workflow ID cannot be empty.");
    }
    if (!m_template) {
        throw common_utils::ValidationException("Workflow template cannot be null.");
    }

    m_phaseSummaries.resize(m_template->phases.size());

    m_context.set("projectType", m_request.projectType);
    m_context.set("buildingCode", m_request.buildingCode);
    m_context.set("customParameters", m_request.customParameters);
}

WorkflowStatus WorkflowState::status() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_status;
}

bool WorkflowState::isPaused() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_isPaused;
}

bool WorkflowState::isDriving() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_isDriving;
}

std::string WorkflowState::currentPhase() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_currentPhase;
}

std::pair<size_t, size_t> WorkflowState::cursor() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return {m_phaseIndex, m_taskIndex};
}

double WorkflowState::runtimeSeconds() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return elapsedSeconds();
}

double WorkflowState::elapsedSeconds() const {
    if (m_finalRuntime) {
        return *m_finalRuntime;
    }
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - m_startClock;
    return elapsed.count();
}

// === Control ===

void WorkflowState::pause() {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    if (isTerminal(m_status)) {
        throw common_utils::InvalidStateException("Workflow has already completed: " + m_workflowId);
    }
    m_isPaused = true;
    m_status = WorkflowStatus::Paused;
}

void WorkflowState::resume() {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    if (isTerminal(m_status)) {
        throw common_utils::InvalidStateException("Workflow has already completed: " + m_workflowId);
    }
    m_isPaused = false;
    m_status = WorkflowStatus::Running;
}

void WorkflowState::beginDrive() {
    if (!tryBeginDrive()) {
        throw common_utils::InvalidStateException("Workflow is already being executed: " + m_workflowId);
    }
}

bool WorkflowState::tryBeginDrive() {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    if (isTerminal(m_status)) {
        throw common_utils::InvalidStateException("Workflow has already completed: " + m_workflowId);
    }
    if (m_isDriving) {
        return false;
    }
    m_isDriving = true;
    return true;
}

void WorkflowState::endDrive() {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_isDriving = false;
}

// === Execution bookkeeping ===

void WorkflowState::enterPhase(size_t phaseIndex, const std::string& phaseName) {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_currentPhase = phaseName;
    if (phaseIndex < m_phaseSummaries.size() && !m_phaseSummaries[phaseIndex]) {
        PhaseSummary summary;
        summary.name = phaseName;
        m_phaseSummaries[phaseIndex] = summary;
    }
}

void WorkflowState::recordTaskOutcome(size_t phaseIndex, size_t taskIndex,
                                      const TaskDefinition& task, const TaskResult& result) {
    std::lock_guard<std::mutex> lock(m_stateMutex);

    PhaseSummary* phaseSummary = nullptr;
    if (phaseIndex < m_phaseSummaries.size() && m_phaseSummaries[phaseIndex]) {
        phaseSummary = &*m_phaseSummaries[phaseIndex];
    }

    if (result.success) {
        m_completedTasks.push_back(taskLabel(task));
        if (result.decision) {
            m_decisions.push_back(*result.decision);
            if (phaseSummary) {
                phaseSummary->decisionsCount++;
            }
        }
        m_context.merge(result.contextUpdates);
        if (phaseSummary) {
            phaseSummary->tasksCompleted++;
        }
    } else {
        m_failedTasks.push_back(taskLabel(task) + ": " + result.error.value_or("Unknown error"));
        if (phaseSummary) {
            phaseSummary->tasksFailed++;
        }
    }

    m_phaseIndex = phaseIndex;
    m_taskIndex = taskIndex + 1;
}

void WorkflowState::completePhase(size_t phaseIndex) {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    if (m_phaseIndex <= phaseIndex) {
        m_phaseIndex = phaseIndex + 1;
        m_taskIndex = 0;
    }
}

RunOutcome WorkflowState::finishRun() {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    RunOutcome outcome;
    if (!m_isPaused && allPhasesDone()) {
        m_status = m_failedTasks.empty() ? WorkflowStatus::CompletedSuccessfully
                                         : WorkflowStatus::CompletedWithErrors;
        m_finalRuntime = elapsedSeconds();
    }

    if (m_isPaused || isTerminal(m_status)) {
        m_isDriving = false;
        outcome.driveReleased = true;
    }
    outcome.summary = summaryLocked();
    return outcome;
}

bool WorkflowState::allPhasesDone() const {
    return m_phaseIndex >= m_template->phases.size();
}

// === Views ===

WorkflowSnapshot WorkflowState::snapshot() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);

    WorkflowSnapshot snapshot;
    snapshot.workflowId = m_workflowId;
    snapshot.workflowType = m_request.workflowType;
    snapshot.projectType = m_request.projectType;
    snapshot.buildingCode = m_request.buildingCode;
    snapshot.status = m_status;
    snapshot.currentPhase = m_currentPhase;
    snapshot.completedTasks = m_completedTasks;
    snapshot.failedTasks = m_failedTasks;
    snapshot.decisions = m_decisions;
    snapshot.context = m_context.toJson();
    snapshot.isPaused = m_isPaused;
    snapshot.startTime = m_startTime;
    snapshot.runtimeSeconds = elapsedSeconds();
    snapshot.phaseIndex = m_phaseIndex;
    snapshot.taskIndex = m_taskIndex;
    return snapshot;
}

WorkflowListEntry WorkflowState::listEntry() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);

    WorkflowListEntry entry;
    entry.workflowId = m_workflowId;
    entry.workflowType = m_request.workflowType;
    entry.status = m_status;
    entry.currentPhase = m_currentPhase;
    entry.tasksCompleted = static_cast<int>(m_completedTasks.size());
    entry.runtimeSeconds = elapsedSeconds();
    return entry;
}

WorkflowRunSummary WorkflowState::summaryLocked() const {
    WorkflowRunSummary summary;
    summary.workflowId = m_workflowId;
    summary.workflowType = m_request.workflowType;
    summary.status = m_status;
    summary.tasksCompleted = static_cast<int>(m_completedTasks.size());
    summary.tasksFailed = static_cast<int>(m_failedTasks.size());
    summary.decisionsMade = static_cast<int>(m_decisions.size());
    summary.executionTimeSeconds = elapsedSeconds();
    for (const auto& phase : m_phaseSummaries) {
        if (phase) {
            summary.phases.push_back(*phase);
        }
    }
    return summary;
}

std::string WorkflowState::taskLabel(const TaskDefinition& task) {
    return task.description.empty() ? task.id : task.description;
}

} // namespace archflow::workflow_engine
