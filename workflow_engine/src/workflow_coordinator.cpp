#include "workflow_engine/workflow_coordinator.h"
#include "workflow_engine/workflow_exceptions.h"
#include "common_utils/utilities/exceptions.h"
#include "common_utils/utilities/logging_utils.h"

#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace archflow::workflow_engine {

namespace {

/**
 * @brief Releases the drive claim if the drive exits before finishRun() does.
 */
class DriveGuard {
public:
    explicit DriveGuard(WorkflowState& state) : m_state(state) {}
    ~DriveGuard() {
        if (m_active) {
            m_state.endDrive();
        }
    }

    void dismiss() { m_active = false; }

    DriveGuard(const DriveGuard&) = delete;
    DriveGuard& operator=(const DriveGuard&) = delete;

private:
    WorkflowState& m_state;
    bool m_active = true;
};

} // namespace

WorkflowCoordinator::WorkflowCoordinator(std::shared_ptr<const OperationRegistry> operations,
                                         std::shared_ptr<const WorkflowTemplateStore> templates,
                                         std::shared_ptr<WorkflowRegistry> workflows,
                                         std::vector<ContextInjectionRule> injectionRules,
                                         std::shared_ptr<service_management::IServiceManager> services)
    : m_operations(std::move(operations)),
      m_templates(std::move(templates)),
      m_workflows(std::move(workflows)),
      m_taskExecutor(std::make_shared<TaskExecutor>(m_operations, std::move(injectionRules), std::move(services))),
      m_phaseExecutor(m_taskExecutor) {
    if (!m_templates || !m_workflows) {
        throw common_utils::ValidationException("Template store and workflow registry must be non-null.");
    }
}

std::shared_ptr<WorkflowCoordinator> WorkflowCoordinator::create(
    const WorkflowEngineConfig& config,
    std::shared_ptr<const OperationRegistry> operations,
    std::shared_ptr<service_management::IServiceManager> services) {
    auto templates = std::make_shared<WorkflowTemplateStore>(config.templateDirectory, config.cacheTemplates);
    auto workflows = std::make_shared<WorkflowRegistry>(config.maxRetainedWorkflows);
    return std::make_shared<WorkflowCoordinator>(std::move(operations), std::move(templates), std::move(workflows),
                                                 makeContextInjectionRules(config.contextInjectionKeys),
                                                 std::move(services));
}

// === Lifecycle ===

std::string WorkflowCoordinator::createWorkflow(const WorkflowRequest& request) {
    if (request.workflowType.empty()) {
        throw common_utils::ValidationException(kWorkflowTypeRequired);
    }

    // resolve before registering: a failed start leaves nothing behind
    auto workflowTemplate = m_templates->load(request.workflowType, request.projectType);

    std::string workflowId = generateWorkflowId();
    auto state = std::make_shared<WorkflowState>(workflowId, request, std::move(workflowTemplate));
    m_workflows->add(state);

    ARCHFLOW_LOG_INFO(WorkflowCoordinator, "Created workflow {} ({}, {}, {})",
                      workflowId, request.workflowType, request.projectType, request.buildingCode);
    return workflowId;
}

WorkflowRunSummary WorkflowCoordinator::runWorkflow(const std::string& workflowId) {
    auto state = m_workflows->get(workflowId);
    state->beginDrive();
    return drive(*state);
}

WorkflowRunSummary WorkflowCoordinator::createAndRun(const WorkflowRequest& request) {
    return runWorkflow(createWorkflow(request));
}

AsyncWorkflowHandle WorkflowCoordinator::executeWorkflowAsync(const WorkflowRequest& request) {
    AsyncWorkflowHandle handle;
    handle.workflowId = createWorkflow(request);

    auto self = shared_from_this();
    std::string workflowId = handle.workflowId;
    handle.result = boost::async(boost::launch::async, [self, workflowId]() {
        return self->runWorkflow(workflowId);
    });
    return handle;
}

// === Control surface ===

WorkflowSnapshot WorkflowCoordinator::getStatus(const std::string& workflowId) const {
    return m_workflows->get(workflowId)->snapshot();
}

std::vector<WorkflowListEntry> WorkflowCoordinator::listWorkflows() const {
    std::vector<WorkflowListEntry> entries;
    for (const auto& state : m_workflows->list()) {
        entries.push_back(state->listEntry());
    }
    return entries;
}

void WorkflowCoordinator::pause(const std::string& workflowId) {
    m_workflows->get(workflowId)->pause();
    ARCHFLOW_LOG_INFO(WorkflowCoordinator, "Workflow paused: {}", workflowId);
}

void WorkflowCoordinator::resume(const std::string& workflowId) {
    m_workflows->get(workflowId)->resume();
    ARCHFLOW_LOG_INFO(WorkflowCoordinator, "Workflow resumed: {}", workflowId);
}

std::optional<WorkflowRunSummary> WorkflowCoordinator::resumeAndRun(const std::string& workflowId) {
    auto state = m_workflows->get(workflowId);
    state->resume();
    ARCHFLOW_LOG_INFO(WorkflowCoordinator, "Workflow resumed: {}", workflowId);

    if (!state->tryBeginDrive()) {
        ARCHFLOW_LOG_DEBUG(WorkflowCoordinator, "Workflow {} is still being driven; not starting a second run",
                           workflowId);
        return std::nullopt;
    }
    return drive(*state);
}

std::vector<TemplateSummary> WorkflowCoordinator::listTemplates() const {
    return m_templates->listTemplates();
}

// === Private ===

WorkflowRunSummary WorkflowCoordinator::drive(WorkflowState& state) {
    RunOutcome outcome;
    {
        DriveGuard guard(state);
        do {
            runPhases(state);
            outcome = state.finishRun();
            if (!outcome.driveReleased) {
                ARCHFLOW_LOG_DEBUG(WorkflowCoordinator, "Workflow {} resumed while stopping; continuing",
                                   state.id());
            }
        } while (!outcome.driveReleased);
        guard.dismiss();
    }

    const WorkflowRunSummary& summary = outcome.summary;
    ARCHFLOW_LOG_INFO(WorkflowCoordinator, "Workflow {} {}: {} completed, {} failed, {} decisions",
                      state.id(), toString(summary.status), summary.tasksCompleted, summary.tasksFailed,
                      summary.decisionsMade);

    m_workflows->enforceRetention();
    return outcome.summary;
}

void WorkflowCoordinator::runPhases(WorkflowState& state) {
    auto workflowTemplate = state.workflowTemplate();
    auto [phaseIndex, taskIndex] = state.cursor();

    for (; phaseIndex < workflowTemplate->phases.size(); ++phaseIndex) {
        if (state.isPaused()) {
            break;
        }

        const PhaseDefinition& phase = workflowTemplate->phases[phaseIndex];
        ARCHFLOW_LOG_INFO(WorkflowCoordinator, "[{}] Executing phase: {}", state.workflowType(), phase.name);

        bool phaseFinished = m_phaseExecutor.execute(phase, phaseIndex, taskIndex, state);
        taskIndex = 0;

        if (!phaseFinished || state.isPaused()) {
            ARCHFLOW_LOG_INFO(WorkflowCoordinator, "Workflow paused at phase: {}", phase.name);
            break;
        }
    }
}

std::string WorkflowCoordinator::generateWorkflowId() {
    std::lock_guard<std::mutex> lock(m_idMutex);
    return boost::uuids::to_string(m_idGenerator());
}

} // namespace archflow::workflow_engine
