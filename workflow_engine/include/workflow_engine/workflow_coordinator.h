#pragma once

/**
 * @file workflow_coordinator.h
 * @brief Workflow lifecycle: creation, phase iteration, status, pause, resume
 */

#include "common_utils/utilities/boost_config.h"

#include "workflow_engine/operation_registry.h"
#include "workflow_engine/phase_executor.h"
#include "workflow_engine/task_executor.h"
#include "workflow_engine/workflow_engine_config.h"
#include "workflow_engine/workflow_registry.h"
#include "workflow_engine/workflow_template_store.h"
#include "workflow_engine/workflow_types.h"

#include <boost/thread/future.hpp>
#include <boost/uuid/random_generator.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace archflow::workflow_engine {

/**
 * @brief A workflow started in the background
 */
struct AsyncWorkflowHandle {
    std::string workflowId;
    boost::future<WorkflowRunSummary> result;
};

/**
 * @class WorkflowCoordinator
 * @brief Owns workflows from creation to terminal status.
 *
 * Execution is sequential within a workflow: phases in declared order,
 * tasks in declared order, on the thread that drives the run. Distinct
 * workflows may be driven from different threads.
 *
 * Must be owned by a std::shared_ptr when executeWorkflowAsync() is used.
 *
 * @code
 * auto coordinator = WorkflowCoordinator::create(config, operations, services);
 * WorkflowRequest request;
 * request.workflowType = "CD_Set";
 * auto summary = coordinator->createAndRun(request);
 * @endcode
 */
class WorkflowCoordinator : public std::enable_shared_from_this<WorkflowCoordinator> {
public:
    static constexpr const char* kWorkflowTypeRequired =
        "workflowType is required (e.g., 'DD_Package', 'CD_Set')";

    WorkflowCoordinator(std::shared_ptr<const OperationRegistry> operations,
                        std::shared_ptr<const WorkflowTemplateStore> templates,
                        std::shared_ptr<WorkflowRegistry> workflows,
                        std::vector<ContextInjectionRule> injectionRules = defaultContextInjectionRules(),
                        std::shared_ptr<service_management::IServiceManager> services = nullptr);

    /**
     * @brief Builds a coordinator with its own template store and registry.
     */
    static std::shared_ptr<WorkflowCoordinator> create(
        const WorkflowEngineConfig& config,
        std::shared_ptr<const OperationRegistry> operations,
        std::shared_ptr<service_management::IServiceManager> services = nullptr);

    // === Lifecycle ===

    /**
     * @brief Resolves the template and registers a new Running workflow.
     *
     * Nothing is registered when this throws.
     * @return The generated workflow id
     * @throw common_utils::ValidationException for an empty workflowType
     * @throw TemplateNotFoundException, TemplateParseException
     */
    std::string createWorkflow(const WorkflowRequest& request);

    /**
     * @brief Drives a workflow from its cursor until it completes or pauses.
     * @throw WorkflowNotFoundException for an unknown id
     * @throw common_utils::InvalidStateException if completed or driven elsewhere
     */
    WorkflowRunSummary runWorkflow(const std::string& workflowId);

    /**
     * @brief createWorkflow() followed by runWorkflow().
     */
    WorkflowRunSummary createAndRun(const WorkflowRequest& request);

    /**
     * @brief Creates the workflow now and drives it on a background thread.
     *
     * Creation errors are thrown here; execution errors surface from the future.
     */
    AsyncWorkflowHandle executeWorkflowAsync(const WorkflowRequest& request);

    // === Control surface ===

    /**
     * @throw WorkflowNotFoundException for an unknown id
     */
    WorkflowSnapshot getStatus(const std::string& workflowId) const;

    std::vector<WorkflowListEntry> listWorkflows() const;

    /**
     * @brief Requests a pause, observed after the task in flight.
     * @throw WorkflowNotFoundException, common_utils::InvalidStateException
     */
    void pause(const std::string& workflowId);

    /**
     * @brief Clears a pause without driving the workflow.
     * @throw WorkflowNotFoundException, common_utils::InvalidStateException
     */
    void resume(const std::string& workflowId);

    /**
     * @brief Clears a pause and drives the remaining tasks to completion.
     * @return The run summary, or nullopt if another caller is still driving
     *         the workflow (it continues there)
     */
    std::optional<WorkflowRunSummary> resumeAndRun(const std::string& workflowId);

    std::vector<TemplateSummary> listTemplates() const;

    std::shared_ptr<const OperationRegistry> operations() const { return m_operations; }
    std::shared_ptr<WorkflowRegistry> workflows() const { return m_workflows; }

private:
    WorkflowRunSummary drive(WorkflowState& state);
    void runPhases(WorkflowState& state);
    std::string generateWorkflowId();

    std::shared_ptr<const OperationRegistry> m_operations;
    std::shared_ptr<const WorkflowTemplateStore> m_templates;
    std::shared_ptr<WorkflowRegistry> m_workflows;
    std::shared_ptr<const TaskExecutor> m_taskExecutor;
    PhaseExecutor m_phaseExecutor;

    std::mutex m_idMutex;
    boost::uuids::random_generator m_idGenerator;
};

} // namespace archflow::workflow_engine
