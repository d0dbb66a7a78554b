#pragma once

/**
 * @file task_executor.h
 * @brief Executes one task definition against the operation registry
 */

#include "workflow_engine/operation_registry.h"
#include "workflow_engine/workflow_context.h"
#include "workflow_engine/workflow_state.h"
#include "workflow_engine/workflow_types.h"

#include <memory>
#include <string>
#include <vector>

namespace archflow::workflow_engine {

/**
 * @brief Carries an operation output forward to later tasks.
 *
 * After a successful task, output field `parameter` is stored in the context
 * under `contextKey`; a later task that does not set `parameter` itself
 * receives the stored value.
 */
struct ContextInjectionRule {
    std::string parameter;   ///< e.g. "sheetId"
    std::string contextKey;  ///< e.g. "lastSheetId"
};

/**
 * @brief Builds rules from parameter names: "sheetId" maps to "lastSheetId".
 */
std::vector<ContextInjectionRule> makeContextInjectionRules(const std::vector<std::string>& parameters);

/**
 * @brief The scheduleId, sheetId and viewId rules.
 */
std::vector<ContextInjectionRule> defaultContextInjectionRules();

/**
 * @class TaskExecutor
 * @brief Turns one TaskDefinition into a TaskResult.
 *
 * Never throws for task-level problems: unknown operations, failed results
 * and exceptions raised during dispatch all come back as failed results.
 * The executor does not modify the workflow state; the caller folds the
 * result in with WorkflowState::recordTaskOutcome().
 */
class TaskExecutor {
public:
    static constexpr const char* kCustomTaskDecision = "Custom task - marked for future implementation";
    static constexpr const char* kDefaultCustomReason = "No specific logic defined yet";

    explicit TaskExecutor(std::shared_ptr<const OperationRegistry> registry,
                          std::vector<ContextInjectionRule> injectionRules = defaultContextInjectionRules(),
                          std::shared_ptr<service_management::IServiceManager> services = nullptr);

    TaskResult execute(const TaskDefinition& task, const WorkflowState& state) const;

    /**
     * @brief Task parameters plus injected context values the task does not set.
     */
    nlohmann::json prepareParameters(const TaskDefinition& task, const WorkflowContext& context) const;

    const std::vector<ContextInjectionRule>& injectionRules() const { return injectionRules_; }

private:
    TaskResult executeCustom(const TaskDefinition& task) const;
    TaskResult interpretResult(const TaskDefinition& task, const OperationResult& result) const;

    std::shared_ptr<const OperationRegistry> registry_;
    std::vector<ContextInjectionRule> injectionRules_;
    std::shared_ptr<service_management::IServiceManager> services_;
};

} // namespace archflow::workflow_engine
