#include "workflow_engine/task_executor.h"
#include "common_utils/utilities/exceptions.h"
#include "common_utils/utilities/logging_utils.h"

#include <cctype>
#include <chrono>

namespace archflow::workflow_engine {

std::vector<ContextInjectionRule> makeContextInjectionRules(const std::vector<std::string>& parameters) {
    std::vector<ContextInjectionRule> rules;
    for (const auto& parameter : parameters) {
        if (parameter.empty()) {
            continue;
        }
        std::string contextKey = "last" + parameter;
        contextKey[4] = static_cast<char>(std::toupper(static_cast<unsigned char>(contextKey[4])));
        rules.push_back({parameter, contextKey});
    }
    return rules;
}

std::vector<ContextInjectionRule> defaultContextInjectionRules() {
    return makeContextInjectionRules({"scheduleId", "sheetId", "viewId"});
}

TaskExecutor::TaskExecutor(std::shared_ptr<const OperationRegistry> registry,
                           std::vector<ContextInjectionRule> injectionRules,
                           std::shared_ptr<service_management::IServiceManager> services)
    : registry_(std::move(registry)),
      injectionRules_(std::move(injectionRules)),
      services_(std::move(services)) {
    if (!registry_) {
        throw common_utils::ValidationException("OperationRegistry cannot be null.");
    }
}

TaskResult TaskExecutor::execute(const TaskDefinition& task, const WorkflowState& state) const {
    if (task.isCustom()) {
        return executeCustom(task);
    }

    try {
        nlohmann::json parameters = prepareParameters(task, state.context());
        OperationContext context(state.id(), services_);
        OperationResult result = registry_->invoke(task.method, context, parameters);
        return interpretResult(task, result);
    } catch (const std::exception& e) {
        ARCHFLOW_LOG_ERROR(TaskExecutor, "Error in task '{}': {}", task.id, e.what());
        TaskResult failed;
        failed.success = false;
        failed.error = e.what();
        return failed;
    } catch (...) {
        ARCHFLOW_LOG_ERROR(TaskExecutor, "Unknown error in task '{}'", task.id);
        TaskResult failed;
        failed.success = false;
        failed.error = "Unknown error";
        return failed;
    }
}

nlohmann::json TaskExecutor::prepareParameters(const TaskDefinition& task, const WorkflowContext& context) const {
    nlohmann::json parameters = task.parameters.is_object() ? task.parameters : nlohmann::json::object();

    for (const auto& rule : injectionRules_) {
        if (parameters.contains(rule.parameter)) {
            continue;
        }
        if (auto value = context.find(rule.contextKey)) {
            parameters[rule.parameter] = *value;
            ARCHFLOW_LOG_DEBUG(TaskExecutor, "Injected {} from {} into task '{}'",
                               rule.parameter, rule.contextKey, task.id);
        }
    }
    return parameters;
}

TaskResult TaskExecutor::executeCustom(const TaskDefinition& task) const {
    TaskResult result;
    result.success = true;
    result.decision = WorkflowDecision{
        task.id,
        kCustomTaskDecision,
        task.autonomousDecision.value_or(kDefaultCustomReason),
        std::chrono::system_clock::now()
    };
    return result;
}

TaskResult TaskExecutor::interpretResult(const TaskDefinition& task, const OperationResult& operationResult) const {
    TaskResult result;
    result.success = operationResult.success;

    if (!operationResult.success) {
        result.error = operationResult.error.empty() ? std::string("Unknown error") : operationResult.error;
        return result;
    }

    if (task.autonomousDecision && !task.autonomousDecision->empty()) {
        result.decision = WorkflowDecision{
            task.id,
            "Executed " + task.method + " successfully",
            *task.autonomousDecision,
            std::chrono::system_clock::now()
        };
    }

    if (operationResult.data.is_object()) {
        for (const auto& rule : injectionRules_) {
            auto it = operationResult.data.find(rule.parameter);
            if (it != operationResult.data.end() && !it->is_null()) {
                result.contextUpdates[rule.contextKey] = *it;
            }
        }
    }
    return result;
}

} // namespace archflow::workflow_engine
