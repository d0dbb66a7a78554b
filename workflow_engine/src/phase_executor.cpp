#include "workflow_engine/phase_executor.h"
#include "common_utils/utilities/exceptions.h"
#include "common_utils/utilities/logging_utils.h"

namespace archflow::workflow_engine {

PhaseExecutor::PhaseExecutor(std::shared_ptr<const TaskExecutor> taskExecutor)
    : taskExecutor_(std::move(taskExecutor)) {
    if (!taskExecutor_) {
        throw common_utils::ValidationException("TaskExecutor cannot be null.");
    }
}

bool PhaseExecutor::execute(const PhaseDefinition& phase, size_t phaseIndex, size_t firstTask,
                            WorkflowState& state) const {
    state.enterPhase(phaseIndex, phase.name);

    for (size_t taskIndex = firstTask; taskIndex < phase.tasks.size(); ++taskIndex) {
        const TaskDefinition& task = phase.tasks[taskIndex];
        const std::string label = WorkflowState::taskLabel(task);

        ARCHFLOW_LOG_INFO(PhaseExecutor, "[{}] Executing: {}", state.workflowType(), label);
        TaskResult result = taskExecutor_->execute(task, state);
        state.recordTaskOutcome(phaseIndex, taskIndex, task, result);

        if (result.success) {
            if (result.decision) {
                ARCHFLOW_LOG_INFO(PhaseExecutor, "[DECISION] {} - {}",
                                  result.decision->decision, result.decision->reason);
            }
        } else {
            ARCHFLOW_LOG_WARN(PhaseExecutor, "Task failed: {} - {}", label, result.error.value_or("Unknown error"));
        }

        if (state.isPaused()) {
            if (taskIndex + 1 < phase.tasks.size()) {
                ARCHFLOW_LOG_INFO(PhaseExecutor, "[{}] Paused after task '{}' in phase '{}'",
                                  state.workflowType(), task.id, phase.name);
                return false;
            }
            break;
        }
    }

    state.completePhase(phaseIndex);
    return true;
}

} // namespace archflow::workflow_engine
