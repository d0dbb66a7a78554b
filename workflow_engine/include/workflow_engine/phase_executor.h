#pragma once

/**
 * @file phase_executor.h
 * @brief Runs the tasks of one phase in declared order
 */

#include "workflow_engine/task_executor.h"
#include "workflow_engine/workflow_state.h"
#include "workflow_engine/workflow_types.h"

#include <memory>

namespace archflow::workflow_engine {

/**
 * @class PhaseExecutor
 * @brief Iterates a phase's tasks through the TaskExecutor.
 *
 * Each outcome is recorded in the WorkflowState before the next task starts.
 * A pause is observed after every task.
 */
class PhaseExecutor {
public:
    explicit PhaseExecutor(std::shared_ptr<const TaskExecutor> taskExecutor);

    /**
     * @brief Executes tasks [firstTask, end) of a phase.
     * @return True if every task of the phase has been attempted,
     *         false if a pause stopped the phase early
     */
    bool execute(const PhaseDefinition& phase, size_t phaseIndex, size_t firstTask,
                 WorkflowState& state) const;

private:
    std::shared_ptr<const TaskExecutor> taskExecutor_;
};

} // namespace archflow::workflow_engine
