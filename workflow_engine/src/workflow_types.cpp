#include "workflow_engine/workflow_types.h"

namespace archflow::workflow_engine {

std::string toString(WorkflowStatus status) {
    switch (status) {
        case WorkflowStatus::Running:
            return "Running";
        case WorkflowStatus::Paused:
            return "Paused";
        case WorkflowStatus::CompletedSuccessfully:
            return "Completed successfully";
        case WorkflowStatus::CompletedWithErrors:
            return "Completed with errors";
    }
    return "Unknown";
}

} // namespace archflow::workflow_engine
