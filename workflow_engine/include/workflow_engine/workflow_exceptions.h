#pragma once

/**
 * @file workflow_exceptions.h
 * @brief Workflow engine exceptions
 *
 * Only fatal-to-start and control lookup failures are thrown; per-task
 * failures are values (see TaskResult).
 */

#include "common_utils/utilities/exceptions.h"

#include <string>

namespace archflow::workflow_engine {

/**
 * @brief No template for either the specific or the generic key
 */
class TemplateNotFoundException : public common_utils::ResourceNotFoundException {
public:
    explicit TemplateNotFoundException(const std::string& workflowType)
        : common_utils::ResourceNotFoundException("Workflow template not found: " + workflowType),
          workflowType_(workflowType) {}

    const std::string& workflowType() const noexcept { return workflowType_; }

private:
    std::string workflowType_;
};

/**
 * @brief Unknown workflow id on status/pause/resume/run
 */
class WorkflowNotFoundException : public common_utils::ResourceNotFoundException {
public:
    explicit WorkflowNotFoundException(const std::string& workflowId)
        : common_utils::ResourceNotFoundException("Workflow not found"),
          workflowId_(workflowId) {}

    const std::string& workflowId() const noexcept { return workflowId_; }

private:
    std::string workflowId_;
};

/**
 * @brief Template document exists but is structurally invalid
 */
class TemplateParseException : public common_utils::ValidationException {
public:
    explicit TemplateParseException(const std::string& message)
        : common_utils::ValidationException("Failed to parse workflow template: " + message) {}
};

} // namespace archflow::workflow_engine
