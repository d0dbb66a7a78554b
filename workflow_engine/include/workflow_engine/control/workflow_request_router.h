#pragma once

#include "workflow_engine/workflow_coordinator.h"

#include <functional>
#include <map>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace archflow::workflow_engine::control {

/**
 * @class WorkflowRequestRouter
 * @brief Dispatches JSON control requests to the WorkflowCoordinator.
 *
 * Every response is a JSON object with a `success` flag; failures carry
 * `error` and `errorCode`. No exception escapes handle() or route().
 *
 * Methods: executeWorkflow, getWorkflowStatus, listWorkflowTemplates,
 * pauseWorkflow, resumeWorkflow, listOperations.
 */
class WorkflowRequestRouter {
public:
    explicit WorkflowRequestRouter(std::shared_ptr<WorkflowCoordinator> coordinator);

    /**
     * @brief Invokes a method (case-insensitive) with a parameter object.
     */
    nlohmann::json handle(const std::string& method, const nlohmann::json& params);

    /**
     * @brief Parses `{"method": ..., "params": {...}}` and returns the response text.
     */
    std::string route(const std::string& body);

    /**
     * @brief Builds a failure response.
     */
    static nlohmann::json errorResponse(const std::string& message, const std::string& errorCode);

private:
    using Handler = std::function<nlohmann::json(const nlohmann::json&)>;

    nlohmann::json handleExecuteWorkflow(const nlohmann::json& params);
    nlohmann::json handleGetWorkflowStatus(const nlohmann::json& params);
    nlohmann::json handleListWorkflowTemplates(const nlohmann::json& params);
    nlohmann::json handlePauseWorkflow(const nlohmann::json& params);
    nlohmann::json handleResumeWorkflow(const nlohmann::json& params);
    nlohmann::json handleListOperations(const nlohmann::json& params);

    std::shared_ptr<WorkflowCoordinator> coordinator_;
    std::map<std::string, Handler> handlers_;
};

} // namespace archflow::workflow_engine::control
