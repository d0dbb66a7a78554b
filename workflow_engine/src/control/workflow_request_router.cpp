#include "workflow_engine/control/workflow_request_router.h"
#include "workflow_engine/workflow_exceptions.h"
#include "workflow_engine/workflow_serialization.h"
#include "common_utils/utilities/exceptions.h"
#include "common_utils/utilities/logging_utils.h"
#include "common_utils/utilities/string_utils.h"

namespace archflow::workflow_engine::control {

using common_utils::StringUtils;

namespace {

std::string stringParam(const nlohmann::json& params, const char* key, const std::string& defaultValue = "") {
    auto it = params.find(key);
    if (it == params.end() || it->is_null()) {
        return defaultValue;
    }
    if (!it->is_string()) {
        throw common_utils::ValidationException(std::string(key) + " must be a string");
    }
    return it->get<std::string>();
}

std::string requiredWorkflowId(const nlohmann::json& params) {
    std::string workflowId = stringParam(params, "workflowId");
    if (workflowId.empty()) {
        throw common_utils::ValidationException("workflowId is required");
    }
    return workflowId;
}

} // namespace

WorkflowRequestRouter::WorkflowRequestRouter(std::shared_ptr<WorkflowCoordinator> coordinator)
    : coordinator_(std::move(coordinator)) {
    if (!coordinator_) {
        throw common_utils::ValidationException("WorkflowCoordinator cannot be null.");
    }

    handlers_["executeworkflow"] = [this](const nlohmann::json& p) { return handleExecuteWorkflow(p); };
    handlers_["getworkflowstatus"] = [this](const nlohmann::json& p) { return handleGetWorkflowStatus(p); };
    handlers_["listworkflowtemplates"] = [this](const nlohmann::json& p) { return handleListWorkflowTemplates(p); };
    handlers_["pauseworkflow"] = [this](const nlohmann::json& p) { return handlePauseWorkflow(p); };
    handlers_["resumeworkflow"] = [this](const nlohmann::json& p) { return handleResumeWorkflow(p); };
    handlers_["listoperations"] = [this](const nlohmann::json& p) { return handleListOperations(p); };

    ARCHFLOW_LOG_DEBUG(RequestRouter, "Router initialized with {} methods.", handlers_.size());
}

nlohmann::json WorkflowRequestRouter::handle(const std::string& method, const nlohmann::json& params) {
    auto it = handlers_.find(StringUtils::toLower(StringUtils::trim(method)));
    if (it == handlers_.end()) {
        ARCHFLOW_LOG_WARN(RequestRouter, "No handler found for method: {}", method);
        return errorResponse("Unknown method: " + method, "UnknownMethod");
    }

    const nlohmann::json& effectiveParams = params.is_object() ? params : nlohmann::json::object();
    try {
        return it->second(effectiveParams);
    } catch (const WorkflowNotFoundException& e) {
        return errorResponse(e.what(), "NotFound");
    } catch (const TemplateNotFoundException& e) {
        ARCHFLOW_LOG_WARN(RequestRouter, "{}", e.what());
        return errorResponse(e.what(), "TemplateNotFound");
    } catch (const TemplateParseException& e) {
        ARCHFLOW_LOG_ERROR(RequestRouter, "{}", e.what());
        return errorResponse(e.what(), "TemplateParseError");
    } catch (const common_utils::ValidationException& e) {
        return errorResponse(e.what(), "InvalidArgument");
    } catch (const common_utils::InvalidStateException& e) {
        return errorResponse(e.what(), "InvalidState");
    } catch (const common_utils::ArchflowBaseException& e) {
        ARCHFLOW_LOG_ERROR(RequestRouter, "Error in {}: {}", method, e.what());
        return errorResponse(e.what(), "Error");
    } catch (const std::exception& e) {
        ARCHFLOW_LOG_ERROR(RequestRouter, "Exception in {}: {}", method, e.what());
        return errorResponse(std::string("Internal error: ") + e.what(), "InternalError");
    }
}

std::string WorkflowRequestRouter::route(const std::string& body) {
    nlohmann::json request;
    try {
        request = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        ARCHFLOW_LOG_WARN(RequestRouter, "JSON parse error: {}", e.what());
        return errorResponse("Invalid JSON format", "InvalidJson").dump();
    }

    if (!request.is_object() || !request.contains("method") || !request["method"].is_string()) {
        return errorResponse("Request must be an object with a string 'method'", "InvalidRequest").dump();
    }

    nlohmann::json params = request.value("params", nlohmann::json::object());
    return handle(request["method"].get<std::string>(), params).dump();
}

nlohmann::json WorkflowRequestRouter::errorResponse(const std::string& message, const std::string& errorCode) {
    return nlohmann::json{
        {"success", false},
        {"error", message},
        {"errorCode", errorCode}
    };
}

// === Handlers ===

nlohmann::json WorkflowRequestRouter::handleExecuteWorkflow(const nlohmann::json& params) {
    WorkflowRequest request;
    request.workflowType = stringParam(params, "workflowType");
    request.projectType = stringParam(params, "projectType", request.projectType);
    request.buildingCode = stringParam(params, "buildingCode", request.buildingCode);

    auto custom = params.find("parameters");
    if (custom != params.end() && custom->is_object()) {
        request.customParameters = *custom;
    }

    if (request.workflowType.empty()) {
        return errorResponse(WorkflowCoordinator::kWorkflowTypeRequired, "InvalidArgument");
    }

    ARCHFLOW_LOG_INFO(RequestRouter, "Starting autonomous workflow: {} for {}",
                      request.workflowType, request.projectType);

    WorkflowRunSummary summary = coordinator_->createAndRun(request);

    nlohmann::json response = summary;
    response["success"] = true;
    return response;
}

nlohmann::json WorkflowRequestRouter::handleGetWorkflowStatus(const nlohmann::json& params) {
    std::string workflowId = stringParam(params, "workflowId");

    if (workflowId.empty()) {
        return nlohmann::json{
            {"success", true},
            {"activeWorkflows", coordinator_->listWorkflows()}
        };
    }

    nlohmann::json response = coordinator_->getStatus(workflowId);
    response["success"] = true;
    return response;
}

nlohmann::json WorkflowRequestRouter::handleListWorkflowTemplates(const nlohmann::json& /*params*/) {
    auto templates = coordinator_->listTemplates();
    return nlohmann::json{
        {"success", true},
        {"templates", templates},
        {"count", templates.size()}
    };
}

nlohmann::json WorkflowRequestRouter::handlePauseWorkflow(const nlohmann::json& params) {
    std::string workflowId = requiredWorkflowId(params);
    coordinator_->pause(workflowId);
    return nlohmann::json{
        {"success", true},
        {"message", "Workflow paused"},
        {"workflowId", workflowId}
    };
}

nlohmann::json WorkflowRequestRouter::handleResumeWorkflow(const nlohmann::json& params) {
    std::string workflowId = requiredWorkflowId(params);

    bool continueRun = true;
    auto continueIt = params.find("continue");
    if (continueIt != params.end() && !continueIt->is_null()) {
        if (!continueIt->is_boolean()) {
            throw common_utils::ValidationException("continue must be a boolean");
        }
        continueRun = continueIt->get<bool>();
    }

    nlohmann::json response{
        {"success", true},
        {"message", "Workflow resumed"},
        {"workflowId", workflowId}
    };

    if (!continueRun) {
        coordinator_->resume(workflowId);
        return response;
    }

    auto summary = coordinator_->resumeAndRun(workflowId);
    if (summary) {
        nlohmann::json run = *summary;
        response["status"] = run["status"];
        response["tasksCompleted"] = run["tasksCompleted"];
        response["tasksFailed"] = run["tasksFailed"];
        response["decisionsMade"] = run["decisionsMade"];
        response["executionTime"] = run["executionTime"];
        response["summary"] = run["summary"];
    }
    return response;
}

nlohmann::json WorkflowRequestRouter::handleListOperations(const nlohmann::json& /*params*/) {
    auto operations = coordinator_->operations()->listOperations();
    return nlohmann::json{
        {"success", true},
        {"operations", operations},
        {"count", operations.size()}
    };
}

} // namespace archflow::workflow_engine::control
