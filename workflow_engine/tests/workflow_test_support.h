#pragma once

/**
 * @file workflow_test_support.h
 * @brief Shared fixtures for workflow engine tests
 */

#include "workflow_engine/operation_registry.h"
#include "workflow_engine/workflow_coordinator.h"
#include "workflow_engine/workflow_registry.h"
#include "workflow_engine/workflow_template_store.h"

#include <gtest/gtest.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace archflow::workflow_engine::tests {

/**
 * @brief Records every dispatched call as (operation, parameters).
 */
class CallRecorder {
public:
    void record(const std::string& operation, const nlohmann::json& parameters) {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back({operation, parameters});
    }

    std::vector<std::pair<std::string, nlohmann::json>> calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<std::string, nlohmann::json>> calls_;
};

inline TaskDefinition makeTask(const std::string& id, const std::string& method,
                               nlohmann::json parameters = nlohmann::json::object()) {
    TaskDefinition task;
    task.id = id;
    task.description = id + " description";
    task.method = method;
    task.parameters = std::move(parameters);
    return task;
}

inline PhaseDefinition makePhase(const std::string& name, std::vector<TaskDefinition> tasks) {
    PhaseDefinition phase;
    phase.name = name;
    phase.tasks = std::move(tasks);
    return phase;
}

inline WorkflowTemplate makeTemplate(const std::string& workflowType, std::vector<PhaseDefinition> phases) {
    WorkflowTemplate workflowTemplate;
    workflowTemplate.workflowType = workflowType;
    workflowTemplate.name = workflowType;
    workflowTemplate.phases = std::move(phases);
    return workflowTemplate;
}

inline WorkflowRequest makeRequest(const std::string& workflowType) {
    WorkflowRequest request;
    request.workflowType = workflowType;
    return request;
}

/**
 * @brief Coordinator over an in-memory template store.
 *
 * Registered operations: `record` (records and succeeds), `getSheets`
 * (returns sheetId 7), `createSheet` (returns the next sheetId), `fail`
 * (always fails), `throwing` (throws) and `pauseHere` (requests a pause of
 * its own workflow, then succeeds).
 */
class CoordinatorTestBase : public ::testing::Test {
protected:
    void SetUp() override {
        operations_ = std::make_shared<OperationRegistry>();
        templates_ = std::make_shared<WorkflowTemplateStore>("archflow_missing_template_dir", true);
        workflows_ = std::make_shared<WorkflowRegistry>(maxRetained());

        operations_->registerOperation("record", [this](const OperationContext&, const nlohmann::json& p) {
            recorder_.record("record", p);
            return OperationResult::ok();
        });
        operations_->registerOperation("getSheets", [this](const OperationContext&, const nlohmann::json& p) {
            recorder_.record("getSheets", p);
            return OperationResult::ok({{"sheetId", 7}});
        });
        operations_->registerOperation("createSheet", [this](const OperationContext&, const nlohmann::json& p) {
            recorder_.record("createSheet", p);
            return OperationResult::ok({{"sheetId", 100 + static_cast<int>(recorder_.calls().size())}});
        });
        operations_->registerOperation("fail", [this](const OperationContext&, const nlohmann::json& p) {
            recorder_.record("fail", p);
            return OperationResult::failure("sheet number already in use");
        });
        operations_->registerOperation("throwing", [](const OperationContext&, const nlohmann::json&) -> OperationResult {
            throw std::runtime_error("document is read-only");
        });
        operations_->registerOperation("pauseHere", [this](const OperationContext& context, const nlohmann::json& p) {
            recorder_.record("pauseHere", p);
            coordinator_->pause(context.workflowId());
            return OperationResult::ok();
        });

        coordinator_ = std::make_shared<WorkflowCoordinator>(operations_, templates_, workflows_);
    }

    virtual size_t maxRetained() const { return 100; }

    std::vector<std::string> recordedOperations() const {
        std::vector<std::string> names;
        for (const auto& call : recorder_.calls()) {
            names.push_back(call.first);
        }
        return names;
    }

    CallRecorder recorder_;
    std::shared_ptr<OperationRegistry> operations_;
    std::shared_ptr<WorkflowTemplateStore> templates_;
    std::shared_ptr<WorkflowRegistry> workflows_;
    std::shared_ptr<WorkflowCoordinator> coordinator_;
};

} // namespace archflow::workflow_engine::tests
