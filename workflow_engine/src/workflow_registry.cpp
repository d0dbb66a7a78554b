#include "workflow_engine/workflow_registry.h"
#include "workflow_engine/workflow_exceptions.h"
#include "common_utils/utilities/exceptions.h"
#include "common_utils/utilities/logging_utils.h"

namespace archflow::workflow_engine {

WorkflowRegistry::WorkflowRegistry(size_t maxRetained)
    : maxRetained_(maxRetained) {
}

void WorkflowRegistry::add(std::shared_ptr<WorkflowState> state) {
    if (!state) {
        throw common_utils::ValidationException("Cannot register a null workflow state.");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const std::string& id = state->id();
    if (workflows_.count(id) > 0) {
        throw common_utils::ValidationException("Workflow id already registered: " + id);
    }
    workflows_.emplace(id, std::move(state));
    creationOrder_.push_back(id);
    ARCHFLOW_LOG_DEBUG(WorkflowRegistry, "Registered workflow {} ({} held)", id, workflows_.size());

    enforceRetentionLocked();
}

std::shared_ptr<WorkflowState> WorkflowRegistry::find(const std::string& workflowId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = workflows_.find(workflowId);
    return it == workflows_.end() ? nullptr : it->second;
}

std::shared_ptr<WorkflowState> WorkflowRegistry::get(const std::string& workflowId) const {
    auto state = find(workflowId);
    if (!state) {
        throw WorkflowNotFoundException(workflowId);
    }
    return state;
}

bool WorkflowRegistry::contains(const std::string& workflowId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workflows_.count(workflowId) > 0;
}

std::vector<std::shared_ptr<WorkflowState>> WorkflowRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::shared_ptr<WorkflowState>> result;
    result.reserve(creationOrder_.size());
    for (const auto& id : creationOrder_) {
        auto it = workflows_.find(id);
        if (it != workflows_.end()) {
            result.push_back(it->second);
        }
    }
    return result;
}

size_t WorkflowRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workflows_.size();
}

size_t WorkflowRegistry::enforceRetention() {
    std::lock_guard<std::mutex> lock(mutex_);
    return enforceRetentionLocked();
}

size_t WorkflowRegistry::enforceRetentionLocked() {
    if (maxRetained_ == 0 || workflows_.size() <= maxRetained_) {
        return 0;
    }

    size_t evicted = 0;
    for (auto it = creationOrder_.begin();
         it != creationOrder_.end() && workflows_.size() > maxRetained_;) {
        auto stateIt = workflows_.find(*it);
        if (stateIt != workflows_.end() && isTerminal(stateIt->second->status())) {
            ARCHFLOW_LOG_DEBUG(WorkflowRegistry, "Evicting completed workflow {}", *it);
            workflows_.erase(stateIt);
            it = creationOrder_.erase(it);
            ++evicted;
        } else {
            ++it;
        }
    }
    return evicted;
}

} // namespace archflow::workflow_engine
