#pragma once

/**
 * @file workflow_registry.h
 * @brief Table of live workflows keyed by id
 */

#include "workflow_engine/workflow_state.h"

#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace archflow::workflow_engine {

/**
 * @class WorkflowRegistry
 * @brief Mutex-guarded map of WorkflowState, owned by the service instance.
 *
 * Retention: once more than `maxRetained` workflows are held, the oldest
 * completed ones are evicted. Running and paused workflows are never evicted.
 * A limit of 0 disables eviction.
 */
class WorkflowRegistry {
public:
    explicit WorkflowRegistry(size_t maxRetained = 100);

    WorkflowRegistry(const WorkflowRegistry&) = delete;
    WorkflowRegistry& operator=(const WorkflowRegistry&) = delete;

    /**
     * @throw common_utils::ValidationException on a null state or duplicate id
     */
    void add(std::shared_ptr<WorkflowState> state);

    /**
     * @return The state, or nullptr for an unknown id
     */
    std::shared_ptr<WorkflowState> find(const std::string& workflowId) const;

    /**
     * @throw WorkflowNotFoundException for an unknown id
     */
    std::shared_ptr<WorkflowState> get(const std::string& workflowId) const;

    bool contains(const std::string& workflowId) const;

    /**
     * @brief All workflows in creation order
     */
    std::vector<std::shared_ptr<WorkflowState>> list() const;

    size_t size() const;

    size_t maxRetained() const { return maxRetained_; }

    /**
     * @brief Applies the retention limit
     * @return Number of evicted workflows
     */
    size_t enforceRetention();

private:
    size_t enforceRetentionLocked();

    const size_t maxRetained_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<WorkflowState>> workflows_;
    std::deque<std::string> creationOrder_;
};

} // namespace archflow::workflow_engine
