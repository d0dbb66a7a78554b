#pragma once

/**
 * @file operation_registry.h
 * @brief Name-keyed catalog of document operations
 */

#include "workflow_engine/service_management/i_service_manager.h"

#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

namespace archflow::workflow_engine {

/**
 * @brief Structured result of an operation
 *
 * `data` holds the named output fields (for example `sheetId`).
 */
struct OperationResult {
    bool success = false;
    std::string error;
    nlohmann::json data = nlohmann::json::object();

    static OperationResult ok(nlohmann::json data = nlohmann::json::object()) {
        OperationResult result;
        result.success = true;
        result.data = std::move(data);
        return result;
    }

    static OperationResult failure(std::string error) {
        OperationResult result;
        result.success = false;
        result.error = std::move(error);
        return result;
    }
};

/**
 * @brief What an operation receives besides its parameters
 */
class OperationContext {
public:
    OperationContext(std::string workflowId,
                     std::shared_ptr<service_management::IServiceManager> services)
        : workflowId_(std::move(workflowId)), services_(std::move(services)) {}

    const std::string& workflowId() const { return workflowId_; }

    /**
     * @brief Looks up a host service, nullptr if none is registered
     */
    template<typename ServiceInterface>
    std::shared_ptr<ServiceInterface> getService() const {
        if (!services_) {
            return nullptr;
        }
        return services_->getService<ServiceInterface>();
    }

private:
    std::string workflowId_;
    std::shared_ptr<service_management::IServiceManager> services_;
};

using OperationHandler = std::function<OperationResult(const OperationContext&, const nlohmann::json&)>;

/**
 * @brief How an alias applies its preset parameters
 */
enum class PresetMode {
    Default,    ///< fills in parameters the caller left out
    Forced      ///< always wins over the caller's value
};

/**
 * @brief Catalog listing entry
 */
struct OperationInfo {
    std::string name;            ///< name as registered
    std::string description;
    std::optional<std::string> aliasOf;
};

/**
 * @class OperationRegistry
 * @brief Registration-time dispatch table from operation name to handler.
 *
 * Names are matched case-insensitively. Aliases resolve to a registered
 * operation and may carry preset parameters. Default presets never override
 * parameters supplied by the caller; forced presets are what give an alias
 * such as `tagAllRooms` its meaning and always apply.
 *
 * Populated once at startup; lookups are safe from any thread.
 */
class OperationRegistry {
public:
    OperationRegistry() = default;

    OperationRegistry(const OperationRegistry&) = delete;
    OperationRegistry& operator=(const OperationRegistry&) = delete;

    /**
     * @brief Registers an operation, replacing any previous one of that name
     * @throw common_utils::ValidationException for an empty name or handler
     */
    void registerOperation(const std::string& name, OperationHandler handler,
                           const std::string& description = "");

    /**
     * @brief Registers an alias of an already registered operation
     * @throw common_utils::ValidationException if the target is unknown
     */
    void registerAlias(const std::string& alias, const std::string& target,
                       nlohmann::json presetParameters = nlohmann::json::object(),
                       const std::string& description = "",
                       PresetMode mode = PresetMode::Default);

    bool contains(const std::string& name) const;

    /**
     * @brief Invokes an operation by name.
     *
     * Never throws for per-call problems: an unknown name or anything
     * thrown by the handler is returned as a failed result.
     */
    OperationResult invoke(const std::string& name, const OperationContext& context,
                           const nlohmann::json& parameters) const;

    /**
     * @brief All operations and aliases, sorted by name
     */
    std::vector<OperationInfo> listOperations() const;

    size_t size() const;

    /**
     * @brief Error text reported for a name that is not registered
     */
    static std::string notImplementedMessage(const std::string& name);

private:
    struct Entry {
        std::string displayName;
        std::string description;
        OperationHandler handler;
        std::optional<std::string> aliasOf;
        nlohmann::json presetParameters = nlohmann::json::object();
        nlohmann::json forcedParameters = nlohmann::json::object();
    };

    static std::string normalize(const std::string& name);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace archflow::workflow_engine
