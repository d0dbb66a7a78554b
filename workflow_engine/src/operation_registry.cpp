#include "workflow_engine/operation_registry.h"
#include "common_utils/utilities/exceptions.h"
#include "common_utils/utilities/logging_utils.h"
#include "common_utils/utilities/string_utils.h"

#include <algorithm>
#include <mutex>

namespace archflow::workflow_engine {

using common_utils::StringUtils;

void OperationRegistry::registerOperation(const std::string& name, OperationHandler handler,
                                          const std::string& description) {
    std::string key = normalize(name);
    if (key.empty()) {
        throw common_utils::ValidationException("Operation name cannot be empty.");
    }
    if (!handler) {
        throw common_utils::ValidationException("Operation handler cannot be empty: " + name);
    }

    Entry entry;
    entry.displayName = StringUtils::trim(name);
    entry.description = description;
    entry.handler = std::move(handler);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (entries_.count(key) > 0) {
        ARCHFLOW_LOG_WARN(OperationRegistry, "Replacing operation '{}'", name);
    }
    entries_[key] = std::move(entry);
    ARCHFLOW_LOG_DEBUG(OperationRegistry, "Registered operation '{}'", name);
}

void OperationRegistry::registerAlias(const std::string& alias, const std::string& target,
                                      nlohmann::json presetParameters,
                                      const std::string& description,
                                      PresetMode mode) {
    std::string aliasKey = normalize(alias);
    std::string targetKey = normalize(target);
    if (aliasKey.empty()) {
        throw common_utils::ValidationException("Operation alias cannot be empty.");
    }
    if (!presetParameters.is_object()) {
        throw common_utils::ValidationException("Preset parameters of alias '" + alias + "' must be an object.");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto targetIt = entries_.find(targetKey);
    if (targetIt == entries_.end()) {
        throw common_utils::ValidationException("Cannot alias unknown operation '" + target + "'");
    }

    // an alias of an alias points at the underlying operation
    const Entry& targetEntry = targetIt->second;
    nlohmann::json presets = targetEntry.presetParameters;
    nlohmann::json forced = targetEntry.forcedParameters;
    if (mode == PresetMode::Forced) {
        forced.update(presetParameters);
    } else {
        presets.update(presetParameters);
    }

    Entry entry;
    entry.displayName = StringUtils::trim(alias);
    entry.description = description.empty() ? targetEntry.description : description;
    entry.handler = targetEntry.handler;
    entry.aliasOf = targetEntry.aliasOf ? *targetEntry.aliasOf : targetEntry.displayName;
    entry.presetParameters = std::move(presets);
    entry.forcedParameters = std::move(forced);

    entries_[aliasKey] = std::move(entry);
    ARCHFLOW_LOG_DEBUG(OperationRegistry, "Registered alias '{}' -> '{}'", alias, target);
}

bool OperationRegistry::contains(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.count(normalize(name)) > 0;
}

OperationResult OperationRegistry::invoke(const std::string& name, const OperationContext& context,
                                          const nlohmann::json& parameters) const {
    OperationHandler handler;
    nlohmann::json effectiveParameters = parameters.is_object() ? parameters : nlohmann::json::object();
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(normalize(name));
        if (it == entries_.end()) {
            return OperationResult::failure(notImplementedMessage(name));
        }
        handler = it->second.handler;
        for (const auto& preset : it->second.presetParameters.items()) {
            if (!effectiveParameters.contains(preset.key())) {
                effectiveParameters[preset.key()] = preset.value();
            }
        }
        for (const auto& forced : it->second.forcedParameters.items()) {
            effectiveParameters[forced.key()] = forced.value();
        }
    }

    ARCHFLOW_LOG_DEBUG(OperationRegistry, "Routing to method: {}", name);
    try {
        return handler(context, effectiveParameters);
    } catch (const std::exception& e) {
        ARCHFLOW_LOG_ERROR(OperationRegistry, "Operation '{}' raised: {}", name, e.what());
        return OperationResult::failure(e.what());
    } catch (...) {
        ARCHFLOW_LOG_ERROR(OperationRegistry, "Operation '{}' raised a non-standard exception", name);
        return OperationResult::failure("Unknown error");
    }
}

std::vector<OperationInfo> OperationRegistry::listOperations() const {
    std::vector<OperationInfo> operations;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        operations.reserve(entries_.size());
        for (const auto& [key, entry] : entries_) {
            operations.push_back({entry.displayName, entry.description, entry.aliasOf});
        }
    }

    std::sort(operations.begin(), operations.end(),
              [](const OperationInfo& a, const OperationInfo& b) {
                  return StringUtils::toLower(a.name) < StringUtils::toLower(b.name);
              });
    return operations;
}

size_t OperationRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

std::string OperationRegistry::notImplementedMessage(const std::string& name) {
    return "Method '" + name + "' not implemented in workflow routing";
}

std::string OperationRegistry::normalize(const std::string& name) {
    return StringUtils::toLower(StringUtils::trim(name));
}

} // namespace archflow::workflow_engine
