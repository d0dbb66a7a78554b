#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace archflow {
namespace workflow_engine {

/**
 * @class WorkflowContext
 * @brief Thread-safe key-value store carrying values from earlier tasks to later ones.
 *
 * Values are JSON so that any operation output can be stored as-is and passed
 * on unchanged as a parameter. Writes are last-write-wins; there is no removal.
 */
class WorkflowContext {
public:
    WorkflowContext() = default;

    /**
     * @brief Sets a value for a given key. Overwrites if the key already exists.
     * @tparam T Any type convertible to nlohmann::json.
     */
    template<typename T>
    void set(const std::string& key, T value) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        data_[key] = nlohmann::json(std::move(value));
    }

    /**
     * @brief Gets the value for a given key converted to T.
     * @throw std::out_of_range if the key does not exist.
     * @throw nlohmann::json::type_error if the value is not convertible to T.
     */
    template<typename T>
    T get(const std::string& key) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = data_.find(key);
        if (it == data_.end()) {
            throw std::out_of_range("Key not found in WorkflowContext: " + key);
        }
        return it->second.get<T>();
    }

    /**
     * @brief Gets the raw value for a given key, if present.
     */
    std::optional<nlohmann::json> find(const std::string& key) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = data_.find(key);
        if (it == data_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /**
     * @brief Writes every member of a JSON object.
     */
    void merge(const nlohmann::json& values) {
        if (!values.is_object()) {
            return;
        }
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (const auto& item : values.items()) {
            data_[item.key()] = item.value();
        }
    }

    /**
     * @brief Copies the whole context into a JSON object.
     */
    nlohmann::json toJson() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        nlohmann::json result = nlohmann::json::object();
        for (const auto& [key, value] : data_) {
            result[key] = value;
        }
        return result;
    }

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, nlohmann::json> data_;
};

} // namespace workflow_engine
} // namespace archflow
