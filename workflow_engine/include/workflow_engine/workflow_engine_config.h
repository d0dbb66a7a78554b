#pragma once

/**
 * @file workflow_engine_config.h
 * @brief Engine settings read from AppConfigLoader
 */

#include <cstddef>
#include <string>
#include <vector>

namespace archflow::common_utils {
class AppConfigLoader;
}

namespace archflow::workflow_engine {

/**
 * @brief Engine configuration
 *
 * | key                                | default                    |
 * |------------------------------------|----------------------------|
 * | workflow.template_dir              | workflows                  |
 * | workflow.cache_templates           | true                       |
 * | workflow.max_retained_workflows    | 100 (0 = unlimited)        |
 * | workflow.context_injection_keys    | scheduleId,sheetId,viewId  |
 */
struct WorkflowEngineConfig {
    std::string templateDirectory = "workflows";
    bool cacheTemplates = true;
    size_t maxRetainedWorkflows = 100;
    std::vector<std::string> contextInjectionKeys = {"scheduleId", "sheetId", "viewId"};

    /**
     * @brief Registers defaults and ARCHFLOW_* environment mappings of the engine keys.
     */
    static void registerDefaults(common_utils::AppConfigLoader& loader);

    /**
     * @brief Reads the engine keys.
     * @throw common_utils::ConfigurationException for a negative retention limit
     */
    static WorkflowEngineConfig fromConfig(const common_utils::AppConfigLoader& loader);
};

} // namespace archflow::workflow_engine
