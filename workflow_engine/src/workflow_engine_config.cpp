#include "workflow_engine/workflow_engine_config.h"
#include "common_utils/utilities/app_config_loader.h"
#include "common_utils/utilities/exceptions.h"
#include "common_utils/utilities/string_utils.h"

namespace archflow::workflow_engine {

void WorkflowEngineConfig::registerDefaults(common_utils::AppConfigLoader& loader) {
    WorkflowEngineConfig defaults;

    loader.setDefault("workflow.template_dir", defaults.templateDirectory);
    loader.setDefault("workflow.cache_templates", defaults.cacheTemplates ? "true" : "false");
    // 0 keeps every completed workflow
    loader.setDefault("workflow.max_retained_workflows", std::to_string(defaults.maxRetainedWorkflows));
    loader.setDefault("workflow.context_injection_keys",
                      common_utils::StringUtils::join(defaults.contextInjectionKeys, ","));

    loader.registerEnvironmentMapping("TEMPLATE_DIR", "workflow.template_dir");
    loader.registerEnvironmentMapping("CACHE_TEMPLATES", "workflow.cache_templates");
    loader.registerEnvironmentMapping("MAX_RETAINED_WORKFLOWS", "workflow.max_retained_workflows");
    loader.registerEnvironmentMapping("CONTEXT_INJECTION_KEYS", "workflow.context_injection_keys");
}

WorkflowEngineConfig WorkflowEngineConfig::fromConfig(const common_utils::AppConfigLoader& loader) {
    WorkflowEngineConfig config;

    config.templateDirectory = loader.getString("workflow.template_dir", config.templateDirectory);
    config.cacheTemplates = loader.getBool("workflow.cache_templates", config.cacheTemplates);

    int maxRetained = loader.getInt("workflow.max_retained_workflows",
                                    static_cast<int>(config.maxRetainedWorkflows));
    if (maxRetained < 0) {
        throw common_utils::ConfigurationException(
            "workflow.max_retained_workflows must not be negative: " + std::to_string(maxRetained));
    }
    config.maxRetainedWorkflows = static_cast<size_t>(maxRetained);

    if (loader.has("workflow.context_injection_keys")) {
        config.contextInjectionKeys = loader.getStringList("workflow.context_injection_keys");
    }

    return config;
}

} // namespace archflow::workflow_engine
