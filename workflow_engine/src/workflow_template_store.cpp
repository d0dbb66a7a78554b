#include "workflow_engine/workflow_template_store.h"
#include "workflow_engine/workflow_exceptions.h"
#include "common_utils/utilities/exceptions.h"
#include "common_utils/utilities/logging_utils.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace archflow::workflow_engine {

namespace {

std::string optionalString(const nlohmann::json& object, const char* field,
                           const std::string& defaultValue = "") {
    auto it = object.find(field);
    if (it == object.end() || it->is_null()) {
        return defaultValue;
    }
    if (!it->is_string()) {
        throw TemplateParseException(std::string("field '") + field + "' must be a string");
    }
    return it->get<std::string>();
}

TaskDefinition parseTask(const nlohmann::json& taskJson, const std::string& phaseName) {
    if (!taskJson.is_object()) {
        throw TemplateParseException("tasks of phase '" + phaseName + "' must be objects");
    }

    TaskDefinition task;
    task.id = optionalString(taskJson, "id", "unknown");
    task.description = optionalString(taskJson, "description", task.id);
    task.method = optionalString(taskJson, "method");

    auto params = taskJson.find("parameters");
    if (params != taskJson.end() && !params->is_null()) {
        if (!params->is_object()) {
            throw TemplateParseException("parameters of task '" + task.id + "' must be an object");
        }
        task.parameters = *params;
    }

    auto decision = taskJson.find("autonomous_decision");
    if (decision != taskJson.end() && !decision->is_null()) {
        if (!decision->is_string()) {
            throw TemplateParseException("autonomous_decision of task '" + task.id + "' must be a string");
        }
        task.autonomousDecision = decision->get<std::string>();
    }
    return task;
}

} // namespace

WorkflowTemplateStore::WorkflowTemplateStore(std::string templateDirectory, bool cacheEnabled)
    : m_templateDirectory(std::move(templateDirectory)),
      m_cacheEnabled(cacheEnabled) {
}

std::shared_ptr<const WorkflowTemplate> WorkflowTemplateStore::load(const std::string& workflowType,
                                                                    const std::string& projectType) const {
    if (workflowType.empty()) {
        throw common_utils::ValidationException("workflowType is required");
    }

    std::vector<std::string> keys;
    if (!projectType.empty()) {
        keys.push_back(workflowType + "_" + projectType);
    }
    keys.push_back(workflowType);

    for (const auto& key : keys) {
        // Basic security check to prevent directory traversal
        if (key.find("..") != std::string::npos ||
            key.find('/') != std::string::npos ||
            key.find('\\') != std::string::npos) {
            throw common_utils::ValidationException("Invalid template name: " + key);
        }

        if (auto found = findByKey(key)) {
            ARCHFLOW_LOG_DEBUG(TemplateStore, "Resolved template '{}'", key);
            return found;
        }
    }

    ARCHFLOW_LOG_WARN(TemplateStore, "Workflow template not found: {}", workflowType);
    throw TemplateNotFoundException(workflowType);
}

void WorkflowTemplateStore::addTemplate(const std::string& key, WorkflowTemplate workflowTemplate) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_memoryTemplates[key] = std::make_shared<const WorkflowTemplate>(std::move(workflowTemplate));
    m_cache.erase(key);
}

std::vector<TemplateSummary> WorkflowTemplateStore::listTemplates() const {
    std::map<std::string, TemplateSummary> byKey;

    std::error_code ec;
    std::filesystem::directory_iterator it(m_templateDirectory, ec);
    if (ec) {
        ARCHFLOW_LOG_DEBUG(TemplateStore, "Template directory not readable: {} ({})",
                           m_templateDirectory, ec.message());
    } else {
        for (const auto& entry : it) {
            if (!entry.is_regular_file() || entry.path().extension() != ".json") {
                continue;
            }
            std::string key = entry.path().stem().string();
            try {
                auto parsed = loadTemplateFromFile(key);
                if (parsed) {
                    byKey[key] = summarize(key, *parsed);
                }
            } catch (const common_utils::ArchflowBaseException& e) {
                ARCHFLOW_LOG_WARN(TemplateStore, "Skipping template '{}': {}", entry.path().string(), e.what());
            }
        }
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [key, workflowTemplate] : m_memoryTemplates) {
            byKey[key] = summarize(key, *workflowTemplate);
        }
    }

    std::vector<TemplateSummary> result;
    result.reserve(byKey.size());
    for (auto& [key, summary] : byKey) {
        result.push_back(std::move(summary));
    }
    return result;
}

void WorkflowTemplateStore::clearCache() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cache.clear();
}

WorkflowTemplate WorkflowTemplateStore::parseTemplate(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw TemplateParseException("template must be a JSON object");
    }

    WorkflowTemplate workflowTemplate;
    workflowTemplate.workflowType = optionalString(document, "workflowType");
    workflowTemplate.name = optionalString(document, "name");
    workflowTemplate.description = optionalString(document, "description");
    workflowTemplate.estimatedTime = optionalString(document, "estimatedTime");

    auto projectTypes = document.find("projectTypes");
    if (projectTypes != document.end() && !projectTypes->is_null()) {
        if (!projectTypes->is_array()) {
            throw TemplateParseException("projectTypes must be an array");
        }
        for (const auto& projectType : *projectTypes) {
            if (!projectType.is_string()) {
                throw TemplateParseException("projectTypes must contain strings");
            }
            workflowTemplate.projectTypes.push_back(projectType.get<std::string>());
        }
    }

    auto phases = document.find("phases");
    if (phases == document.end() || !phases->is_array()) {
        throw TemplateParseException("'phases' array is required");
    }

    for (size_t i = 0; i < phases->size(); ++i) {
        const auto& phaseJson = (*phases)[i];
        if (!phaseJson.is_object()) {
            throw TemplateParseException("phases must be objects");
        }

        PhaseDefinition phase;
        phase.name = optionalString(phaseJson, "name", "Phase " + std::to_string(i + 1));

        auto tasks = phaseJson.find("tasks");
        if (tasks != phaseJson.end() && !tasks->is_null()) {
            if (!tasks->is_array()) {
                throw TemplateParseException("tasks of phase '" + phase.name + "' must be an array");
            }
            for (const auto& taskJson : *tasks) {
                phase.tasks.push_back(parseTask(taskJson, phase.name));
            }
        }
        workflowTemplate.phases.push_back(std::move(phase));
    }

    return workflowTemplate;
}

WorkflowTemplate WorkflowTemplateStore::parseTemplate(const std::string& content) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw TemplateParseException(e.what());
    }
    return parseTemplate(document);
}

// === Private helpers ===

std::shared_ptr<const WorkflowTemplate> WorkflowTemplateStore::findByKey(const std::string& key) const {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto memoryIt = m_memoryTemplates.find(key);
        if (memoryIt != m_memoryTemplates.end()) {
            return memoryIt->second;
        }
        if (m_cacheEnabled) {
            auto cacheIt = m_cache.find(key);
            if (cacheIt != m_cache.end()) {
                return cacheIt->second;
            }
        }
    }

    auto parsed = loadTemplateFromFile(key);
    if (!parsed) {
        return nullptr;
    }

    auto workflowTemplate = std::make_shared<const WorkflowTemplate>(std::move(*parsed));
    if (m_cacheEnabled) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cache[key] = workflowTemplate;
    }
    ARCHFLOW_LOG_INFO(TemplateStore, "Loaded template '{}' from {}", key, m_templateDirectory);
    return workflowTemplate;
}

std::optional<WorkflowTemplate> WorkflowTemplateStore::loadTemplateFromFile(const std::string& key) const {
    std::filesystem::path fullPath = std::filesystem::path(m_templateDirectory) / (key + ".json");
    std::error_code ec;
    if (!std::filesystem::is_regular_file(fullPath, ec)) {
        return std::nullopt;
    }

    std::ifstream templateFile(fullPath);
    if (!templateFile.is_open()) {
        throw common_utils::IOException("Could not open template file: " + fullPath.string());
    }

    std::stringstream buffer;
    buffer << templateFile.rdbuf();
    try {
        return parseTemplate(buffer.str());
    } catch (const TemplateParseException& e) {
        ARCHFLOW_LOG_ERROR(TemplateStore, "{} ({})", e.what(), fullPath.string());
        throw;
    }
}

TemplateSummary WorkflowTemplateStore::summarize(const std::string& key, const WorkflowTemplate& workflowTemplate) {
    TemplateSummary summary;
    summary.workflowType = workflowTemplate.workflowType.empty() ? key : workflowTemplate.workflowType;
    summary.name = workflowTemplate.name;
    summary.description = workflowTemplate.description;
    summary.projectTypes = workflowTemplate.projectTypes;
    summary.phaseCount = workflowTemplate.phases.size();
    summary.estimatedTime = workflowTemplate.estimatedTime;
    return summary;
}

} // namespace archflow::workflow_engine
