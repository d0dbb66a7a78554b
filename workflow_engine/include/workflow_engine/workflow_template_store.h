#pragma once

/**
 * @file workflow_template_store.h
 * @brief Resolves (workflowType, projectType) to a workflow template
 */

#include "workflow_engine/workflow_types.h"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace archflow::workflow_engine {

/**
 * @class WorkflowTemplateStore
 * @brief Loads declarative JSON templates from a directory.
 *
 * A template for workflow type `CD_Set` and project type `Residential` is
 * looked up as `CD_Set_Residential` first and `CD_Set` second; each key maps
 * to `<templateDirectory>/<key>.json` unless a template was added in memory
 * under that key.
 *
 * Only the document structure is validated. Parsed templates are immutable
 * and cached by key when caching is enabled.
 */
class WorkflowTemplateStore {
public:
    /**
     * @param templateDirectory Directory holding `*.json` templates
     * @param cacheEnabled Keep parsed templates in memory
     */
    explicit WorkflowTemplateStore(std::string templateDirectory, bool cacheEnabled = true);

    virtual ~WorkflowTemplateStore() = default;

    /**
     * @brief Resolves a template with fallback to the generic key.
     * @throw TemplateNotFoundException if neither key resolves
     * @throw TemplateParseException if the resolved document is malformed
     * @throw common_utils::ValidationException for names that escape the directory
     */
    virtual std::shared_ptr<const WorkflowTemplate> load(const std::string& workflowType,
                                                         const std::string& projectType) const;

    /**
     * @brief Adds a template under a key, taking precedence over files.
     */
    void addTemplate(const std::string& key, WorkflowTemplate workflowTemplate);

    /**
     * @brief Lists file and in-memory templates, sorted by key.
     *
     * Files that fail to parse are skipped with a warning.
     */
    std::vector<TemplateSummary> listTemplates() const;

    void clearCache();

    const std::string& templateDirectory() const { return m_templateDirectory; }

    /**
     * @brief Parses a template document.
     * @throw TemplateParseException on structural errors
     */
    static WorkflowTemplate parseTemplate(const nlohmann::json& document);

    /**
     * @brief Parses template text.
     * @throw TemplateParseException on invalid JSON or structural errors
     */
    static WorkflowTemplate parseTemplate(const std::string& content);

private:
    std::shared_ptr<const WorkflowTemplate> findByKey(const std::string& key) const;
    std::optional<WorkflowTemplate> loadTemplateFromFile(const std::string& key) const;

    static TemplateSummary summarize(const std::string& key, const WorkflowTemplate& workflowTemplate);

    std::string m_templateDirectory;
    bool m_cacheEnabled;

    mutable std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<const WorkflowTemplate>> m_memoryTemplates;
    mutable std::map<std::string, std::shared_ptr<const WorkflowTemplate>> m_cache;
};

} // namespace archflow::workflow_engine
