#pragma once

/**
 * @file workflow_serialization.h
 * @brief JSON representations of workflow engine types
 *
 * Field names follow the control surface responses (camelCase; phase
 * summaries keyed by phase name).
 */

#include "workflow_engine/operation_registry.h"
#include "workflow_engine/workflow_types.h"

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

namespace archflow::workflow_engine {

/**
 * @brief ISO-8601 UTC text, e.g. "2024-05-01T09:30:00Z"
 */
std::string formatTimestamp(std::chrono::system_clock::time_point timePoint);

void to_json(nlohmann::json& j, const WorkflowDecision& decision);
void to_json(nlohmann::json& j, const TemplateSummary& summary);
void to_json(nlohmann::json& j, const PhaseSummary& summary);
void to_json(nlohmann::json& j, const WorkflowRunSummary& summary);
void to_json(nlohmann::json& j, const WorkflowSnapshot& snapshot);
void to_json(nlohmann::json& j, const WorkflowListEntry& entry);
void to_json(nlohmann::json& j, const OperationInfo& info);

/**
 * @brief Phase summaries as an object keyed by phase name.
 */
nlohmann::json phaseSummariesToJson(const std::vector<PhaseSummary>& phases);

} // namespace archflow::workflow_engine
