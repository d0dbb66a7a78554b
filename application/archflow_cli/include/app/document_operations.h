#pragma once

/**
 * @file document_operations.h
 * @brief Document operations of the command-line host
 */

#include "workflow_engine/operation_registry.h"

namespace archflow::application {

/**
 * @brief Registers the BuildingDocument operations and their aliases.
 *
 * Operations find the document through OperationContext::getService<BuildingDocument>().
 * Created element ids are returned as `sheetId`, `viewId` or `scheduleId`
 * so later tasks can pick them up from the workflow context.
 */
void registerDocumentOperations(workflow_engine::OperationRegistry& registry);

} // namespace archflow::application
