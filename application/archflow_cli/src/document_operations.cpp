#include "app/document_operations.h"
#include "app/building_document.h"
#include "common_utils/utilities/exceptions.h"

#include <cerrno>
#include <cstdlib>
#include <string>

namespace archflow::application {

using workflow_engine::OperationContext;
using workflow_engine::OperationResult;
using workflow_engine::OperationRegistry;

namespace {

std::shared_ptr<BuildingDocument> activeDocument(const OperationContext& context) {
    auto document = context.getService<BuildingDocument>();
    if (!document) {
        throw common_utils::InvalidStateException("No active document");
    }
    return document;
}

std::string stringParam(const nlohmann::json& params, const char* key, const std::string& defaultValue = "") {
    auto it = params.find(key);
    if (it == params.end() || it->is_null()) {
        return defaultValue;
    }
    return it->is_string() ? it->get<std::string>() : it->dump();
}

// ids arrive as numbers, or as strings when carried over from the context
ElementId elementIdParam(const nlohmann::json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || it->is_null()) {
        throw common_utils::ValidationException(std::string(key) + " is required");
    }
    if (it->is_number_integer()) {
        return it->get<ElementId>();
    }
    if (it->is_string()) {
        const std::string text = it->get<std::string>();
        char* end = nullptr;
        errno = 0;
        ElementId id = std::strtoll(text.c_str(), &end, 10);
        if (!text.empty() && errno == 0 && end == text.c_str() + text.size()) {
            return id;
        }
    }
    throw common_utils::ValidationException(std::string(key) + " is not a valid element id: " + it->dump());
}

nlohmann::json toJson(const SheetElement& sheet) {
    return {{"sheetId", sheet.id}, {"sheetNumber", sheet.number}, {"sheetName", sheet.name},
            {"viewCount", sheet.placedViews.size()}};
}

nlohmann::json toJson(const ViewElement& view) {
    nlohmann::json j = {{"viewId", view.id}, {"viewName", view.name}, {"viewType", view.viewType},
                        {"levelName", view.levelName}};
    j["sheetId"] = view.sheetId ? nlohmann::json(*view.sheetId) : nlohmann::json(nullptr);
    return j;
}

nlohmann::json toJson(const ScheduleElement& schedule) {
    return {{"scheduleId", schedule.id}, {"scheduleName", schedule.name}, {"category", schedule.category},
            {"fields", schedule.fields}};
}

// === Sheets ===

OperationResult getSheets(const OperationContext& context, const nlohmann::json&) {
    auto sheets = activeDocument(context)->sheets();
    nlohmann::json list = nlohmann::json::array();
    for (const auto& sheet : sheets) {
        list.push_back(toJson(sheet));
    }
    nlohmann::json data = {{"sheets", list}, {"count", sheets.size()}};
    if (!sheets.empty()) {
        data["sheetId"] = sheets.back().id;
    }
    return OperationResult::ok(std::move(data));
}

OperationResult createSheet(const OperationContext& context, const nlohmann::json& params) {
    ElementId sheetId = activeDocument(context)->createSheet(stringParam(params, "sheetNumber"),
                                                             stringParam(params, "sheetName"));
    return OperationResult::ok({{"sheetId", sheetId}});
}

// === Views ===

OperationResult getViews(const OperationContext& context, const nlohmann::json& params) {
    std::string viewType = stringParam(params, "viewType");
    nlohmann::json list = nlohmann::json::array();
    for (const auto& view : activeDocument(context)->views()) {
        if (viewType.empty() || view.viewType == viewType) {
            list.push_back(toJson(view));
        }
    }
    return OperationResult::ok({{"views", list}, {"count", list.size()}});
}

OperationResult createView(const OperationContext& context, const nlohmann::json& params,
                           const std::string& viewType) {
    auto document = activeDocument(context);
    std::string levelName = stringParam(params, "levelName");
    if (levelName.empty()) {
        auto levels = document->levels();
        if (levels.empty()) {
            return OperationResult::failure("Document has no levels");
        }
        levelName = levels.front();
    }
    ElementId viewId = document->createView(viewType, stringParam(params, "viewName"), levelName);
    return OperationResult::ok({{"viewId", viewId}});
}

OperationResult placeViewOnSheet(const OperationContext& context, const nlohmann::json& params) {
    ElementId viewId = elementIdParam(params, "viewId");
    ElementId sheetId = elementIdParam(params, "sheetId");
    activeDocument(context)->placeViewOnSheet(viewId, sheetId);
    return OperationResult::ok({{"viewId", viewId}, {"sheetId", sheetId}});
}

// === Schedules ===

OperationResult getSchedules(const OperationContext& context, const nlohmann::json&) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& schedule : activeDocument(context)->schedules()) {
        list.push_back(toJson(schedule));
    }
    return OperationResult::ok({{"schedules", list}, {"count", list.size()}});
}

OperationResult createSchedule(const OperationContext& context, const nlohmann::json& params) {
    ElementId scheduleId = activeDocument(context)->createSchedule(stringParam(params, "scheduleName"),
                                                                   stringParam(params, "category"));
    return OperationResult::ok({{"scheduleId", scheduleId}});
}

OperationResult addScheduleField(const OperationContext& context, const nlohmann::json& params) {
    ElementId scheduleId = elementIdParam(params, "scheduleId");
    std::string fieldName = stringParam(params, "fieldName");
    bool added = activeDocument(context)->addScheduleField(scheduleId, fieldName);
    return OperationResult::ok({{"scheduleId", scheduleId}, {"fieldName", fieldName}, {"added", added}});
}

// === Annotation ===

OperationResult tagAllByCategory(const OperationContext& context, const nlohmann::json& params) {
    std::string category = stringParam(params, "category");
    if (category.empty()) {
        return OperationResult::failure("category is required");
    }
    int created = activeDocument(context)->tagAllByCategory(category);
    return OperationResult::ok({{"category", category}, {"tagsCreated", created}});
}

} // namespace

void registerDocumentOperations(OperationRegistry& registry) {
    registry.registerOperation("getSheets", getSheets, "List sheets of the active document");
    registry.registerOperation("createSheet", createSheet, "Create a sheet (sheetNumber, sheetName)");
    registry.registerOperation("getViews", getViews, "List views, optionally of one viewType");
    registry.registerOperation("createFloorPlan",
                               [](const OperationContext& c, const nlohmann::json& p) {
                                   return createView(c, p, "FloorPlan");
                               },
                               "Create a floor plan view (levelName, viewName)");
    registry.registerOperation("createSection",
                               [](const OperationContext& c, const nlohmann::json& p) {
                                   return createView(c, p, "Section");
                               },
                               "Create a section view (levelName, viewName)");
    registry.registerOperation("placeViewOnSheet", placeViewOnSheet, "Place a view on a sheet (viewId, sheetId)");
    registry.registerOperation("getSchedules", getSchedules, "List schedules");
    registry.registerOperation("createSchedule", createSchedule, "Create a schedule (scheduleName, category)");
    registry.registerOperation("addScheduleField", addScheduleField, "Add a field to a schedule (scheduleId, fieldName)");
    registry.registerOperation("tagAllByCategory", tagAllByCategory, "Tag every untagged element of a category");

    registry.registerAlias("getAllSheets", "getSheets");
    registry.registerAlias("getAllSchedules", "getSchedules");
    registry.registerAlias("tagAllRooms", "tagAllByCategory", {{"category", "Rooms"}}, "Tag every untagged room",
                           workflow_engine::PresetMode::Forced);
}

} // namespace archflow::application
