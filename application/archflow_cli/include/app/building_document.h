#pragma once

/**
 * @file building_document.h
 * @brief In-memory stand-in for an open CAD building document
 */

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace archflow::application {

using ElementId = long long;

struct SheetElement {
    ElementId id = 0;
    std::string number;
    std::string name;
    std::vector<ElementId> placedViews;
};

struct ViewElement {
    ElementId id = 0;
    std::string name;
    std::string viewType;   ///< "FloorPlan" or "Section"
    std::string levelName;
    std::optional<ElementId> sheetId;
};

struct ScheduleElement {
    ElementId id = 0;
    std::string name;
    std::string category;
    std::vector<std::string> fields;
};

/**
 * @class BuildingDocument
 * @brief Element lists of a building model: levels, sheets, views,
 *        schedules and taggable elements per category.
 *
 * Element ids are unique across all element kinds. All methods are
 * thread-safe. Invalid requests throw common_utils exceptions.
 */
class BuildingDocument {
public:
    explicit BuildingDocument(std::string title);

    /**
     * @brief A three-level sample project with rooms, doors and windows.
     */
    static std::shared_ptr<BuildingDocument> createSample();

    const std::string& title() const { return m_title; }

    void addLevel(const std::string& levelName);
    void addElements(const std::string& category, int count);

    std::vector<std::string> levels() const;
    std::vector<SheetElement> sheets() const;
    std::vector<ViewElement> views() const;
    std::vector<ScheduleElement> schedules() const;

    /**
     * @throw common_utils::ValidationException if the sheet number is taken
     */
    ElementId createSheet(const std::string& number, const std::string& name);

    /**
     * @throw common_utils::ResourceNotFoundException for an unknown level
     */
    ElementId createView(const std::string& viewType, const std::string& name, const std::string& levelName);

    /**
     * @throw common_utils::ResourceNotFoundException for an unknown view or sheet
     * @throw common_utils::InvalidStateException if the view is already on a sheet
     */
    void placeViewOnSheet(ElementId viewId, ElementId sheetId);

    ElementId createSchedule(const std::string& name, const std::string& category);

    /**
     * @return false if the schedule already had the field
     * @throw common_utils::ResourceNotFoundException for an unknown schedule
     */
    bool addScheduleField(ElementId scheduleId, const std::string& fieldName);

    /**
     * @brief Tags every untagged element of a category.
     * @return The number of tags created
     * @throw common_utils::ResourceNotFoundException for an unknown category
     */
    int tagAllByCategory(const std::string& category);

    int tagCount(const std::string& category) const;

private:
    struct CategoryElements {
        int count = 0;
        int tagged = 0;
    };

    ElementId nextId();

    const std::string m_title;
    mutable std::mutex m_mutex;
    ElementId m_nextId = 1000;
    std::vector<std::string> m_levels;
    std::vector<SheetElement> m_sheets;
    std::vector<ViewElement> m_views;
    std::vector<ScheduleElement> m_schedules;
    std::map<std::string, CategoryElements> m_categories;
};

} // namespace archflow::application
