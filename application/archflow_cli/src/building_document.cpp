#include "app/building_document.h"
#include "common_utils/utilities/exceptions.h"
#include "common_utils/utilities/logging_utils.h"
#include "common_utils/utilities/string_utils.h"

#include <algorithm>
#include <memory>

namespace archflow::application {

using common_utils::StringUtils;

BuildingDocument::BuildingDocument(std::string title)
    : m_title(std::move(title)) {
}

std::shared_ptr<BuildingDocument> BuildingDocument::createSample() {
    auto document = std::make_shared<BuildingDocument>("Sample Office Building");
    document->addLevel("Level 1");
    document->addLevel("Level 2");
    document->addLevel("Roof");
    document->addElements("Rooms", 24);
    document->addElements("Doors", 38);
    document->addElements("Windows", 52);
    document->addElements("Walls", 120);
    document->createSheet("G001", "Cover Sheet");
    return document;
}

void BuildingDocument::addLevel(const std::string& levelName) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (std::find(m_levels.begin(), m_levels.end(), levelName) == m_levels.end()) {
        m_levels.push_back(levelName);
    }
}

void BuildingDocument::addElements(const std::string& category, int count) {
    if (count < 0) {
        throw common_utils::ValidationException("Element count must not be negative: " + category);
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_categories[category].count += count;
}

std::vector<std::string> BuildingDocument::levels() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_levels;
}

std::vector<SheetElement> BuildingDocument::sheets() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sheets;
}

std::vector<ViewElement> BuildingDocument::views() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_views;
}

std::vector<ScheduleElement> BuildingDocument::schedules() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_schedules;
}

ElementId BuildingDocument::createSheet(const std::string& number, const std::string& name) {
    if (StringUtils::trim(number).empty()) {
        throw common_utils::ValidationException("sheetNumber is required");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& sheet : m_sheets) {
        if (StringUtils::equalsIgnoreCase(sheet.number, number)) {
            throw common_utils::ValidationException("Sheet number already in use: " + number);
        }
    }

    SheetElement sheet;
    sheet.id = nextId();
    sheet.number = number;
    sheet.name = name.empty() ? "Unnamed" : name;
    m_sheets.push_back(sheet);

    ARCHFLOW_LOG_DEBUG(Document, "Created sheet {} - {} ({})", sheet.number, sheet.name, sheet.id);
    return sheet.id;
}

ElementId BuildingDocument::createView(const std::string& viewType, const std::string& name,
                                       const std::string& levelName) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (std::find(m_levels.begin(), m_levels.end(), levelName) == m_levels.end()) {
        throw common_utils::ResourceNotFoundException("Level not found: " + levelName);
    }

    ViewElement view;
    view.id = nextId();
    view.viewType = viewType;
    view.levelName = levelName;
    view.name = name.empty() ? levelName + " - " + viewType : name;
    m_views.push_back(view);

    ARCHFLOW_LOG_DEBUG(Document, "Created {} view '{}' ({})", view.viewType, view.name, view.id);
    return view.id;
}

void BuildingDocument::placeViewOnSheet(ElementId viewId, ElementId sheetId) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto view = std::find_if(m_views.begin(), m_views.end(),
                             [viewId](const ViewElement& v) { return v.id == viewId; });
    if (view == m_views.end()) {
        throw common_utils::ResourceNotFoundException("View not found: " + std::to_string(viewId));
    }
    auto sheet = std::find_if(m_sheets.begin(), m_sheets.end(),
                              [sheetId](const SheetElement& s) { return s.id == sheetId; });
    if (sheet == m_sheets.end()) {
        throw common_utils::ResourceNotFoundException("Sheet not found: " + std::to_string(sheetId));
    }
    if (view->sheetId) {
        throw common_utils::InvalidStateException("View '" + view->name + "' is already placed on a sheet");
    }

    view->sheetId = sheetId;
    sheet->placedViews.push_back(viewId);
}

ElementId BuildingDocument::createSchedule(const std::string& name, const std::string& category) {
    if (StringUtils::trim(category).empty()) {
        throw common_utils::ValidationException("category is required");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    ScheduleElement schedule;
    schedule.id = nextId();
    schedule.category = category;
    schedule.name = name.empty() ? category + " Schedule" : name;
    m_schedules.push_back(schedule);
    return schedule.id;
}

bool BuildingDocument::addScheduleField(ElementId scheduleId, const std::string& fieldName) {
    if (StringUtils::trim(fieldName).empty()) {
        throw common_utils::ValidationException("fieldName is required");
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto schedule = std::find_if(m_schedules.begin(), m_schedules.end(),
                                 [scheduleId](const ScheduleElement& s) { return s.id == scheduleId; });
    if (schedule == m_schedules.end()) {
        throw common_utils::ResourceNotFoundException("Schedule not found: " + std::to_string(scheduleId));
    }
    if (std::find(schedule->fields.begin(), schedule->fields.end(), fieldName) != schedule->fields.end()) {
        return false;
    }
    schedule->fields.push_back(fieldName);
    return true;
}

int BuildingDocument::tagAllByCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_categories.find(category);
    if (it == m_categories.end()) {
        throw common_utils::ResourceNotFoundException("Category not found: " + category);
    }
    int created = it->second.count - it->second.tagged;
    it->second.tagged = it->second.count;
    return created;
}

int BuildingDocument::tagCount(const std::string& category) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_categories.find(category);
    return it == m_categories.end() ? 0 : it->second.tagged;
}

ElementId BuildingDocument::nextId() {
    return m_nextId++;
}

} // namespace archflow::application
