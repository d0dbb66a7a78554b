/**
 * @file app_config_loader.cpp
 * @brief Layered configuration: JSON and YAML readers, environment, command line
 */

#include "common_utils/utilities/app_config_loader.h"
#include "common_utils/utilities/exceptions.h"
#include "common_utils/utilities/logging_utils.h"
#include "common_utils/utilities/string_utils.h"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

namespace archflow {
namespace common_utils {

namespace {

using FlatEntries = std::vector<std::pair<std::string, std::string>>;

std::string joinKey(const std::string& prefix, const std::string& key) {
    return prefix.empty() ? key : prefix + "." + key;
}

void flattenJson(const nlohmann::json& node, const std::string& prefix, FlatEntries& out) {
    if (node.is_object()) {
        for (const auto& item : node.items()) {
            flattenJson(item.value(), joinKey(prefix, item.key()), out);
        }
        return;
    }
    if (prefix.empty()) {
        return;
    }
    if (node.is_array()) {
        std::vector<std::string> items;
        for (const auto& element : node) {
            items.push_back(element.is_string() ? element.get<std::string>() : element.dump());
        }
        out.emplace_back(prefix, StringUtils::join(items, ","));
    } else if (!node.is_null()) {
        out.emplace_back(prefix, node.is_string() ? node.get<std::string>() : node.dump());
    }
}

void flattenYaml(const YAML::Node& node, const std::string& prefix, FlatEntries& out) {
    switch (node.Type()) {
        case YAML::NodeType::Map:
            for (const auto& item : node) {
                flattenYaml(item.second, joinKey(prefix, item.first.as<std::string>()), out);
            }
            break;
        case YAML::NodeType::Sequence: {
            std::vector<std::string> items;
            for (const auto& element : node) {
                items.push_back(element.as<std::string>());
            }
            out.emplace_back(prefix, StringUtils::join(items, ","));
            break;
        }
        case YAML::NodeType::Scalar:
            if (!prefix.empty()) {
                out.emplace_back(prefix, node.as<std::string>());
            }
            break;
        default:
            break;
    }
}

std::optional<std::string> readFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace

const char* toString(ConfigLayer layer) {
    switch (layer) {
        case ConfigLayer::Defaults: return "defaults";
        case ConfigLayer::File: return "file";
        case ConfigLayer::Environment: return "environment";
        case ConfigLayer::CommandLine: return "command line";
    }
    return "unknown";
}

AppConfigLoader::AppConfigLoader(std::string appName) : m_appName(std::move(appName)) {
    setDefault("log_level", "info");
    setDefault("log_file", "");
    setDefault("log_file_level", "debug");

    registerEnvironmentMapping("LOG_LEVEL", "log_level");
    registerEnvironmentMapping("LOG_FILE", "log_file");
    registerEnvironmentMapping("LOG_FILE_LEVEL", "log_file_level");
}

// === Sources ===

void AppConfigLoader::setDefault(const std::string& key, const std::string& value) {
    store(ConfigLayer::Defaults, key, value);
}

bool AppConfigLoader::loadFromFile(const std::filesystem::path& configPath) {
    auto content = readFile(configPath);
    if (!content) {
        ARCHFLOW_LOG_WARN(Config, "Cannot read config file: {}", configPath.string());
        return false;
    }

    FlatEntries entries;
    bool isJson = StringUtils::toLower(configPath.extension().string()) == ".json";
    try {
        if (isJson) {
            flattenJson(nlohmann::json::parse(*content), "", entries);
        } else {
            flattenYaml(YAML::Load(*content), "", entries);
        }
    } catch (const nlohmann::json::exception& e) {
        ARCHFLOW_LOG_ERROR(Config, "Invalid JSON in {}: {}", configPath.string(), e.what());
        return false;
    } catch (const YAML::Exception& e) {
        ARCHFLOW_LOG_ERROR(Config, "Invalid YAML in {}: {}", configPath.string(), e.what());
        return false;
    }

    for (const auto& [key, value] : entries) {
        store(ConfigLayer::File, key, value);
    }
    ARCHFLOW_LOG_INFO(Config, "Loaded {} values from {}", entries.size(), configPath.string());
    return true;
}

void AppConfigLoader::loadFromJsonString(const std::string& jsonContent) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(jsonContent);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationException(std::string("Invalid JSON configuration: ") + e.what());
    }
    if (!root.is_object()) {
        throw ConfigurationException("JSON configuration must be an object");
    }

    FlatEntries entries;
    flattenJson(root, "", entries);
    for (const auto& [key, value] : entries) {
        store(ConfigLayer::File, key, value);
    }
}

std::optional<std::filesystem::path> AppConfigLoader::loadStandardConfig() {
    std::vector<std::filesystem::path> candidates = {
        m_appName + ".json",
        m_appName + ".yaml",
        std::filesystem::path("config") / (m_appName + ".json"),
        std::filesystem::path("config") / (m_appName + ".yaml")
    };
    if (const char* home = std::getenv("HOME")) {
        candidates.push_back(std::filesystem::path(home) / ".config" / m_appName / "config.yaml");
    }

    std::error_code ec;
    for (const auto& candidate : candidates) {
        if (std::filesystem::is_regular_file(candidate, ec) && loadFromFile(candidate)) {
            return candidate;
        }
    }
    ARCHFLOW_LOG_DEBUG(Config, "No standard configuration file for '{}'", m_appName);
    return std::nullopt;
}

void AppConfigLoader::registerEnvironmentMapping(const std::string& variable, const std::string& key) {
    m_environmentMappings[StringUtils::toUpper(variable)] = normalizeKey(key);
}

int AppConfigLoader::loadFromEnvironment(const std::string& prefix) {
    int count = 0;
    for (const auto& [variable, key] : m_environmentMappings) {
        std::string name = prefix + variable;
        if (const char* value = std::getenv(name.c_str())) {
            store(ConfigLayer::Environment, key, value);
            ARCHFLOW_LOG_DEBUG(Config, "{} -> {}", name, key);
            ++count;
        }
    }
    return count;
}

int AppConfigLoader::loadFromCommandLine(int argc, char* argv[]) {
    int count = 0;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (!StringUtils::startsWith(arg, "--") || arg.size() == 2) {
            continue;
        }
        arg.erase(0, 2);

        size_t equals = arg.find('=');
        if (equals != std::string::npos) {
            store(ConfigLayer::CommandLine, arg.substr(0, equals), arg.substr(equals + 1));
        } else if (i + 1 < argc && argv[i + 1][0] != '-') {
            store(ConfigLayer::CommandLine, arg, argv[++i]);
        } else {
            store(ConfigLayer::CommandLine, arg, "true");
        }
        ++count;
    }
    return count;
}

void AppConfigLoader::set(const std::string& key, const std::string& value) {
    store(ConfigLayer::CommandLine, key, value);
}

// === Lookup ===

bool AppConfigLoader::has(const std::string& key) const {
    return find(key) != nullptr;
}

std::optional<ConfigLayer> AppConfigLoader::sourceOf(const std::string& key) const {
    ConfigLayer layer = ConfigLayer::Defaults;
    if (find(key, &layer) == nullptr) {
        return std::nullopt;
    }
    return layer;
}

std::string AppConfigLoader::getString(const std::string& key, const std::string& defaultValue) const {
    const std::string* value = find(key);
    return value ? *value : defaultValue;
}

int AppConfigLoader::getInt(const std::string& key, int defaultValue) const {
    const std::string* value = find(key);
    if (!value) {
        return defaultValue;
    }

    std::string text = StringUtils::trim(*value);
    errno = 0;
    char* end = nullptr;
    long parsed = std::strtol(text.c_str(), &end, 10);
    if (text.empty() || *end != '\0' || errno == ERANGE || parsed < INT_MIN || parsed > INT_MAX) {
        throw ConfigurationException("Configuration value '" + key + "' is not an integer: " + *value);
    }
    return static_cast<int>(parsed);
}

bool AppConfigLoader::getBool(const std::string& key, bool defaultValue) const {
    const std::string* value = find(key);
    if (!value) {
        return defaultValue;
    }

    std::string text = StringUtils::toLower(StringUtils::trim(*value));
    if (text == "true" || text == "yes" || text == "on" || text == "1") {
        return true;
    }
    if (text == "false" || text == "no" || text == "off" || text == "0") {
        return false;
    }
    throw ConfigurationException("Configuration value '" + key + "' is not a boolean: " + *value);
}

std::vector<std::string> AppConfigLoader::getStringList(const std::string& key) const {
    const std::string* value = find(key);
    if (!value) {
        return {};
    }
    const char* delimiter = value->find(',') != std::string::npos ? "," : ";";
    return StringUtils::split(*value, delimiter, true);
}

std::vector<std::string> AppConfigLoader::validateRequired(const std::vector<std::string>& requiredKeys) const {
    std::vector<std::string> missing;
    for (const auto& key : requiredKeys) {
        const std::string* value = find(key);
        if (!value || value->empty()) {
            missing.push_back(key);
        }
    }
    return missing;
}

// === Private ===

void AppConfigLoader::store(ConfigLayer layer, const std::string& key, const std::string& value) {
    m_values[normalizeKey(key)][static_cast<size_t>(layer)] = value;
}

const std::string* AppConfigLoader::find(const std::string& key, ConfigLayer* layer) const {
    auto it = m_values.find(normalizeKey(key));
    if (it == m_values.end()) {
        return nullptr;
    }
    for (size_t i = kLayerCount; i-- > 0;) {
        if (it->second[i]) {
            if (layer) {
                *layer = static_cast<ConfigLayer>(i);
            }
            return &*it->second[i];
        }
    }
    return nullptr;
}

std::string AppConfigLoader::normalizeKey(const std::string& key) {
    std::string normalized = StringUtils::toLower(StringUtils::trim(key));
    std::replace(normalized.begin(), normalized.end(), '-', '_');
    return normalized;
}

} // namespace common_utils
} // namespace archflow
