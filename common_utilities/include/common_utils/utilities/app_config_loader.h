/**
 * @file app_config_loader.h
 * @brief Layered application configuration
 */

#pragma once

#include <array>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace archflow {
namespace common_utils {

/**
 * @brief Configuration layers, lowest precedence first
 */
enum class ConfigLayer {
    Defaults,
    File,
    Environment,
    CommandLine
};

const char* toString(ConfigLayer layer);

/**
 * @class AppConfigLoader
 * @brief Flat key/value configuration resolved across layers.
 *
 * Every layer keeps its own values, so precedence does not depend on load
 * order: a command-line value wins over an environment value loaded later.
 *
 * Nested file sections are flattened with '.', so
 * `workflow: { template_dir: x }` becomes `workflow.template_dir`, and
 * sequences become comma separated lists. Keys are lower-cased with '-'
 * mapped to '_'.
 */
class AppConfigLoader {
public:
    /**
     * @param appName Base name of the standard configuration files
     */
    explicit AppConfigLoader(std::string appName = "archflow");

    AppConfigLoader(const AppConfigLoader&) = delete;
    AppConfigLoader& operator=(const AppConfigLoader&) = delete;

    // === Sources ===

    void setDefault(const std::string& key, const std::string& value);

    /**
     * @brief Loads a JSON (.json) or YAML (any other extension) file
     * @return False if the file is missing or does not parse
     */
    bool loadFromFile(const std::filesystem::path& configPath);

    /**
     * @brief Loads a JSON object held in memory into the file layer
     * @throw ConfigurationException if the content is not a JSON object
     */
    void loadFromJsonString(const std::string& jsonContent);

    /**
     * @brief Loads the first readable file among `<app>.json`, `<app>.yaml`,
     *        `config/<app>.json`, `config/<app>.yaml` and
     *        `$HOME/.config/<app>/config.yaml`
     * @return The file loaded, if any
     */
    std::optional<std::filesystem::path> loadStandardConfig();

    /**
     * @brief Maps `<prefix><variable>` to a configuration key
     */
    void registerEnvironmentMapping(const std::string& variable, const std::string& key);

    /**
     * @return Number of mapped variables that were set
     */
    int loadFromEnvironment(const std::string& prefix = "ARCHFLOW_");

    /**
     * @brief Reads `--key=value`, `--key value` and bare `--flag` arguments
     * @return Number of values loaded
     */
    int loadFromCommandLine(int argc, char* argv[]);

    /**
     * @brief Sets a value in the command-line layer
     */
    void set(const std::string& key, const std::string& value);

    // === Lookup ===

    bool has(const std::string& key) const;

    /**
     * @brief Layer the effective value of a key comes from
     */
    std::optional<ConfigLayer> sourceOf(const std::string& key) const;

    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @throw ConfigurationException if the value is not an integer
     */
    int getInt(const std::string& key, int defaultValue = 0) const;

    /**
     * @brief Accepts true/false, yes/no, on/off and 1/0
     * @throw ConfigurationException for any other value
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /**
     * @brief Items of a comma (or, failing that, semicolon) separated value
     */
    std::vector<std::string> getStringList(const std::string& key) const;

    /**
     * @return The keys among requiredKeys that are unset or empty
     */
    std::vector<std::string> validateRequired(const std::vector<std::string>& requiredKeys) const;

private:
    static constexpr size_t kLayerCount = 4;
    using LayeredValue = std::array<std::optional<std::string>, kLayerCount>;

    void store(ConfigLayer layer, const std::string& key, const std::string& value);
    const std::string* find(const std::string& key, ConfigLayer* layer = nullptr) const;
    static std::string normalizeKey(const std::string& key);

    std::string m_appName;
    std::map<std::string, LayeredValue> m_values;
    std::map<std::string, std::string> m_environmentMappings;
};

} // namespace common_utils
} // namespace archflow
