/**
 * @file logging_utils.h
 * @brief Per-component spdlog loggers and the ARCHFLOW_LOG_* macros
 */

#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include <spdlog/spdlog.h>

namespace archflow::common_utils {

/**
 * @brief Components that own a logger. The enumerator name is the logger name.
 */
enum class LogModule {
    Config,
    ServiceManager,
    OperationRegistry,
    TemplateStore,
    TaskExecutor,
    PhaseExecutor,
    WorkflowRegistry,
    WorkflowCoordinator,
    RequestRouter,
    Document,
    ArchflowCli,
    Count
};

const char* toString(LogModule module);

/**
 * @brief Sink setup shared by every module logger
 */
struct LoggingConfig {
    std::string level = "info";             ///< console sink level
    std::string file_level = "debug";       ///< file sink level
    std::string log_file;                   ///< rotating file sink, none if empty
    size_t max_file_size = 1048576 * 5;     ///< 5MB
    size_t max_files = 3;
};

/**
 * @brief Owns the module loggers.
 *
 * Before configure() every module logs to stderr at info level, so library
 * code and tests can log without setup. configure() rebuilds all loggers
 * with the new sinks. Console output always goes to stderr: stdout carries
 * the CLI's JSON responses.
 *
 * @code
 * LoggingConfig config;
 * config.level = "debug";
 * Logging::configure(config);
 * ARCHFLOW_LOG_INFO(WorkflowCoordinator, "Created workflow {}", id);
 * @endcode
 */
class Logging {
public:
    Logging() = delete;

    /**
     * @throw ConfigurationException for an unknown level or an unusable log file
     */
    static void configure(const LoggingConfig& config);

    static std::shared_ptr<spdlog::logger> logger(LogModule module);

    /**
     * @brief Console level of every module logger
     * @throw ConfigurationException for an unknown level
     */
    static void setLevel(const std::string& level);

    static void flush();

    /**
     * @brief trace/debug/info/warn(ing)/error/critical/off, any case
     * @throw ConfigurationException for anything else
     */
    static spdlog::level::level_enum parseLevel(const std::string& level);
};

} // namespace archflow::common_utils

#define ARCHFLOW_LOG_AT(method, module, ...) \
    ::archflow::common_utils::Logging::logger(::archflow::common_utils::LogModule::module)->method(__VA_ARGS__)

#define ARCHFLOW_LOG_DEBUG(module, ...) ARCHFLOW_LOG_AT(debug, module, __VA_ARGS__)
#define ARCHFLOW_LOG_INFO(module, ...) ARCHFLOW_LOG_AT(info, module, __VA_ARGS__)
#define ARCHFLOW_LOG_WARN(module, ...) ARCHFLOW_LOG_AT(warn, module, __VA_ARGS__)
#define ARCHFLOW_LOG_ERROR(module, ...) ARCHFLOW_LOG_AT(error, module, __VA_ARGS__)
