#include "common_utils/utilities/logging_utils.h"
#include "common_utils/utilities/exceptions.h"
#include "common_utils/utilities/string_utils.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <mutex>
#include <vector>

namespace archflow::common_utils {

namespace {

constexpr size_t kModuleCount = static_cast<size_t>(LogModule::Count);

const char* const kConsolePattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";
const char* const kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

/**
 * @brief Sinks and loggers currently in use. Guarded by registryMutex().
 */
struct LoggerSet {
    std::vector<spdlog::sink_ptr> sinks;
    std::array<std::shared_ptr<spdlog::logger>, kModuleCount> loggers;
};

std::mutex& registryMutex() {
    static std::mutex mutex;
    return mutex;
}

LoggerSet& loggerSet() {
    static LoggerSet set;
    return set;
}

spdlog::sink_ptr makeConsoleSink(spdlog::level::level_enum level) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_level(level);
    sink->set_pattern(kConsolePattern);
    return sink;
}

// Caller holds registryMutex().
void ensureSinks(LoggerSet& set) {
    if (set.sinks.empty()) {
        set.sinks.push_back(makeConsoleSink(spdlog::level::info));
    }
}

std::shared_ptr<spdlog::logger> makeLogger(LogModule module, const std::vector<spdlog::sink_ptr>& sinks) {
    auto logger = std::make_shared<spdlog::logger>(toString(module), sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace);    // sinks filter
    logger->flush_on(spdlog::level::err);
    return logger;
}

} // namespace

const char* toString(LogModule module) {
    switch (module) {
        case LogModule::Config: return "Config";
        case LogModule::ServiceManager: return "ServiceManager";
        case LogModule::OperationRegistry: return "OperationRegistry";
        case LogModule::TemplateStore: return "TemplateStore";
        case LogModule::TaskExecutor: return "TaskExecutor";
        case LogModule::PhaseExecutor: return "PhaseExecutor";
        case LogModule::WorkflowRegistry: return "WorkflowRegistry";
        case LogModule::WorkflowCoordinator: return "WorkflowCoordinator";
        case LogModule::RequestRouter: return "RequestRouter";
        case LogModule::Document: return "Document";
        case LogModule::ArchflowCli: return "ArchflowCli";
        case LogModule::Count: break;
    }
    return "Unknown";
}

void Logging::configure(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(makeConsoleSink(parseLevel(config.level)));

    if (!config.log_file.empty()) {
        auto fileLevel = parseLevel(config.file_level);
        try {
            auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.log_file, config.max_file_size, config.max_files);
            fileSink->set_level(fileLevel);
            fileSink->set_pattern(kFilePattern);
            sinks.push_back(fileSink);
        } catch (const spdlog::spdlog_ex& e) {
            throw ConfigurationException("Cannot open log file '" + config.log_file + "': " + e.what());
        }
    }

    std::lock_guard<std::mutex> lock(registryMutex());
    LoggerSet& set = loggerSet();
    for (auto& logger : set.loggers) {
        if (logger) {
            logger->flush();
        }
    }
    set.sinks = std::move(sinks);
    for (size_t i = 0; i < kModuleCount; ++i) {
        set.loggers[i] = makeLogger(static_cast<LogModule>(i), set.sinks);
    }
}

std::shared_ptr<spdlog::logger> Logging::logger(LogModule module) {
    auto index = static_cast<size_t>(module);
    if (index >= kModuleCount) {
        index = static_cast<size_t>(LogModule::ArchflowCli);
    }

    std::lock_guard<std::mutex> lock(registryMutex());
    LoggerSet& set = loggerSet();
    auto& logger = set.loggers[index];
    if (!logger) {
        ensureSinks(set);
        logger = makeLogger(static_cast<LogModule>(index), set.sinks);
    }
    return logger;
}

void Logging::setLevel(const std::string& level) {
    auto parsed = parseLevel(level);

    std::lock_guard<std::mutex> lock(registryMutex());
    LoggerSet& set = loggerSet();
    ensureSinks(set);
    // the console sink is always first
    set.sinks.front()->set_level(parsed);
}

void Logging::flush() {
    std::lock_guard<std::mutex> lock(registryMutex());
    for (auto& logger : loggerSet().loggers) {
        if (logger) {
            logger->flush();
        }
    }
}

spdlog::level::level_enum Logging::parseLevel(const std::string& level) {
    std::string name = StringUtils::toLower(StringUtils::trim(level));
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    throw ConfigurationException("Unknown log level: " + level);
}

} // namespace archflow::common_utils
