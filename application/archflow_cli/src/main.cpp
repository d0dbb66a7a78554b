#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "common_utils/utilities/app_config_loader.h"
#include "common_utils/utilities/exceptions.h"
#include "common_utils/utilities/logging_utils.h"
#include "workflow_engine/control/workflow_request_router.h"
#include "workflow_engine/service_management/service_manager_impl.h"
#include "workflow_engine/workflow_coordinator.h"
#include "workflow_engine/workflow_engine_config.h"

#include "app/building_document.h"
#include "app/document_operations.h"

namespace {

using archflow::common_utils::AppConfigLoader;
using archflow::workflow_engine::control::WorkflowRequestRouter;

void printUsage() {
    std::cout
        << "Usage: archflow_cli [options]\n"
        << "  --list-templates                 List workflow templates\n"
        << "  --list-operations                List document operations\n"
        << "  --request <file>                 Route a {\"method\", \"params\"} request document\n"
        << "  --workflow-type <type>           Execute a workflow (e.g. DD_Package, CD_Set)\n"
        << "  --project-type <type>            Project type (default General)\n"
        << "  --building-code <code>           Building code (default IBC_2021)\n"
        << "  --config <file>                  Configuration file (JSON or YAML)\n"
        << "  --workflow.template_dir <dir>    Template directory\n"
        << "  --log-level <level>              trace, debug, info, warn, error\n";
}

std::string readFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw archflow::common_utils::IOException("Could not open request file: " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void configureLogging(const AppConfigLoader& config) {
    archflow::common_utils::LoggingConfig logging;
    logging.level = config.getString("log_level", logging.level);
    logging.file_level = config.getString("log_file_level", logging.file_level);
    logging.log_file = config.getString("log_file");
    archflow::common_utils::Logging::configure(logging);
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        // --- Configuration: defaults < file < environment < command line ---
        AppConfigLoader config("archflow");
        archflow::workflow_engine::WorkflowEngineConfig::registerDefaults(config);
        config.loadFromCommandLine(argc, argv);
        if (config.getBool("help")) {
            printUsage();
            return 0;
        }

        std::string configFile = config.getString("config");
        if (!configFile.empty()) {
            if (!config.loadFromFile(configFile)) {
                throw archflow::common_utils::ConfigurationException("Could not load configuration: " + configFile);
            }
        } else {
            config.loadStandardConfig();
        }
        config.loadFromEnvironment();

        configureLogging(config);
        auto engineConfig = archflow::workflow_engine::WorkflowEngineConfig::fromConfig(config);

        // --- Host document and operations ---
        auto document = archflow::application::BuildingDocument::createSample();
        auto services = std::make_shared<archflow::workflow_engine::service_management::ServiceManagerImpl>();
        services->registerService<archflow::application::BuildingDocument>(document);

        auto operations = std::make_shared<archflow::workflow_engine::OperationRegistry>();
        archflow::application::registerDocumentOperations(*operations);

        auto coordinator = archflow::workflow_engine::WorkflowCoordinator::create(engineConfig, operations, services);
        WorkflowRequestRouter router(coordinator);

        ARCHFLOW_LOG_INFO(ArchflowCli, "archflow_cli ready: document '{}', {} operations, templates in '{}'",
                          document->title(), operations->size(), engineConfig.templateDirectory);

        // --- Command ---
        nlohmann::json response;
        if (config.getBool("list_templates")) {
            response = router.handle("listWorkflowTemplates", nlohmann::json::object());
        } else if (config.getBool("list_operations")) {
            response = router.handle("listOperations", nlohmann::json::object());
        } else if (config.has("request")) {
            response = nlohmann::json::parse(router.route(readFile(config.getString("request"))));
        } else if (config.has("workflow_type")) {
            nlohmann::json params = {
                {"workflowType", config.getString("workflow_type")},
                {"projectType", config.getString("project_type", "General")},
                {"buildingCode", config.getString("building_code", "IBC_2021")}
            };
            response = router.handle("executeWorkflow", params);
        } else {
            printUsage();
            return 1;
        }

        std::cout << response.dump(2) << std::endl;
        archflow::common_utils::Logging::flush();
        return response.value("success", false) ? 0 : 1;

    } catch (const std::exception& e) {
        std::cerr << "archflow_cli: " << e.what() << std::endl;
        return 1;
    }
}
