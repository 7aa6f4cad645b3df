#include <iostream>
#include <iterator>
#include <string>
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/ConfigManager.h"
#include "core/HostEnvironment.h"
#include "install/PackageRegistry.h"
#include "install/AssetIndex.h"
#include "install/InstallationResolver.h"
#include "clients/ClientTable.h"
#include "clients/ConfigFragment.h"
#include "clients/ConfigMerger.h"
#include "process/ProcessRunner.h"
#include "process/ServerBuilder.h"
#include "services/ConsoleLogsService.h"
#include "tools/ToolRegistry.h"
#include "tools/GetConsoleLogsTool.h"
#include "tools/ToolResponse.h"
#include "utils/Logger.h"

void printUsage() {
    std::cout << "Usage: mcp-unity-sync [--project DIR] [--settings FILE] [--tabs] <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  server-path              Print the resolved MCP server directory\n"
              << "  config                   Print the MCP server configuration fragment\n"
              << "  clients                  List supported clients and their config paths\n"
              << "  sync <client|all>        Add the server to a client's MCP config\n"
              << "  install                  Run npm install in the server directory\n"
              << "  build                    Run npm run build in the server directory\n"
              << "  tools                    List the tools available for dispatch\n"
              << "  tool <name> [json]       Invoke a tool (parameters from argument or stdin)\n";
}

int main(int argc, char* argv[]) {
    std::string projectPath = ".";
    std::string settingsPath;
    bool forceTabs = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--project" && i + 1 < argc) {
            projectPath = argv[++i];
        } else if (arg == "--settings" && i + 1 < argc) {
            settingsPath = argv[++i];
        } else if (arg == "--tabs") {
            forceTabs = true;
        } else if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        } else {
            positional.push_back(arg);
        }
    }
    if (positional.empty()) {
        printUsage();
        return 1;
    }

    HostEnvironment env = HostEnvironment::detect(projectPath);
    if (settingsPath.empty()) {
        settingsPath = Config::defaultPath(env.projectRoot).u8string();
    }

    Config cfg;
    try {
        cfg = Config::loadOrDefault(settingsPath);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load settings: " << e.what() << std::endl;
        return 1;
    }

    Logger::getInstance().setLogFile(cfg.logging.logFile);
    ConsoleLogsService consoleLogs(cfg.logging.maxEntries);
    consoleLogs.attach();

    bool useTabs = forceTabs || cfg.server.useTabsIndentation;

    FileSystemPackageRegistry registry(env.projectRoot);
    FileSystemAssetIndex assets(env.projectRoot);
    InstallationResolver resolver(cfg, env, registry, assets);

    const std::string& command = positional[0];

    if (command == "server-path") {
        auto info = resolver.resolve();
        if (!info) return 1;
        std::cout << info->serverPath << " (" << installModeName(info->mode) << ")" << std::endl;
        return 0;
    }

    if (command == "config") {
        std::cout << ConfigFragment::generate(resolver, useTabs, cfg) << std::endl;
        return 0;
    }

    if (command == "clients") {
        for (const auto& client : ClientTable::all()) {
            auto path = ClientTable::resolveConfigPath(client, env);
            std::cout << client.id << "\t" << client.displayName << "\t"
                      << (path ? path->u8string() : std::string("(unsupported platform)")) << std::endl;
        }
        return 0;
    }

    if (command == "sync") {
        if (positional.size() < 2) {
            printUsage();
            return 1;
        }
        ConfigMerger merger(resolver, env, cfg);
        if (positional[1] == "all") {
            bool allOk = true;
            for (const auto& [id, result] : merger.syncAll(useTabs)) {
                std::cout << id << ": " << syncStatusName(result.status) << std::endl;
                allOk = allOk && result.ok();
            }
            return allOk ? 0 : 1;
        }
        const ClientDescriptor* client = ClientTable::find(positional[1]);
        if (!client) {
            std::cerr << "Unknown client: " << positional[1] << std::endl;
            return 1;
        }
        return merger.syncClient(*client, useTabs) ? 0 : 1;
    }

    if (command == "install" || command == "build") {
        ProcessRunner runner(cfg);
        ServerBuilder builder(runner, resolver);
        ProcessOutcome outcome = command == "install" ? builder.install() : builder.build();
        return outcome.succeeded() ? 0 : 1;
    }

    ToolRegistry tools;
    tools.registerTool(std::make_unique<GetConsoleLogsTool>(consoleLogs));

    if (command == "tools") {
        nlohmann::json list = tools.listToolSchemas();
        std::cout << list.dump(2) << std::endl;
        return 0;
    }

    if (command == "tool") {
        if (positional.size() < 2) {
            printUsage();
            return 1;
        }
        std::string paramsText;
        if (positional.size() >= 3) {
            paramsText = positional[2];
        } else {
            paramsText.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        }

        nlohmann::json params = nlohmann::json::object();
        if (paramsText.find_first_not_of(" \t\r\n") != std::string::npos) {
            try {
                params = nlohmann::json::parse(paramsText);
            } catch (const nlohmann::json::parse_error& e) {
                std::cerr << "Invalid tool parameters: " << e.what() << std::endl;
                return 1;
            }
        }

        nlohmann::json response = tools.dispatch({{"method", positional[1]}, {"params", params}});
        std::cout << response.dump(2) << std::endl;
        return ToolResponse::isSuccess(response) ? 0 : 1;
    }

    std::cerr << "Unknown command: " << command << std::endl;
    printUsage();
    return 1;
}
