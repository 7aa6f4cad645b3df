#include "clients/ConfigMerger.h"
#include "clients/ConfigFragment.h"
#include "install/InstallationResolver.h"
#include "utils/Logger.h"
#include "utils/PathUtils.h"
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace {
    std::string readFile(const fs::path& path) {
        std::ifstream f(path, std::ios::binary);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open " + path.u8string() + " for reading");
        }
        std::stringstream buffer;
        buffer << f.rdbuf();
        if (f.bad()) {
            throw std::runtime_error("Could not read " + path.u8string());
        }
        return buffer.str();
    }

    void writeFile(const fs::path& path, const std::string& content) {
        std::ofstream f(path, std::ios::binary | std::ios::trunc);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open " + path.u8string() + " for writing");
        }
        f << content;
        f.flush();
        if (!f) {
            throw std::runtime_error("Could not write " + path.u8string());
        }
    }

    bool isBlank(const std::string& text) {
        return text.find_first_not_of(" \t\r\n") == std::string::npos;
    }
}

ConfigMerger::ConfigMerger(const InstallationResolver& resolver, const HostEnvironment& env, const Config& config)
    : resolver(resolver), env(env), config(config) {}

nlohmann::ordered_json& ConfigMerger::selectMergeRoot(nlohmann::ordered_json& document,
                                                      MergeStrategy strategy,
                                                      const std::string& projectKey) {
    if (strategy == MergeStrategy::FlatRoot) {
        return document;
    }

    auto projects = document.find("projects");
    if (projects == document.end() || !projects->is_object()) {
        throw ConfigShapeError("Claude Code config error: Could not find 'projects' entry in existing config.");
    }

    auto project = projects->find(projectKey);
    if (project == projects->end() || !project->is_object()) {
        throw ConfigShapeError("Claude Code config error: Could not find project entry for parent directory '" +
                               projectKey + "' in existing config.");
    }
    return *project;
}

void ConfigMerger::mergeServers(nlohmann::ordered_json& mergeRoot, const nlohmann::ordered_json& fragment) {
    auto servers = fragment.find(ConfigFragment::kServersKey);
    if (servers == fragment.end() || !servers->is_object()) return;

    auto existing = mergeRoot.find(ConfigFragment::kServersKey);
    if (existing == mergeRoot.end() || existing->is_null()) {
        mergeRoot[ConfigFragment::kServersKey] = nlohmann::ordered_json::object();
    } else if (!existing->is_object()) {
        throw ConfigShapeError(std::string("'") + ConfigFragment::kServersKey + "' entry in existing config is not an object.");
    }

    auto entry = servers->find(ConfigFragment::kServerKey);
    if (entry != servers->end()) {
        mergeRoot[ConfigFragment::kServersKey][ConfigFragment::kServerKey] = *entry;
    }
}

SyncResult ConfigMerger::sync(const ClientDescriptor& client, bool useTabs) const {
    const std::string& productName = client.displayName;

    auto configPath = ClientTable::resolveConfigPath(client, env);
    if (!configPath) {
        return fail(SyncStatus::ClientPathUnavailable,
                    productName + " config file not found. Please make sure " + productName + " is installed.", {});
    }
    const fs::path& path = *configPath;

    auto installation = resolver.resolve();
    if (!installation) {
        return fail(SyncStatus::ServerNotFound,
                    std::string("Failed to add MCP configuration to ") + productName + ": " +
                        InstallationResolver::kServerNotFoundError, path);
    }

    // Built fresh on every call so it always reflects the current install
    const std::string fragmentText = ConfigFragment::build(installation->serverPath, useTabs, config);

    try {
        nlohmann::ordered_json fragment = nlohmann::ordered_json::parse(fragmentText);
        std::error_code ec;

        if (fs::exists(path, ec)) {
            std::string existingText = readFile(path);
            nlohmann::ordered_json document = isBlank(existingText)
                ? nlohmann::ordered_json::object()
                : nlohmann::ordered_json::parse(existingText);
            if (!document.is_object()) {
                return fail(SyncStatus::ParseError,
                            "Failed to add MCP configuration to " + productName + ": " + path.u8string() +
                                " does not contain a JSON object", path);
            }

            std::string projectKey = PathUtils::parentPath(installation->serverPath);
            nlohmann::ordered_json& mergeRoot = selectMergeRoot(document, client.strategy, projectKey);
            mergeServers(mergeRoot, fragment);

            writeFile(path, document.dump(2));
        } else if (fs::is_directory(path.parent_path(), ec)) {
            // New file with just our config
            writeFile(path, fragmentText);
        } else {
            return fail(SyncStatus::DirectoryMissing,
                        "Cannot find " + productName + " config file or " + productName +
                            " is currently not installed. Expecting " + productName + " to be installed in the " +
                            path.u8string() + " path", path);
        }
    } catch (const ConfigShapeError& e) {
        return fail(SyncStatus::ShapeError,
                    "Failed to add MCP configuration to " + productName + ": " + e.what(), path);
    } catch (const nlohmann::json::exception& e) {
        return fail(SyncStatus::ParseError,
                    "Failed to add MCP configuration to " + productName + ": " + e.what(), path);
    } catch (const std::exception& e) {
        return fail(SyncStatus::IoError,
                    "Failed to add MCP configuration to " + productName + ": " + e.what(), path);
    }

    Logger::getInstance().success("[MCP Unity] Added MCP configuration to " + productName + " (" + path.u8string() + ")");
    return SyncResult{SyncStatus::Ok, "", path};
}

bool ConfigMerger::syncClient(const ClientDescriptor& client, bool useTabs) const {
    return sync(client, useTabs).ok();
}

std::vector<std::pair<std::string, SyncResult>> ConfigMerger::syncAll(bool useTabs) const {
    std::vector<std::pair<std::string, SyncResult>> results;
    for (const auto& client : ClientTable::all()) {
        results.emplace_back(client.id, sync(client, useTabs));
    }
    return results;
}

SyncResult ConfigMerger::fail(SyncStatus status, const std::string& message, const fs::path& path) {
    Logger::getInstance().error(message);
    return SyncResult{status, message, path};
}

const char* syncStatusName(SyncStatus status) {
    switch (status) {
        case SyncStatus::Ok: return "ok";
        case SyncStatus::ClientPathUnavailable: return "client_path_unavailable";
        case SyncStatus::ServerNotFound: return "server_not_found";
        case SyncStatus::DirectoryMissing: return "directory_missing";
        case SyncStatus::ParseError: return "parse_error";
        case SyncStatus::ShapeError: return "shape_error";
        case SyncStatus::IoError: return "io_error";
    }
    return "unknown";
}
