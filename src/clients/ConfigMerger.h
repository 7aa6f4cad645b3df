#pragma once
#include <string>
#include <vector>
#include <utility>
#include <stdexcept>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "core/ConfigManager.h"
#include "core/HostEnvironment.h"
#include "clients/ClientTable.h"

class InstallationResolver;

enum class SyncStatus {
    Ok,
    ClientPathUnavailable,   // unsupported platform or unknown base directory
    ServerNotFound,          // MCP server installation could not be located
    DirectoryMissing,        // neither the config file nor its directory exists
    ParseError,              // existing config is not a JSON object
    ShapeError,              // expected nesting (projects/<dir>) is absent
    IoError                  // read/write failure
};

struct SyncResult {
    SyncStatus status = SyncStatus::Ok;
    std::string message;
    std::filesystem::path configPath;

    bool ok() const { return status == SyncStatus::Ok; }
};

/**
 * @brief Raised when a client document lacks the structure we merge into
 *
 * Kept apart from parse errors: the file is valid JSON, the user just has
 * not set the client up for this project yet.
 */
class ConfigShapeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Writes the mcp-unity server entry into a client's own config file
 *
 * Only mcpServers["mcp-unity"] is added or replaced; every other key in the
 * document is left as it was. The file is read, changed and rewritten in one
 * call and nothing is kept between calls. There is no file locking, so two
 * concurrent syncs of the same file may race.
 */
class ConfigMerger {
public:
    ConfigMerger(const InstallationResolver& resolver, const HostEnvironment& env, const Config& config);

    SyncResult sync(const ClientDescriptor& client, bool useTabs) const;

    // Same as sync(), reduced to success/failure for UI callers
    bool syncClient(const ClientDescriptor& client, bool useTabs) const;

    std::vector<std::pair<std::string, SyncResult>> syncAll(bool useTabs) const;

    /**
     * @brief Picks the object that receives "mcpServers"
     * @throws ConfigShapeError if a project-scoped document lacks projects[projectKey]
     */
    static nlohmann::ordered_json& selectMergeRoot(nlohmann::ordered_json& document,
                                                   MergeStrategy strategy,
                                                   const std::string& projectKey);

    // Sets mergeRoot.mcpServers["mcp-unity"] from the fragment; siblings untouched
    static void mergeServers(nlohmann::ordered_json& mergeRoot, const nlohmann::ordered_json& fragment);

private:
    const InstallationResolver& resolver;
    const HostEnvironment& env;
    const Config& config;

    static SyncResult fail(SyncStatus status, const std::string& message, const std::filesystem::path& path);
};

const char* syncStatusName(SyncStatus status);
