#pragma once
#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "core/HostEnvironment.h"

enum class BaseDir {
    UserProfile,
    AppData,
    Home,
    ProjectRoot
};

struct PathTemplate {
    BaseDir base;
    std::string relative;   // forward-slash separated, may be empty
};

enum class MergeStrategy {
    FlatRoot,        // mcpServers lives at the document root
    ProjectScoped    // mcpServers lives under projects[<server parent dir>]
};

/**
 * @brief One supported AI client and where it keeps its MCP config
 *
 * Adding a client is a new row in ClientTable::all(), nothing else.
 */
struct ClientDescriptor {
    std::string id;
    std::string displayName;
    PathTemplate windows;
    PathTemplate macos;
    std::string fileName;
    MergeStrategy strategy = MergeStrategy::FlatRoot;
    bool anyPlatform = false;   // path does not depend on the OS (workspace files)
};

class ClientTable {
public:
    static const std::vector<ClientDescriptor>& all();

    // Matches the id or the display name, case-insensitively
    static const ClientDescriptor* find(const std::string& idOrName);

    /**
     * @brief Absolute config file path for the client on this host
     * @return nullopt on an unsupported platform (logged); callers stop there
     */
    static std::optional<std::filesystem::path> resolveConfigPath(const ClientDescriptor& client,
                                                                  const HostEnvironment& env);

private:
    static std::filesystem::path baseDirectory(BaseDir base, const HostEnvironment& env);
};
