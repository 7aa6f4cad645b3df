#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "core/ConfigManager.h"

class InstallationResolver;

/**
 * @brief Builds the server registration that gets merged into client configs
 *
 * {
 *   "mcpServers": {
 *     "mcp-unity": {
 *       "command": "node",
 *       "args": ["<serverPath>/build/index.js"]
 *     }
 *   }
 * }
 */
class ConfigFragment {
public:
    static constexpr const char* kServerKey = "mcp-unity";
    static constexpr const char* kServersKey = "mcpServers";

    // "<serverPath>/build/index.js" with the configured entry segments
    static std::string serverEntry(const std::string& serverPath, const Config& config);

    static nlohmann::ordered_json document(const std::string& serverPath, const Config& config);

    /**
     * @brief Serializes the fragment
     * @param useTabs one tab per level when true, two spaces otherwise
     *
     * Every backslash in the output becomes '/', then every "//" becomes '/'.
     */
    static std::string build(const std::string& serverPath, bool useTabs, const Config& config);

    // Resolves the server path first; an unresolved path embeds the resolver's error text
    static std::string generate(const InstallationResolver& resolver, bool useTabs, const Config& config);
};
