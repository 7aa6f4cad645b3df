#include "clients/ClientTable.h"
#include "utils/Logger.h"
#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

namespace {
    std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }
}

const std::vector<ClientDescriptor>& ClientTable::all() {
    static const std::vector<ClientDescriptor> clients = {
        {"windsurf", "Windsurf",
         {BaseDir::UserProfile, ".codeium/windsurf"},
         {BaseDir::Home, "Library/Application Support/.codeium/windsurf"},
         "mcp_config.json", MergeStrategy::FlatRoot, false},
        {"claude-desktop", "Claude Desktop",
         {BaseDir::AppData, "Claude"},
         {BaseDir::Home, "Library/Application Support/Claude"},
         "claude_desktop_config.json", MergeStrategy::FlatRoot, false},
        {"cursor", "Cursor",
         {BaseDir::UserProfile, ".cursor"},
         {BaseDir::Home, ".cursor"},
         "mcp.json", MergeStrategy::FlatRoot, false},
        {"claude-code", "Claude Code",
         {BaseDir::UserProfile, ""},
         {BaseDir::Home, ""},
         ".claude.json", MergeStrategy::ProjectScoped, false},
        {"github-copilot", "GitHub Copilot",
         {BaseDir::ProjectRoot, ".vscode"},
         {BaseDir::ProjectRoot, ".vscode"},
         "mcp.json", MergeStrategy::FlatRoot, true},
    };
    return clients;
}

const ClientDescriptor* ClientTable::find(const std::string& idOrName) {
    const std::string key = toLower(idOrName);
    for (const auto& client : all()) {
        if (client.id == key || toLower(client.displayName) == key) {
            return &client;
        }
    }
    return nullptr;
}

fs::path ClientTable::baseDirectory(BaseDir base, const HostEnvironment& env) {
    switch (base) {
        case BaseDir::UserProfile: return env.userProfile;
        case BaseDir::AppData: return env.appData;
        case BaseDir::Home: return env.home;
        case BaseDir::ProjectRoot: return env.projectRoot;
    }
    return {};
}

std::optional<fs::path> ClientTable::resolveConfigPath(const ClientDescriptor& client,
                                                       const HostEnvironment& env) {
    const PathTemplate* tmpl = nullptr;
    if (client.anyPlatform || env.platform == Platform::Windows) {
        tmpl = &client.windows;
    } else if (env.platform == Platform::MacOS) {
        tmpl = &client.macos;
    } else {
        Logger::getInstance().error("Unsupported platform for " + client.displayName + " MCP config");
        return std::nullopt;
    }

    fs::path base = baseDirectory(tmpl->base, env);
    if (base.empty()) {
        Logger::getInstance().error("Cannot resolve the base directory for " + client.displayName +
                                    " MCP config on " + platformName(env.platform));
        return std::nullopt;
    }

    fs::path dir = tmpl->relative.empty() ? base : base / fs::u8path(tmpl->relative);
    return dir / fs::u8path(client.fileName);
}
