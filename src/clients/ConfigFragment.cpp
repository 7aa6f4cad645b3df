#include "clients/ConfigFragment.h"
#include "install/InstallationResolver.h"
#include "utils/PathUtils.h"

std::string ConfigFragment::serverEntry(const std::string& serverPath, const Config& config) {
    std::string entry = serverPath;
    for (const auto& segment : config.server.entry) {
        if (!entry.empty() && entry.back() != '/' && entry.back() != '\\') entry += '/';
        entry += segment;
    }
    return entry;
}

nlohmann::ordered_json ConfigFragment::document(const std::string& serverPath, const Config& config) {
    nlohmann::ordered_json server;
    server["command"] = config.server.launcherCommand;
    server["args"] = nlohmann::ordered_json::array({serverEntry(serverPath, config)});

    nlohmann::ordered_json servers;
    servers[kServerKey] = server;

    nlohmann::ordered_json doc;
    doc[kServersKey] = servers;
    return doc;
}

std::string ConfigFragment::build(const std::string& serverPath, bool useTabs, const Config& config) {
    nlohmann::ordered_json doc = document(serverPath, config);
    std::string text = useTabs ? doc.dump(1, '\t') : doc.dump(2, ' ');

    // TODO: canonicalize the path value before serialization instead, this also rewrites "//" inside URLs
    text = PathUtils::replaceAll(text, "\\", "/");
    return PathUtils::replaceAll(text, "//", "/");
}

std::string ConfigFragment::generate(const InstallationResolver& resolver, bool useTabs, const Config& config) {
    return build(resolver.resolveServerPath(), useTabs, config);
}
