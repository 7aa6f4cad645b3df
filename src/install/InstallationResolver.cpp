#include "install/InstallationResolver.h"
#include "utils/Logger.h"
#include "utils/PathUtils.h"
#include <exception>

namespace fs = std::filesystem;

InstallationResolver::InstallationResolver(const Config& config,
                                           const HostEnvironment& env,
                                           const IPackageRegistry& registry,
                                           const IAssetIndex& assets)
    : config(config), env(env), registry(registry), assets(assets) {}

std::optional<InstallationInfo> InstallationResolver::resolve() const {
    try {
        if (auto info = fromPackageRegistry()) return info;
        if (auto info = fromAssetIndex()) return info;
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("[MCP Unity] Server lookup failed: ") + e.what());
    }

    Logger::getInstance().error(kServerNotFoundError);
    return std::nullopt;
}

std::string InstallationResolver::resolveServerPath() const {
    auto info = resolve();
    if (!info) return kServerNotFoundError;
    return info->serverPath;
}

std::optional<InstallationInfo> InstallationResolver::fromPackageRegistry() const {
    auto package = registry.findPackage(config.package.name);
    if (!package || package->resolvedPath.empty()) return std::nullopt;

    fs::path serverPath = PathUtils::fromUtf8(package->resolvedPath) / PathUtils::fromUtf8(config.package.serverDirectory);
    return InstallationInfo{PathUtils::normalize(serverPath), InstallMode::PackageRegistry};
}

std::optional<InstallationInfo> InstallationResolver::fromAssetIndex() const {
    auto matches = assets.findAssets(config.package.markerFile);

    if (matches.size() == 1) {
        std::string markerPath = absoluteAssetPath(matches[0]);
        return InstallationInfo{PathUtils::parentPath(markerPath), InstallMode::LooseAsset};
    }

    // Several projects ship a tsconfig; take the one inside the server directory
    for (const auto& match : matches) {
        std::string serverDir = PathUtils::parentPath(absoluteAssetPath(match));
        if (PathUtils::fileName(serverDir) == config.package.serverDirectory) {
            return InstallationInfo{serverDir, InstallMode::LooseAsset};
        }
    }
    return std::nullopt;
}

std::string InstallationResolver::absoluteAssetPath(const std::string& relativePath) const {
    // Asset paths are relative to the project root (Application.dataPath/..)
    return PathUtils::normalize(env.dataPath() / ".." / PathUtils::fromUtf8(relativePath));
}

const char* installModeName(InstallMode mode) {
    switch (mode) {
        case InstallMode::PackageRegistry: return "package";
        case InstallMode::LooseAsset: return "assets";
    }
    return "unknown";
}
