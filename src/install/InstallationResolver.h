#pragma once
#include <string>
#include <optional>
#include "core/ConfigManager.h"
#include "core/HostEnvironment.h"
#include "install/PackageRegistry.h"
#include "install/AssetIndex.h"

enum class InstallMode {
    PackageRegistry,
    LooseAsset
};

struct InstallationInfo {
    std::string serverPath;   // normalized, forward slashes
    InstallMode mode = InstallMode::PackageRegistry;
};

/**
 * @brief Locates the MCP server directory (the one holding package.json)
 *
 * Works whether the package came through the package manager or sits as a
 * loose folder under Assets/. Nothing is cached: every call reflects the
 * current disk state.
 */
class InstallationResolver {
public:
    static constexpr const char* kServerNotFoundError =
        "[MCP Unity] Could not locate Server directory. Please check the installation of the MCP Unity package.";

    InstallationResolver(const Config& config,
                         const HostEnvironment& env,
                         const IPackageRegistry& registry,
                         const IAssetIndex& assets);

    /**
     * @brief Runs the lookup strategies in priority order
     * @return The installation, or nullopt after logging a diagnostic
     */
    std::optional<InstallationInfo> resolve() const;

    /**
     * @brief Server path, or kServerNotFoundError when nothing matched
     *
     * Never throws.
     */
    std::string resolveServerPath() const;

private:
    const Config& config;
    const HostEnvironment& env;
    const IPackageRegistry& registry;
    const IAssetIndex& assets;

    std::optional<InstallationInfo> fromPackageRegistry() const;
    std::optional<InstallationInfo> fromAssetIndex() const;
    std::string absoluteAssetPath(const std::string& relativePath) const;
};

const char* installModeName(InstallMode mode);
