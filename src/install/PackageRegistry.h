#pragma once
#include <string>
#include <optional>
#include <filesystem>

struct PackageInfo {
    std::string name;
    std::string resolvedPath;
    std::string source;   // "embedded", "local", "cache"
};

/**
 * @brief Lookup of packages installed through the package manager
 */
class IPackageRegistry {
public:
    virtual ~IPackageRegistry() = default;
    virtual std::optional<PackageInfo> findPackage(const std::string& name) const = 0;
};

/**
 * @brief Reads the Unity project layout on disk
 *
 * Search order:
 * 1. Packages/<name>               (embedded package)
 * 2. Packages/manifest.json        ("file:" dependency, relative to Packages/)
 * 3. Library/PackageCache/<name>@* (registry/git package, newest directory)
 */
class FileSystemPackageRegistry : public IPackageRegistry {
public:
    explicit FileSystemPackageRegistry(std::filesystem::path projectRoot);

    std::optional<PackageInfo> findPackage(const std::string& name) const override;

private:
    std::filesystem::path projectRoot;

    std::optional<PackageInfo> findEmbedded(const std::string& name) const;
    std::optional<PackageInfo> findLocalDependency(const std::string& name) const;
    std::optional<PackageInfo> findInCache(const std::string& name) const;
};
