#pragma once
#include <string>
#include <vector>
#include <filesystem>

/**
 * @brief Search over the project's assets by file stem
 *
 * Results are project-relative paths with forward slashes
 * (e.g. "Assets/mcp-unity/Server~/tsconfig.json").
 */
class IAssetIndex {
public:
    virtual ~IAssetIndex() = default;
    virtual std::vector<std::string> findAssets(const std::string& stem) const = 0;
};

class FileSystemAssetIndex : public IAssetIndex {
public:
    explicit FileSystemAssetIndex(std::filesystem::path projectRoot);

    // Walks Assets/ recursively; hidden directories and node_modules are skipped
    std::vector<std::string> findAssets(const std::string& stem) const override;

private:
    std::filesystem::path projectRoot;
};
