#include "install/PackageRegistry.h"
#include "utils/Logger.h"
#include <fstream>
#include <system_error>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

FileSystemPackageRegistry::FileSystemPackageRegistry(fs::path projectRoot)
    : projectRoot(std::move(projectRoot)) {}

std::optional<PackageInfo> FileSystemPackageRegistry::findPackage(const std::string& name) const {
    if (name.empty()) return std::nullopt;

    if (auto embedded = findEmbedded(name)) return embedded;
    if (auto local = findLocalDependency(name)) return local;
    return findInCache(name);
}

std::optional<PackageInfo> FileSystemPackageRegistry::findEmbedded(const std::string& name) const {
    std::error_code ec;
    fs::path dir = projectRoot / "Packages" / fs::u8path(name);
    if (!fs::is_directory(dir, ec)) return std::nullopt;
    return PackageInfo{name, dir.u8string(), "embedded"};
}

std::optional<PackageInfo> FileSystemPackageRegistry::findLocalDependency(const std::string& name) const {
    fs::path manifestPath = projectRoot / "Packages" / "manifest.json";
    std::ifstream f(manifestPath);
    if (!f.is_open()) return std::nullopt;

    nlohmann::json manifest;
    try {
        manifest = nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        Logger::getInstance().warn("[MCP Unity] Ignoring unreadable package manifest " +
                                   manifestPath.u8string() + ": " + e.what());
        return std::nullopt;
    }

    if (!manifest.contains("dependencies") || !manifest["dependencies"].is_object()) return std::nullopt;
    const auto& deps = manifest["dependencies"];
    auto it = deps.find(name);
    if (it == deps.end() || !it->is_string()) return std::nullopt;

    const std::string ref = it->get<std::string>();
    const std::string prefix = "file:";
    if (ref.compare(0, prefix.size(), prefix) != 0) return std::nullopt;

    fs::path target = fs::u8path(ref.substr(prefix.size()));
    if (target.is_relative()) {
        target = projectRoot / "Packages" / target;
    }
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(target, ec);
    if (ec) canonical = target.lexically_normal();
    if (!fs::is_directory(canonical, ec)) return std::nullopt;

    return PackageInfo{name, canonical.u8string(), "local"};
}

std::optional<PackageInfo> FileSystemPackageRegistry::findInCache(const std::string& name) const {
    fs::path cacheDir = projectRoot / "Library" / "PackageCache";
    std::error_code ec;
    if (!fs::is_directory(cacheDir, ec)) return std::nullopt;

    const std::string prefix = name + "@";
    fs::path best;
    fs::file_time_type bestTime{};
    for (const auto& entry : fs::directory_iterator(cacheDir, ec)) {
        if (!entry.is_directory(ec)) continue;
        const std::string dirName = entry.path().filename().u8string();
        if (dirName.compare(0, prefix.size(), prefix) != 0) continue;

        auto t = fs::last_write_time(entry.path(), ec);
        if (ec) continue;
        if (best.empty() || t > bestTime) {
            best = entry.path();
            bestTime = t;
        }
    }
    if (best.empty()) return std::nullopt;
    return PackageInfo{name, best.u8string(), "cache"};
}
