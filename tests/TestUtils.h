#pragma once
#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include "core/HostEnvironment.h"
#include "install/PackageRegistry.h"
#include "install/AssetIndex.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;

namespace testutil {

inline fs::path makeTempDir(const std::string& tag) {
    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path dir = fs::temp_directory_path() / fs::path("mcp_unity_" + tag + "_" + std::to_string(now));
    fs::create_directories(dir);
    return dir;
}

inline void writeFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream f(path, std::ios::binary);
    f << content;
}

inline std::string readFile(const fs::path& path) {
    std::ifstream f(path, std::ios::binary);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

// Normalized text of a temp path (macOS temp dirs are symlinked; keep what we were given)
inline std::string slashes(const fs::path& path) {
    std::string s = path.u8string();
    for (auto& c : s) {
        if (c == '\\') c = '/';
    }
    return s;
}

inline void quietLogger() {
    Logger::getInstance().setLogFile("");
    Logger::getInstance().setConsoleEnabled(false);
    Logger::getInstance().setCallback(nullptr);
}

class FakePackageRegistry : public IPackageRegistry {
public:
    std::map<std::string, PackageInfo> packages;

    std::optional<PackageInfo> findPackage(const std::string& name) const override {
        auto it = packages.find(name);
        if (it == packages.end()) return std::nullopt;
        return it->second;
    }
};

class FakeAssetIndex : public IAssetIndex {
public:
    std::vector<std::string> results;

    std::vector<std::string> findAssets(const std::string&) const override {
        return results;
    }
};

inline HostEnvironment macEnvironment(const fs::path& root) {
    HostEnvironment env;
    env.platform = Platform::MacOS;
    env.home = root / "home";
    env.userProfile = env.home;
    env.projectRoot = root / "project";
    return env;
}

inline HostEnvironment windowsEnvironment(const fs::path& root) {
    HostEnvironment env;
    env.platform = Platform::Windows;
    env.userProfile = root / "Users" / "dev";
    env.home = env.userProfile;
    env.appData = env.userProfile / "AppData" / "Roaming";
    env.projectRoot = root / "project";
    return env;
}

}
