#pragma once
#include <string>
#include <filesystem>

enum class Platform {
    Windows,
    MacOS,
    Linux,
    Unknown
};

/**
 * @brief The directories client config paths are built from
 *
 * detect() reads them from the running process. Tests fill the struct by
 * hand so every path is deterministic.
 */
struct HostEnvironment {
    Platform platform = Platform::Unknown;
    std::filesystem::path home;          // ~ on macOS/Linux
    std::filesystem::path userProfile;   // %USERPROFILE% on Windows
    std::filesystem::path appData;       // %APPDATA% on Windows
    std::filesystem::path projectRoot;   // Unity project (parent of Assets/)

    static Platform currentPlatform();
    static HostEnvironment detect(const std::filesystem::path& projectRoot);

    std::filesystem::path dataPath() const { return projectRoot / "Assets"; }
};

const char* platformName(Platform platform);
