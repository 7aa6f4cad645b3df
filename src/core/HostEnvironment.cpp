#include "core/HostEnvironment.h"
#include <cstdlib>
#include <system_error>

namespace fs = std::filesystem;

namespace {
    fs::path envPath(const char* name) {
        const char* value = std::getenv(name);
        if (!value || !*value) return {};
        return fs::u8path(value);
    }
}

Platform HostEnvironment::currentPlatform() {
#if defined(_WIN32)
    return Platform::Windows;
#elif defined(__APPLE__)
    return Platform::MacOS;
#elif defined(__linux__)
    return Platform::Linux;
#else
    return Platform::Unknown;
#endif
}

HostEnvironment HostEnvironment::detect(const fs::path& projectRoot) {
    HostEnvironment env;
    env.platform = currentPlatform();

    std::error_code ec;
    env.projectRoot = fs::absolute(projectRoot, ec);
    if (ec) env.projectRoot = projectRoot;

    env.home = envPath("HOME");
    env.userProfile = envPath("USERPROFILE");
    env.appData = envPath("APPDATA");

    if (env.platform == Platform::Windows) {
        if (env.userProfile.empty()) env.userProfile = env.home;
        if (env.home.empty()) env.home = env.userProfile;
        if (env.appData.empty() && !env.userProfile.empty()) {
            env.appData = env.userProfile / "AppData" / "Roaming";
        }
    } else {
        if (env.userProfile.empty()) env.userProfile = env.home;
    }
    return env;
}

const char* platformName(Platform platform) {
    switch (platform) {
        case Platform::Windows: return "Windows";
        case Platform::MacOS: return "macOS";
        case Platform::Linux: return "Linux";
        case Platform::Unknown: return "Unknown";
    }
    return "Unknown";
}
