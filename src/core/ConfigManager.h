#pragma once
#include <string>
#include <vector>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <nlohmann/json.hpp>

/**
 * @brief Project settings for the MCP Unity synchronizer
 *
 * Stored as JSON under <project>/ProjectSettings/McpUnitySettings.json.
 * Every key is optional; missing keys keep the defaults below.
 */
struct Config {
    struct Package {
        std::string name = "com.gamelovers.mcp-unity";
        std::string serverDirectory = "Server~";
        std::string markerFile = "tsconfig";
    } package;

    struct Server {
        std::string launcherCommand = "node";
        std::vector<std::string> entry = {"build", "index.js"};
        bool useTabsIndentation = false;
    } server;

    struct Npm {
        std::string executablePath;   // empty: resolve "npm" through PATH
        int timeoutSeconds = 0;       // 0: wait for the process indefinitely
    } npm;

    struct Logging {
        std::string logFile = "mcp-unity.log";
        size_t maxEntries = 1000;
    } logging;

    static std::filesystem::path defaultPath(const std::filesystem::path& projectRoot) {
        return projectRoot / "ProjectSettings" / "McpUnitySettings.json";
    }

    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not open settings file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw std::runtime_error("JSON Parse Error in " + path.string() + ": " + e.what());
        }
        if (!j.is_object()) {
            throw std::runtime_error("Settings file " + path.string() + " must contain a JSON object");
        }

        Config cfg;
        try {
            cfg.package.name = j.value("package_name", cfg.package.name);
            cfg.package.serverDirectory = j.value("server_directory", cfg.package.serverDirectory);
            cfg.package.markerFile = j.value("marker_file", cfg.package.markerFile);

            cfg.server.launcherCommand = j.value("launcher_command", cfg.server.launcherCommand);
            if (j.contains("server_entry")) {
                cfg.server.entry = j["server_entry"].get<std::vector<std::string>>();
            }
            cfg.server.useTabsIndentation = j.value("use_tabs_indentation", cfg.server.useTabsIndentation);

            cfg.npm.executablePath = j.value("npm_executable_path", cfg.npm.executablePath);
            cfg.npm.timeoutSeconds = j.value("process_timeout_seconds", cfg.npm.timeoutSeconds);

            cfg.logging.logFile = j.value("log_file", cfg.logging.logFile);
            cfg.logging.maxEntries = j.value("max_log_entries", cfg.logging.maxEntries);
        } catch (const nlohmann::json::type_error& e) {
            throw std::runtime_error("Invalid value in " + path.string() + ": " + e.what());
        }

        if (cfg.npm.timeoutSeconds < 0) cfg.npm.timeoutSeconds = 0;
        if (cfg.logging.maxEntries == 0) cfg.logging.maxEntries = 1;
        return cfg;
    }

    // Missing file gives defaults; a broken file still throws
    static Config loadOrDefault(const std::string& pathStr) {
        if (!std::filesystem::exists(std::filesystem::u8path(pathStr))) {
            return Config{};
        }
        return load(pathStr);
    }

    nlohmann::json toJson() const {
        return {
            {"package_name", package.name},
            {"server_directory", package.serverDirectory},
            {"marker_file", package.markerFile},
            {"launcher_command", server.launcherCommand},
            {"server_entry", server.entry},
            {"use_tabs_indentation", server.useTabsIndentation},
            {"npm_executable_path", npm.executablePath},
            {"process_timeout_seconds", npm.timeoutSeconds},
            {"log_file", logging.logFile},
            {"max_log_entries", logging.maxEntries}
        };
    }

    void save(const std::string& pathStr) const {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        std::ofstream f(path);
        if (!f.is_open()) {
            throw std::runtime_error("Could not write settings file: " + pathStr);
        }
        f << toJson().dump(2);
    }
};
