#pragma once
#include <cstdint>
#include <string>
#include <functional>
#include <mutex>

enum class LogLevel {
    INFO,
    SUCCESS,
    WARNING,
    ERROR,
    DEBUG
};

/**
 * @brief Process-wide log channel
 *
 * Every line goes to the log file (if one is set) and the console, then to
 * the optional callback. The console log capture service listens through
 * the callback.
 */
class Logger {
public:
    using LogCallback = std::function<void(LogLevel, const std::string&)>;

    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    // Returns a token that clearCallback() accepts
    uint64_t setCallback(LogCallback callback) {
        std::lock_guard<std::mutex> lock(mtx);
        this->callback = callback;
        return ++callbackToken;
    }

    // Clears the callback only if it is still the one registered under token
    void clearCallback(uint64_t token) {
        std::lock_guard<std::mutex> lock(mtx);
        if (token == callbackToken) {
            callback = nullptr;
        }
    }

    // Empty path disables file output
    void setLogFile(const std::string& path) {
        std::lock_guard<std::mutex> lock(mtx);
        logFilePath = path;
    }

    void setConsoleEnabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mtx);
        consoleEnabled = enabled;
    }

    void log(LogLevel level, const std::string& message) {
        LogCallback cb;
        {
            std::lock_guard<std::mutex> lock(mtx);
            writeToFile(level, message);
            if (consoleEnabled) {
                printToConsole(level, message);
            }
            cb = callback;
        }
        if (cb) {
            cb(level, message);
        }
    }

    // Convenience methods
    void info(const std::string& m) { log(LogLevel::INFO, m); }
    void success(const std::string& m) { log(LogLevel::SUCCESS, m); }
    void warn(const std::string& m) { log(LogLevel::WARNING, m); }
    void error(const std::string& m) { log(LogLevel::ERROR, m); }
    void debug(const std::string& m) { log(LogLevel::DEBUG, m); }

    static const char* levelName(LogLevel level);

private:
    Logger() = default;
    LogCallback callback;
    uint64_t callbackToken = 0;
    std::mutex mtx;
    std::string logFilePath = "mcp-unity.log";
    bool consoleEnabled = true;

    void writeToFile(LogLevel level, const std::string& message);
    void printToConsole(LogLevel level, const std::string& message);
};
