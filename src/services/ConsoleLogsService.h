#pragma once
#include <string>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <nlohmann/json.hpp>
#include "utils/Logger.h"

/**
 * @brief Source of captured console output for the log retrieval tool
 */
class IConsoleLogsService {
public:
    virtual ~IConsoleLogsService() = default;

    /**
     * @brief One page of log entries, newest first
     * @param logType "error", "warning", "info" (or "log"); nullopt for all
     * @return {
     *   "logs": [{"message", "stackTrace"?, "type", "timestamp"}],
     *   "_totalCount": N, "_filteredCount": F, "_returnedCount": R
     * }
     */
    virtual nlohmann::json getLogsAsJson(const std::optional<std::string>& logType,
                                         int offset, int limit, bool includeStackTrace) = 0;
};

struct LogEntry {
    std::string message;
    std::string stackTrace;
    std::string type;
    std::string timestamp;
};

/**
 * @brief Bounded in-memory capture of everything the Logger emits
 *
 * Oldest entries are dropped once maxEntries is reached.
 */
class ConsoleLogsService : public IConsoleLogsService {
public:
    explicit ConsoleLogsService(size_t maxEntries = 1000);
    ~ConsoleLogsService() override;

    // Hooks into the Logger callback. The most recent attach() receives the
    // lines; detaching an older service leaves the newer hook in place.
    void attach();
    void detach();

    void record(const std::string& type, const std::string& message, const std::string& stackTrace = "");
    void record(LogLevel level, const std::string& message);

    void clear();
    size_t count() const;

    nlohmann::json getLogsAsJson(const std::optional<std::string>& logType,
                                 int offset, int limit, bool includeStackTrace) override;

    static std::string typeForLevel(LogLevel level);

private:
    size_t maxEntries;
    std::deque<LogEntry> entries;
    mutable std::mutex mtx;
    bool attached = false;
    uint64_t callbackToken = 0;

    static bool matchesType(const std::string& entryType, const std::string& filter);
};
