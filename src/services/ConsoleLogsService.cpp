#include "services/ConsoleLogsService.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace {
    std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::string nowTimestamp() {
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::ostringstream ss;
        ss << std::put_time(std::localtime(&now), "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }
}

ConsoleLogsService::ConsoleLogsService(size_t maxEntries)
    : maxEntries(std::max<size_t>(1, maxEntries)) {}

ConsoleLogsService::~ConsoleLogsService() {
    detach();
}

void ConsoleLogsService::attach() {
    uint64_t token = Logger::getInstance().setCallback([this](LogLevel level, const std::string& message) {
        record(level, message);
    });
    std::lock_guard<std::mutex> lock(mtx);
    attached = true;
    callbackToken = token;
}

void ConsoleLogsService::detach() {
    uint64_t token = 0;
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (!attached) return;
        attached = false;
        token = callbackToken;
    }
    // A service attached after this one keeps its hook
    Logger::getInstance().clearCallback(token);
}

std::string ConsoleLogsService::typeForLevel(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "error";
        case LogLevel::WARNING: return "warning";
        default: return "info";
    }
}

void ConsoleLogsService::record(LogLevel level, const std::string& message) {
    record(typeForLevel(level), message);
}

void ConsoleLogsService::record(const std::string& type, const std::string& message, const std::string& stackTrace) {
    std::lock_guard<std::mutex> lock(mtx);
    entries.push_back({message, stackTrace, type, nowTimestamp()});
    while (entries.size() > maxEntries) {
        entries.pop_front();
    }
}

void ConsoleLogsService::clear() {
    std::lock_guard<std::mutex> lock(mtx);
    entries.clear();
}

size_t ConsoleLogsService::count() const {
    std::lock_guard<std::mutex> lock(mtx);
    return entries.size();
}

bool ConsoleLogsService::matchesType(const std::string& entryType, const std::string& filter) {
    std::string f = toLower(filter);
    if (f == "log") f = "info";
    return entryType == f;
}

nlohmann::json ConsoleLogsService::getLogsAsJson(const std::optional<std::string>& logType,
                                                 int offset, int limit, bool includeStackTrace) {
    std::lock_guard<std::mutex> lock(mtx);

    offset = std::max(0, offset);
    limit = std::max(0, limit);

    nlohmann::json logs = nlohmann::json::array();
    int filtered = 0;
    int returned = 0;

    // Newest first
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        if (logType && !matchesType(it->type, *logType)) continue;

        if (filtered >= offset && returned < limit) {
            nlohmann::json entry;
            entry["message"] = it->message;
            if (includeStackTrace) {
                entry["stackTrace"] = it->stackTrace;
            }
            entry["type"] = it->type;
            entry["timestamp"] = it->timestamp;
            logs.push_back(entry);
            ++returned;
        }
        ++filtered;
    }

    nlohmann::json result;
    result["logs"] = logs;
    result["_totalCount"] = static_cast<int>(entries.size());
    result["_filteredCount"] = filtered;
    result["_returnedCount"] = returned;
    return result;
}
