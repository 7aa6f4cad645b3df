#pragma once
#include "ITool.h"

class IConsoleLogsService;

/**
 * @brief Paginated retrieval of captured console logs
 *
 * Parameters:
 * - logType (string, optional): "error", "warning", "info"
 * - offset (int, default 0): entries to skip, floored at 0
 * - limit (int, default 50): page size, clamped to 1..500
 * - includeStackTrace (bool, default true)
 */
class GetConsoleLogsTool : public ITool {
public:
    static constexpr int kDefaultLimit = 50;
    static constexpr int kMaxLimit = 500;

    explicit GetConsoleLogsTool(IConsoleLogsService& service);

    std::string getName() const override { return "get_console_logs"; }
    std::string getDescription() const override {
        return "Retrieves logs from the Unity console with pagination support to avoid token limits";
    }
    nlohmann::json getSchema() const override;
    nlohmann::json execute(const nlohmann::json& params) override;

private:
    IConsoleLogsService& service;
};
