#include "GetConsoleLogsTool.h"
#include "ToolParams.h"
#include "ToolResponse.h"
#include "services/ConsoleLogsService.h"
#include <algorithm>
#include <stdexcept>

GetConsoleLogsTool::GetConsoleLogsTool(IConsoleLogsService& service) : service(service) {}

nlohmann::json GetConsoleLogsTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"logType", {
                {"type", "string"},
                {"enum", {"error", "warning", "info"}},
                {"description", "The type of logs to retrieve (omit for all)"}
            }},
            {"offset", {
                {"type", "integer"},
                {"minimum", 0},
                {"default", 0},
                {"description", "Starting index for pagination"}
            }},
            {"limit", {
                {"type", "integer"},
                {"minimum", 1},
                {"maximum", kMaxLimit},
                {"default", kDefaultLimit},
                {"description", "Maximum number of logs to return"}
            }},
            {"includeStackTrace", {
                {"type", "boolean"},
                {"default", true},
                {"description", "Whether to include stack traces in the logs"}
            }}
        }}
    };
}

nlohmann::json GetConsoleLogsTool::execute(const nlohmann::json& params) {
    try {
        std::optional<std::string> logType = ToolParams::getString(params, "logType");
        int offset = ToolParams::getInt(params, "offset", 0);
        int limit = ToolParams::getInt(params, "limit", kDefaultLimit);
        bool includeStackTrace = ToolParams::getBool(params, "includeStackTrace", true);

        offset = std::max(0, offset);
        limit = std::max(1, std::min(kMaxLimit, limit));

        nlohmann::json result = service.getLogsAsJson(logType, offset, limit, includeStackTrace);
        if (!result.is_object()) {
            throw std::runtime_error("log service returned a non-object result");
        }

        std::string typeFilter = logType ? " of type '" + *logType + "'" : "";
        int returnedCount = result.value("_returnedCount", 0);
        int filteredCount = result.value("_filteredCount", 0);
        int totalCount = result.value("_totalCount", 0);

        result["message"] = "Retrieved " + std::to_string(returnedCount) + " of " + std::to_string(filteredCount) +
                            " log entries" + typeFilter +
                            " (offset: " + std::to_string(offset) +
                            ", limit: " + std::to_string(limit) +
                            ", includeStackTrace: " + (includeStackTrace ? "true" : "false") +
                            ", total: " + std::to_string(totalCount) + ")";
        result["success"] = true;

        // The counts now live in the message
        result.erase("_totalCount");
        result.erase("_filteredCount");
        result.erase("_returnedCount");

        return result;
    } catch (const std::exception& e) {
        return ToolResponse::error(std::string("Failed to get console logs: ") + e.what(),
                                   ToolResponse::kToolExecutionError);
    }
}
