#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace ToolResponse {

    // Error kinds carried in "errorCode"
    constexpr const char* kToolExecutionError = "tool_execution_error";
    constexpr const char* kUnknownTool = "unknown_tool";
    constexpr const char* kInvalidRequest = "invalid_request";

    inline nlohmann::json error(const std::string& message, const std::string& code) {
        return {
            {"success", false},
            {"errorCode", code},
            {"errorMessage", message}
        };
    }

    inline bool isSuccess(const nlohmann::json& response) {
        if (!response.is_object()) return false;
        auto it = response.find("success");
        return it != response.end() && it->is_boolean() && it->get<bool>();
    }
}
