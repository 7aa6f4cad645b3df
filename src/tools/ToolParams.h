#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

/**
 * @brief Lenient readers for tool parameters
 *
 * Each reader accepts the native JSON type or its textual form and falls
 * back to the default on a missing, null or unparsable value.
 */
namespace ToolParams {

    // String form of the value; blank or missing gives nullopt
    std::optional<std::string> getString(const nlohmann::json& params, const std::string& key);

    // 42, 42.0 and "42" all parse; 4.2, "x", true give the default
    int getInt(const nlohmann::json& params, const std::string& key, int defaultValue);

    // true and "True" both parse; 1, "yes" give the default
    bool getBool(const nlohmann::json& params, const std::string& key, bool defaultValue);
}
