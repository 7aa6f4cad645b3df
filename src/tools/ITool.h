#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief A named operation a remote caller can invoke against the editor
 *
 * Parameters and results are plain JSON passed by value; a tool keeps no
 * state between calls.
 */
class ITool {
public:
    virtual ~ITool() = default;

    /**
     * @brief Unique tool name used for dispatch (e.g. "get_console_logs")
     */
    virtual std::string getName() const = 0;

    /**
     * @brief Short description for the remote client
     */
    virtual std::string getDescription() const = 0;

    /**
     * @brief JSON Schema of the accepted parameters
     */
    virtual nlohmann::json getSchema() const = 0;

    /**
     * @brief Runs the tool
     * @param params Parameter object (may be null or missing keys)
     * @return Result object
     *
     * Success:
     * {
     *   "success": true,
     *   ...payload...
     * }
     *
     * Failure:
     * {
     *   "success": false,
     *   "errorCode": "tool_execution_error",
     *   "errorMessage": "..."
     * }
     */
    virtual nlohmann::json execute(const nlohmann::json& params) = 0;
};
