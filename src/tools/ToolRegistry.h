#pragma once
#include <string>
#include <memory>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "ITool.h"

/**
 * @brief Registry and single entry point of the tool layer
 *
 * Remote requests arrive here by name. Whatever happens inside a tool, the
 * caller gets a JSON object carrying "success".
 */
class ToolRegistry {
public:
    ToolRegistry() = default;
    ~ToolRegistry() = default;

    /**
     * @brief Registers a tool, replacing any tool with the same name
     * @param tool Tool instance (ownership moves to the registry)
     */
    void registerTool(std::unique_ptr<ITool> tool);

    /**
     * @brief Looks a tool up by name
     * @return nullptr if not registered
     */
    ITool* getTool(const std::string& name);

    /**
     * @brief Schemas of all tools, sorted by name
     *
     * [
     *   {
     *     "name": "tool_name",
     *     "description": "...",
     *     "inputSchema": { JSON Schema }
     *   }
     * ]
     */
    std::vector<nlohmann::json> listToolSchemas() const;

    /**
     * @brief Executes a tool
     *
     * Unknown name: {"success": false, "errorCode": "unknown_tool", ...}
     * Escaped exception: {"success": false, "errorCode": "tool_execution_error", ...}
     */
    nlohmann::json executeTool(const std::string& name, const nlohmann::json& params);

    /**
     * @brief Executes a request object {"method": name, "params": {...}}
     *
     * "tool" is accepted in place of "method".
     */
    nlohmann::json dispatch(const nlohmann::json& request);

    size_t getToolCount() const { return tools.size(); }

    bool hasTool(const std::string& name) const;

private:
    std::unordered_map<std::string, std::unique_ptr<ITool>> tools;
};
