#include "ToolRegistry.h"
#include "ToolResponse.h"
#include "utils/Logger.h"
#include <algorithm>

void ToolRegistry::registerTool(std::unique_ptr<ITool> tool) {
    if (!tool) return;

    std::string name = tool->getName();
    if (tools.count(name)) {
        Logger::getInstance().warn("[MCP Unity] Replacing already registered tool: " + name);
    }

    tools[name] = std::move(tool);
}

ITool* ToolRegistry::getTool(const std::string& name) {
    auto it = tools.find(name);
    if (it == tools.end()) {
        return nullptr;
    }
    return it->second.get();
}

std::vector<nlohmann::json> ToolRegistry::listToolSchemas() const {
    std::vector<nlohmann::json> schemas;

    for (const auto& [name, tool] : tools) {
        nlohmann::json schema;
        schema["name"] = name;
        schema["description"] = tool->getDescription();
        schema["inputSchema"] = tool->getSchema();
        schemas.push_back(schema);
    }

    std::sort(schemas.begin(), schemas.end(), [](const nlohmann::json& a, const nlohmann::json& b) {
        return a["name"].get<std::string>() < b["name"].get<std::string>();
    });
    return schemas;
}

nlohmann::json ToolRegistry::executeTool(const std::string& name, const nlohmann::json& params) {
    ITool* tool = getTool(name);
    if (!tool) {
        return ToolResponse::error("Tool not found: " + name, ToolResponse::kUnknownTool);
    }

    try {
        return tool->execute(params.is_null() ? nlohmann::json::object() : params);
    } catch (const std::exception& e) {
        Logger::getInstance().error("[MCP Unity] Tool " + name + " failed: " + e.what());
        return ToolResponse::error(std::string("Tool execution failed: ") + e.what(),
                                   ToolResponse::kToolExecutionError);
    }
}

nlohmann::json ToolRegistry::dispatch(const nlohmann::json& request) {
    if (!request.is_object()) {
        return ToolResponse::error("Request must be a JSON object", ToolResponse::kInvalidRequest);
    }

    std::string name;
    for (const char* key : {"method", "tool"}) {
        auto it = request.find(key);
        if (it != request.end() && it->is_string()) {
            name = it->get<std::string>();
            break;
        }
    }
    if (name.empty()) {
        return ToolResponse::error("Request is missing the tool name ('method')", ToolResponse::kInvalidRequest);
    }

    auto params = request.find("params");
    if (params != request.end() && !params->is_null() && !params->is_object()) {
        return ToolResponse::error("'params' must be a JSON object", ToolResponse::kInvalidRequest);
    }
    return executeTool(name, params == request.end() ? nlohmann::json::object() : *params);
}

bool ToolRegistry::hasTool(const std::string& name) const {
    return tools.count(name) > 0;
}
