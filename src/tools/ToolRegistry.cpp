#include "ToolRegistry.h"
#include "utils/Logger.h"

void ToolRegistry::registerTool(std::unique_ptr<ITool> tool) {
    if (!tool) return;

    std::string name = tool->getName();
    auto it = index.find(name);
    if (it != index.end()) {
        Logger::getInstance().warn("Tool registered twice, replacing: " + name);
        tools[it->second] = std::move(tool);
        return;
    }

    index[name] = tools.size();
    tools.push_back(std::move(tool));
}

ITool* ToolRegistry::getTool(const std::string& name) {
    auto it = index.find(name);
    if (it == index.end()) {
        return nullptr;
    }
    return tools[it->second].get();
}

nlohmann::json ToolRegistry::listToolSchemas() const {
    nlohmann::json schemas = nlohmann::json::array();

    for (const auto& tool : tools) {
        schemas.push_back({
            {"name", tool->getName()},
            {"description", tool->getDescription()},
            {"inputSchema", tool->getSchema()}
        });
    }

    return schemas;
}

nlohmann::json ToolRegistry::executeTool(const std::string& name, const nlohmann::json& args) {
    ITool* tool = getTool(name);
    if (!tool) {
        return ToolResult::error("Unknown tool: " + name);
    }

    try {
        return tool->execute(args);
    } catch (const std::exception& e) {
        Logger::getInstance().error("Tool " + name + " failed: " + e.what());
        return ToolResult::error(std::string("Tool execution failed: ") + e.what());
    }
}

bool ToolRegistry::hasTool(const std::string& name) const {
    return index.count(name) > 0;
}
