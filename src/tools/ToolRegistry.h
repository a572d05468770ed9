#pragma once
#include <string>
#include <memory>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "ITool.h"

/**
 * @brief Tool registry
 *
 * Owns every tool, keeps them in registration order for the catalog and
 * routes tools/call by name.
 */
class ToolRegistry {
public:
    ToolRegistry() = default;
    ~ToolRegistry() = default;

    /**
     * @brief Register a tool
     * @param tool Tool instance (ownership transferred). A tool with the same
     *             name replaces the earlier one in place.
     */
    void registerTool(std::unique_ptr<ITool> tool);

    /**
     * @brief Look up a tool
     * @return nullptr if no tool has that name
     */
    ITool* getTool(const std::string& name);

    /**
     * @brief Tool catalog, in registration order
     *
     * Format:
     * [
     *   {
     *     "name": "tool_name",
     *     "description": "...",
     *     "inputSchema": { JSON Schema }
     *   }
     * ]
     */
    nlohmann::json listToolSchemas() const;

    /**
     * @brief Execute a tool
     *
     * Unknown names and exceptions escaping the tool become an error result
     * ({"content": [...], "isError": true}).
     */
    nlohmann::json executeTool(const std::string& name, const nlohmann::json& args);

    size_t getToolCount() const { return tools.size(); }

    bool hasTool(const std::string& name) const;

private:
    std::vector<std::unique_ptr<ITool>> tools;
    std::unordered_map<std::string, size_t> index;
};
