#pragma once
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Tool interface
 *
 * Every tool exposed through tools/call implements this. A tool validates
 * its own arguments before touching the store and never throws for bad
 * input: failures come back as an error result.
 */
class ITool {
public:
    virtual ~ITool() = default;

    /**
     * @brief Unique tool name, as used in tools/call
     */
    virtual std::string getName() const = 0;

    /**
     * @brief Short description shown in the tool catalog
     */
    virtual std::string getDescription() const = 0;

    /**
     * @brief JSON-schema-like shape of the arguments object
     */
    virtual nlohmann::json getSchema() const = 0;

    /**
     * @brief Execute the tool
     * @param args Arguments object from tools/call
     * @return Tool result
     *
     * Result format:
     * {
     *   "content": [
     *     {"type": "text", "text": "..."}
     *   ]
     * }
     *
     * Error format:
     * {
     *   "content": [{"type": "text", "text": "one-line error"}],
     *   "isError": true
     * }
     */
    virtual nlohmann::json execute(const nlohmann::json& args) = 0;
};

namespace ToolResult {
    nlohmann::json text(const std::string& text);
    nlohmann::json error(const std::string& message);

    /** True when the result carries isError:true */
    bool isError(const nlohmann::json& result);

    /** Text of the first content block (empty if none) */
    std::string firstText(const nlohmann::json& result);

    /** Cut to maxLen characters, ending in "..." when shortened */
    std::string truncate(const std::string& s, size_t maxLen);
}
