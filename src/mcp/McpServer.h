#pragma once
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "mcp/OutputChannel.h"
#include "tools/ToolRegistry.h"

/**
 * @brief JSON-RPC 2.0 server over a line-delimited stream
 *
 * Requests are handled strictly one at a time: read a line, dispatch,
 * write at most one response line. Supported methods: initialize,
 * initialized (and notifications/initialized), tools/list, tools/call, ping.
 */
class McpServer {
public:
    static constexpr const char* ProtocolVersion = "2024-11-05";
    static constexpr const char* ServerName = "engram";
    static constexpr const char* ServerVersion = "0.1.0";

    // JSON-RPC error codes
    static constexpr int ParseError = -32700;
    static constexpr int MethodNotFound = -32601;
    static constexpr int InvalidParams = -32602;
    static constexpr int InternalError = -32603;

    McpServer(ToolRegistry& registry, std::istream& in, std::shared_ptr<OutputChannel> out);

    /**
     * @brief Serve until end of input
     * @throws std::runtime_error if the input stream fails for any other reason
     */
    void run();

    /**
     * @brief Handle one raw request line
     * @return The response envelope, or nothing for notifications
     */
    std::optional<nlohmann::json> handleLine(const std::string& line);

    /**
     * @brief Handle one decoded request
     */
    std::optional<nlohmann::json> handleRequest(const nlohmann::json& request);

private:
    ToolRegistry& registry;
    std::istream& in;
    std::shared_ptr<OutputChannel> out;

    nlohmann::json handleInitialize() const;
    nlohmann::json handleToolsList() const;
    nlohmann::json handleToolsCall(const nlohmann::json& id, const nlohmann::json& params);

    static nlohmann::json makeResult(const nlohmann::json& id, const nlohmann::json& result);
    static nlohmann::json makeError(const nlohmann::json& id, int code, const std::string& message,
                                    const nlohmann::json& data = nullptr);
};
