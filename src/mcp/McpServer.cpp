#include "mcp/McpServer.h"
#include "utils/Logger.h"
#include <stdexcept>

McpServer::McpServer(ToolRegistry& registry, std::istream& in, std::shared_ptr<OutputChannel> out)
    : registry(registry), in(in), out(std::move(out)) {}

void McpServer::run() {
    std::string line;
    while (true) {
        if (!std::getline(in, line)) {
            if (in.bad()) {
                throw std::runtime_error("read error on input stream");
            }
            Logger::getInstance().info("Input closed, stopping server loop");
            return;
        }

        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }

        auto response = handleLine(line);
        if (response) {
            out->writeLine(*response);
        }
    }
}

std::optional<nlohmann::json> McpServer::handleLine(const std::string& line) {
    nlohmann::json request = nlohmann::json::parse(line, nullptr, false);
    if (request.is_discarded() || !request.is_object()) {
        Logger::getInstance().warn("Unparseable request line dropped");
        return makeError(nullptr, ParseError, "Parse error");
    }
    auto method = request.find("method");
    if (method != request.end() && !method->is_string()) {
        return makeError(nullptr, ParseError, "Parse error");
    }
    return handleRequest(request);
}

std::optional<nlohmann::json> McpServer::handleRequest(const nlohmann::json& request) {
    nlohmann::json id = request.contains("id") ? request["id"] : nlohmann::json(nullptr);
    std::string method = request.value("method", "");
    nlohmann::json params = request.contains("params") ? request["params"] : nlohmann::json(nullptr);

    Logger::getInstance().debug("<- " + method);

    try {
        if (method == "initialize") {
            return makeResult(id, handleInitialize());
        }
        if (method == "initialized" || method == "notifications/initialized") {
            return std::nullopt;
        }
        if (method == "tools/list") {
            return makeResult(id, handleToolsList());
        }
        if (method == "tools/call") {
            return handleToolsCall(id, params);
        }
        if (method == "ping") {
            return makeResult(id, nlohmann::json::object());
        }
        // Unknown notifications get no reply
        if (id.is_null() && method.rfind("notifications/", 0) == 0) {
            return std::nullopt;
        }
        return makeError(id, MethodNotFound, "Method not found");
    } catch (const std::exception& e) {
        Logger::getInstance().error("Request " + method + " failed: " + e.what());
        return makeError(id, InternalError, "Internal error", e.what());
    }
}

nlohmann::json McpServer::handleInitialize() const {
    return {
        {"protocolVersion", ProtocolVersion},
        {"capabilities", {
            {"tools", nlohmann::json::object()}
        }},
        {"serverInfo", {
            {"name", ServerName},
            {"version", ServerVersion}
        }}
    };
}

nlohmann::json McpServer::handleToolsList() const {
    return {{"tools", registry.listToolSchemas()}};
}

nlohmann::json McpServer::handleToolsCall(const nlohmann::json& id, const nlohmann::json& params) {
    if (!params.is_object()) {
        return makeError(id, InvalidParams, "Invalid params");
    }
    auto name = params.find("name");
    if (name == params.end() || !name->is_string()) {
        return makeError(id, InvalidParams, "Invalid params");
    }
    nlohmann::json arguments = nlohmann::json::object();
    auto args = params.find("arguments");
    if (args != params.end() && !args->is_null()) {
        if (!args->is_object()) {
            return makeError(id, InvalidParams, "Invalid params");
        }
        arguments = *args;
    }

    std::string toolName = name->get<std::string>();
    nlohmann::json result = registry.executeTool(toolName, arguments);
    if (ToolResult::isError(result)) {
        Logger::getInstance().info("Tool " + toolName + " returned error: " + ToolResult::firstText(result));
    }
    return makeResult(id, result);
}

nlohmann::json McpServer::makeResult(const nlohmann::json& id, const nlohmann::json& result) {
    nlohmann::json response = {{"jsonrpc", "2.0"}};
    if (!id.is_null()) {
        response["id"] = id;
    }
    response["result"] = result;
    return response;
}

nlohmann::json McpServer::makeError(const nlohmann::json& id, int code, const std::string& message,
                                    const nlohmann::json& data) {
    nlohmann::json error = {{"code", code}, {"message", message}};
    if (!data.is_null()) {
        error["data"] = data;
    }
    nlohmann::json response = {{"jsonrpc", "2.0"}};
    if (!id.is_null()) {
        response["id"] = id;
    }
    response["error"] = error;
    return response;
}
