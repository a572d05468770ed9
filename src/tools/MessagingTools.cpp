#include "tools/MessagingTools.h"
#include "utils/Logger.h"
#include <sstream>

// ========== list_instances ==========

ListInstancesTool::ListInstancesTool(InstanceManager& instances, std::string selfId)
    : instances(instances), selfId(std::move(selfId)) {}

std::string ListInstancesTool::getDescription() const {
    return "List all running engram instances across different directories. "
           "Use this to discover other sessions you can communicate with.";
}

nlohmann::json ListInstancesTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", nlohmann::json::object()}
    };
}

nlohmann::json ListInstancesTool::execute(const nlohmann::json& /*args*/) {
    std::vector<Instance> live;
    try {
        live = instances.listLive();
    } catch (const StoreError& e) {
        return ToolResult::error(std::string("failed to list instances: ") + e.what());
    }

    if (live.empty()) {
        return ToolResult::text("No other running instances found.");
    }

    std::ostringstream ss;
    ss << "Found " << live.size() << " running instance(s):\n\n";
    for (const auto& inst : live) {
        ss << "**" << inst.id << "**";
        if (inst.id == selfId) ss << " (this instance)";
        ss << "\n";
        ss << "  Directory: " << inst.directory << "\n";
        ss << "  Started: " << TimeUtils::formatLocal(inst.startedAt, "%Y-%m-%d %H:%M:%S") << "\n";
        ss << "  Last heartbeat: " << TimeUtils::formatLocal(inst.lastHeartbeat, "%H:%M:%S") << "\n\n";
    }
    return ToolResult::text(ss.str());
}

// ========== send_message ==========

SendMessageTool::SendMessageTool(IStore& store, InstanceManager& instances, std::string selfId, Limits limits)
    : store(store), instances(instances), selfId(std::move(selfId)), limits(limits) {}

std::string SendMessageTool::getDescription() const {
    return "Send a message to another running engram instance. "
           "Use this to communicate with sessions in other directories.";
}

nlohmann::json SendMessageTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"to", {{"type", "string"}, {"description", "The instance ID to send the message to"}}},
            {"content", {{"type", "string"}, {"description", "The message content"}}}
        }},
        {"required", nlohmann::json::array({"to", "content"})}
    };
}

nlohmann::json SendMessageTool::execute(const nlohmann::json& args) {
    SendMessageRequest req;
    try {
        req = ToolArgs::parseSendMessage(args, limits);
    } catch (const ToolInputError& e) {
        return ToolResult::error(e.what());
    }

    try {
        if (!instances.find(req.to)) {
            return ToolResult::error("instance '" + req.to + "' not found");
        }
    } catch (const StoreError& e) {
        return ToolResult::error(std::string("failed to find instance: ") + e.what());
    }

    try {
        Message msg = store.sendMessage(selfId, req.to, req.content);
        Logger::getInstance().debug("Message #" + std::to_string(msg.id) + " " + selfId + " -> " + req.to);
        return ToolResult::text("Message #" + std::to_string(msg.id) + " sent to " + req.to);
    } catch (const StoreError& e) {
        Logger::getInstance().error(std::string("send_message: ") + e.what());
        return ToolResult::error(std::string("failed to send message: ") + e.what());
    }
}

// ========== get_messages ==========

GetMessagesTool::GetMessagesTool(IStore& store, std::string selfId)
    : store(store), selfId(std::move(selfId)) {}

std::string GetMessagesTool::getDescription() const {
    return "Get messages sent to this instance from other engram instances.";
}

nlohmann::json GetMessagesTool::getSchema() const {
    return {
        {"type", "object"},
        {"properties", {
            {"unread_only", {{"type", "boolean"}, {"description", "If true, only return unread messages (default: true)"}}}
        }}
    };
}

nlohmann::json GetMessagesTool::execute(const nlohmann::json& args) {
    GetMessagesRequest req;
    try {
        req = ToolArgs::parseGetMessages(args);
    } catch (const ToolInputError& e) {
        return ToolResult::error(e.what());
    }

    std::vector<Message> messages;
    try {
        messages = store.getMessages(selfId, req.unreadOnly);
    } catch (const StoreError& e) {
        return ToolResult::error(std::string("failed to get messages: ") + e.what());
    }

    if (messages.empty()) {
        return ToolResult::text(req.unreadOnly ? "No unread messages." : "No messages.");
    }

    std::ostringstream ss;
    ss << "Found " << messages.size() << " message(s):\n\n";
    for (const auto& m : messages) {
        std::string readStatus = "unread";
        if (m.readAt) {
            readStatus = "read at " + TimeUtils::formatLocal(*m.readAt, "%H:%M");
        }
        ss << "**#" << m.id << "** from " << m.fromInstance << " (" << readStatus << ")\n";
        ss << "  Time: " << TimeUtils::formatLocal(m.createdAt, "%Y-%m-%d %H:%M:%S") << "\n";
        ss << "  " << m.content << "\n\n";

        if (!m.readAt) {
            try {
                store.markMessageRead(m.id);
            } catch (const StoreError& e) {
                Logger::getInstance().warn("Failed to mark message #" + std::to_string(m.id) + " read: " + e.what());
            }
        }
    }
    return ToolResult::text(ss.str());
}
