#include "tools/ToolArgs.h"
#include <limits>

namespace {

const nlohmann::json& asObject(const nlohmann::json& args) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (args.is_null()) return empty;
    if (!args.is_object()) {
        throw ToolInputError("arguments must be an object");
    }
    return args;
}

// Optional string; absent or null yields ""
std::string optString(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return "";
    if (!it->is_string()) {
        throw ToolInputError(std::string("'") + key + "' must be a string");
    }
    return it->get<std::string>();
}

bool optBool(const nlohmann::json& obj, const char* key, bool fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return fallback;
    if (!it->is_boolean()) {
        throw ToolInputError(std::string("'") + key + "' must be a boolean");
    }
    return it->get<bool>();
}

int optInt(const nlohmann::json& obj, const char* key, int fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return fallback;
    if (!it->is_number()) {
        throw ToolInputError(std::string("'") + key + "' must be an integer");
    }
    double v = it->get<double>();
    if (v > std::numeric_limits<int>::max()) return std::numeric_limits<int>::max();
    if (v < std::numeric_limits<int>::min()) return std::numeric_limits<int>::min();
    return static_cast<int>(v);
}

std::vector<std::string> optTags(const nlohmann::json& obj) {
    std::vector<std::string> tags;
    auto it = obj.find("tags");
    if (it == obj.end() || it->is_null()) return tags;
    if (!it->is_array()) {
        throw ToolInputError("'tags' must be an array of strings");
    }
    for (const auto& t : *it) {
        if (!t.is_string()) {
            throw ToolInputError("'tags' must be an array of strings");
        }
        tags.push_back(t.get<std::string>());
    }
    return tags;
}

} // namespace

namespace ToolArgs {

RememberRequest parseRemember(const nlohmann::json& args, const Limits& limits) {
    const auto& obj = asObject(args);
    RememberRequest req;

    auto it = obj.find("fact");
    if (it == obj.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
        throw ToolInputError("fact is required");
    }
    req.fact = it->get<std::string>();
    if (req.fact.size() > limits.maxFactSize) {
        throw ToolInputError("fact exceeds maximum size of " + std::to_string(limits.maxFactSize) + " bytes");
    }

    req.tags = optTags(obj);
    if (req.tags.size() > limits.maxTagCount) {
        throw ToolInputError("too many tags (max " + std::to_string(limits.maxTagCount) + ")");
    }
    for (const auto& tag : req.tags) {
        if (tag.size() > limits.maxTagLength) {
            throw ToolInputError("tag exceeds maximum length of " + std::to_string(limits.maxTagLength) + " characters");
        }
    }
    return req;
}

RecallRequest parseRecall(const nlohmann::json& args) {
    const auto& obj = asObject(args);
    RecallRequest req;
    req.query = optString(obj, "query");
    req.tags = optTags(obj);
    req.currentDirOnly = optBool(obj, "current_dir_only", false);
    req.limit = optInt(obj, "limit", RecallRequest::DefaultLimit);
    return req;
}

SendMessageRequest parseSendMessage(const nlohmann::json& args, const Limits& limits) {
    const auto& obj = asObject(args);
    SendMessageRequest req;

    req.to = optString(obj, "to");
    if (req.to.empty()) {
        throw ToolInputError("'to' instance ID is required");
    }
    req.content = optString(obj, "content");
    if (req.content.empty()) {
        throw ToolInputError("'content' is required");
    }
    if (req.content.size() > limits.maxMessageSize) {
        throw ToolInputError("message exceeds maximum size of " + std::to_string(limits.maxMessageSize) + " bytes");
    }
    return req;
}

GetMessagesRequest parseGetMessages(const nlohmann::json& args) {
    const auto& obj = asObject(args);
    GetMessagesRequest req;
    req.unreadOnly = optBool(obj, "unread_only", true);
    return req;
}

} // namespace ToolArgs
