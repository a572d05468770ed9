#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Bounds enforced on untrusted tool input
 */
struct Limits {
    size_t maxFactSize = 10000;      // bytes
    size_t maxTagCount = 20;
    size_t maxTagLength = 100;       // bytes
    size_t maxMessageSize = 10000;   // bytes
};

/**
 * @brief Rejected tool input; what() is the message shown to the caller
 */
class ToolInputError : public std::runtime_error {
public:
    explicit ToolInputError(const std::string& message) : std::runtime_error(message) {}
};

struct RememberRequest {
    std::string fact;
    std::vector<std::string> tags;
};

struct RecallRequest {
    static constexpr int DefaultLimit = 20;

    std::string query;
    std::vector<std::string> tags;
    bool currentDirOnly = false;
    int limit = DefaultLimit;
};

struct SendMessageRequest {
    std::string to;
    std::string content;
};

struct GetMessagesRequest {
    bool unreadOnly = true;
};

/**
 * @brief Parse untyped tools/call arguments into typed requests
 *
 * All functions throw ToolInputError on missing, mistyped or oversized
 * input. A null args value is treated as an empty object.
 */
namespace ToolArgs {
    RememberRequest parseRemember(const nlohmann::json& args, const Limits& limits);
    RecallRequest parseRecall(const nlohmann::json& args);
    SendMessageRequest parseSendMessage(const nlohmann::json& args, const Limits& limits);
    GetMessagesRequest parseGetMessages(const nlohmann::json& args);
}
