#include "tools/ITool.h"

namespace ToolResult {

nlohmann::json text(const std::string& text) {
    return {{"content", {{{"type", "text"}, {"text", text}}}}};
}

nlohmann::json error(const std::string& message) {
    return {
        {"content", {{{"type", "text"}, {"text", message}}}},
        {"isError", true}
    };
}

bool isError(const nlohmann::json& result) {
    return result.is_object() && result.value("isError", false);
}

std::string firstText(const nlohmann::json& result) {
    if (result.contains("content") && result["content"].is_array() && !result["content"].empty()) {
        const auto& item = result["content"][0];
        if (item.contains("text") && item["text"].is_string()) return item["text"].get<std::string>();
    }
    return "";
}

std::string truncate(const std::string& s, size_t maxLen) {
    if (s.size() <= maxLen) {
        return s;
    }
    size_t cut = maxLen <= 3 ? maxLen : maxLen - 3;
    // Never split a UTF-8 sequence
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    if (maxLen <= 3) {
        return s.substr(0, cut);
    }
    return s.substr(0, cut) + "...";
}

} // namespace ToolResult
