#include "mcp/OutputChannel.h"
#include <string>

void OutputChannel::writeLine(const nlohmann::json& message) {
    std::string line = message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    std::lock_guard<std::mutex> lock(mtx);
    out << line << '\n';
    out.flush();
}
