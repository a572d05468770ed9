#pragma once
#include <mutex>
#include <ostream>
#include <nlohmann/json.hpp>

/**
 * @brief Line-oriented JSON writer shared by everything that talks on stdout
 *
 * Each writeLine() emits one complete line under the lock, so concurrent
 * writers never interleave partial envelopes.
 */
class OutputChannel {
public:
    explicit OutputChannel(std::ostream& out) : out(out) {}

    OutputChannel(const OutputChannel&) = delete;
    OutputChannel& operator=(const OutputChannel&) = delete;

    void writeLine(const nlohmann::json& message);

private:
    std::ostream& out;
    std::mutex mtx;
};
