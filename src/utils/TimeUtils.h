#pragma once
#include <chrono>
#include <cstdint>
#include <string>

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

namespace TimeUtils {
    /** Milliseconds since the Unix epoch; the on-disk timestamp unit. */
    int64_t toMillis(Timestamp t);
    Timestamp fromMillis(int64_t ms);

    /** Current time truncated to millisecond precision. */
    Timestamp now();

    /** Format in local time with a strftime pattern, e.g. "%Y-%m-%d %H:%M". */
    std::string formatLocal(Timestamp t, const char* pattern);
}
