#include "utils/TimeUtils.h"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace TimeUtils {

int64_t toMillis(Timestamp t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

Timestamp fromMillis(int64_t ms) {
    return Timestamp(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

Timestamp now() {
    return fromMillis(toMillis(Clock::now()));
}

std::string formatLocal(Timestamp t, const char* pattern) {
    std::time_t tt = Clock::to_time_t(t);
    std::tm local{};
    localtime_r(&tt, &local);
    std::ostringstream ss;
    ss << std::put_time(&local, pattern);
    return ss.str();
}

} // namespace TimeUtils
