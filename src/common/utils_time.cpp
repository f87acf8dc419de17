#include "common/utils_time.hpp"
#include "base/system_time.hpp"

namespace xferstat {
namespace utils {
namespace time {

int64_t TimeInMillis() {
    return TimeInNanos() / kNumNanosecsPerMillisec;
}

int64_t TimeInMicros() {
    return TimeInNanos() / kNumNanosecsPerMicrosec;
}

int64_t TimeInNanos() {
    return SystemTimeInNanos();
}
    
} // namespace time
} // namespace utils
} // namespace xferstat
