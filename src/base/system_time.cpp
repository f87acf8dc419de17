#include "base/system_time.hpp"
#include "common/utils_time.hpp"

#include <stdint.h>

#if defined(XFER_POSIX)
#include <time.h>
#endif

namespace xferstat {

int64_t SystemTimeInNanos() {
    int64_t ticks = -1;
#if defined(XFER_POSIX)
    struct timespec ts;
    // CLOCK_MONOTONIC is not affected by adjustments of the wall clock.
    clock_gettime(CLOCK_MONOTONIC, &ts);
    ticks = kNumNanosecsPerSec * static_cast<int64_t>(ts.tv_sec) +
            static_cast<int64_t>(ts.tv_nsec);
#else
    #error Unsupported platform
#endif
    return ticks;
}
    
} // namespace xferstat
