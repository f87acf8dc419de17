#ifndef _COMMON_UTILS_TIME_H_
#define _COMMON_UTILS_TIME_H_

#include "base/defines.hpp"

#include <stdint.h>

namespace xferstat {

static constexpr int64_t kNumMillisecsPerSec = INT64_C(1000);
static constexpr int64_t kNumMicrosecsPerSec = INT64_C(1000000);
static constexpr int64_t kNumNanosecsPerSec = INT64_C(1000000000);

static constexpr int64_t kNumMicrosecsPerMillisec = kNumMicrosecsPerSec / kNumMillisecsPerSec;
static constexpr int64_t kNumNanosecsPerMillisec = kNumNanosecsPerSec / kNumMillisecsPerSec;
static constexpr int64_t kNumNanosecsPerMicrosec = kNumNanosecsPerSec / kNumMicrosecsPerSec;

namespace utils {
namespace time {

// Monotonic time
// Returns the current time in milliseconds in 64 bits.
int64_t TimeInMillis();

// Returns the current time in microseconds in 64 bits.
int64_t TimeInMicros();

// Returns the current time in nanoseconds in 64 bits.
int64_t TimeInNanos();
    
} // namespace time
} // namespace utils
} // namespace xferstat

#endif
