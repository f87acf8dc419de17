#ifndef _BASE_SYSTEM_TIME_H_
#define _BASE_SYSTEM_TIME_H_

#include "base/defines.hpp"

namespace xferstat {

// Returns the current monotonic time in nanoseconds, the epoch is unspecified.
int64_t SystemTimeInNanos();
    
} // namespace xferstat

#endif
