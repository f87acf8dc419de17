#ifndef _COMMON_THREAD_UTILS_H_
#define _COMMON_THREAD_UTILS_H_

#include "base/defines.hpp"

#if defined(XFER_POSIX)
#include <pthread.h>
#include <unistd.h>
#endif

namespace xferstat {

#if defined(XFER_POSIX)
typedef pid_t PlatformThreadId;
#endif

// Retrieve the ID of the current thread.
PlatformThreadId CurrentThreadId();

// Sets the current thread name.
void SetCurrentThreadName(const char* name);

} // namespace xferstat

#endif
