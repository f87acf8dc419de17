#include "common/thread_utils.hpp"

#if defined(__linux__)
#include <sys/prctl.h>
#include <sys/syscall.h>
#endif

namespace xferstat {

PlatformThreadId CurrentThreadId() {
#if defined(__linux__)
    return static_cast<PlatformThreadId>(syscall(__NR_gettid));
#else
    return static_cast<PlatformThreadId>(getpid());
#endif
}

void SetCurrentThreadName(const char* name) {
#if defined(__linux__)
    // The name is truncated to 15 characters by the kernel.
    prctl(PR_SET_NAME, reinterpret_cast<unsigned long>(name));
#elif defined(__APPLE__)
    pthread_setname_np(name);
#endif
}

} // namespace xferstat
