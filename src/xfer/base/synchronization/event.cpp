#include "xfer/base/synchronization/event.hpp"
#include "common/utils_time.hpp"

#include <errno.h>
#include <time.h>

#include <algorithm>

namespace xferstat {
namespace {

// The condition variable waits against the monotonic clock.
timespec MonotonicDeadline(TimeDelta timeout) {
    timespec now;
    clock_gettime(CLOCK_MONOTONIC, &now);
    const int64_t deadline_ns = now.tv_sec * kNumNanosecsPerSec + now.tv_nsec + 
                                std::max<int64_t>(timeout.us(), 0) * kNumNanosecsPerMicrosec;
    timespec deadline;
    deadline.tv_sec = static_cast<time_t>(deadline_ns / kNumNanosecsPerSec);
    deadline.tv_nsec = static_cast<long>(deadline_ns % kNumNanosecsPerSec);
    return deadline;
}

} // namespace

Event::Event(bool manual_reset, bool initially_signaled) 
    : manual_reset_(manual_reset),
      signaled_(initially_signaled) {
    pthread_mutex_init(&mutex_, nullptr);
    pthread_condattr_t attr;
    pthread_condattr_init(&attr);
    pthread_condattr_setclock(&attr, CLOCK_MONOTONIC);
    pthread_cond_init(&cond_, &attr);
    pthread_condattr_destroy(&attr);
}

Event::~Event() {
    pthread_cond_destroy(&cond_);
    pthread_mutex_destroy(&mutex_);
}

void Event::Set() {
    pthread_mutex_lock(&mutex_);
    signaled_ = true;
    pthread_cond_broadcast(&cond_);
    pthread_mutex_unlock(&mutex_);
}

void Event::Reset() {
    pthread_mutex_lock(&mutex_);
    signaled_ = false;
    pthread_mutex_unlock(&mutex_);
}

bool Event::Wait(TimeDelta timeout) {
    pthread_mutex_lock(&mutex_);
    if (timeout.IsPlusInfinity()) {
        while (!signaled_) {
            pthread_cond_wait(&cond_, &mutex_);
        }
    } else {
        const timespec deadline = MonotonicDeadline(timeout);
        int error = 0;
        // Spurious wake-ups return 0, keep waiting until the deadline.
        while (!signaled_ && error != ETIMEDOUT) {
            error = pthread_cond_timedwait(&cond_, &mutex_, &deadline);
        }
    }
    const bool signaled = signaled_;
    if (signaled && !manual_reset_) {
        signaled_ = false;
    }
    pthread_mutex_unlock(&mutex_);
    return signaled;
}
    
} // namespace xferstat
