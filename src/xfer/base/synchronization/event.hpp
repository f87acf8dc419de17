#ifndef _XFER_BASE_SYNCHRONIZATION_EVENT_H_
#define _XFER_BASE_SYNCHRONIZATION_EVENT_H_

#include "base/defines.hpp"
#include "xfer/base/units/time_delta.hpp"

#if defined(XFER_POSIX)
#include <pthread.h>
#else
#error "Event requires pthreads."
#endif

namespace xferstat {

// A signal one thread waits on until another one sets it. An auto-reset
// event is cleared again by the wait it releases.
class XFER_CPP_EXPORT Event {
public:
    explicit Event(bool manual_reset = false, bool initially_signaled = false);
    Event(const Event&) = delete;
    Event& operator=(const Event&) = delete;
    ~Event();

    void Set();
    void Reset();

    // Returns false if `timeout` passed without the event being set.
    // TimeDelta::PlusInfinity() waits forever.
    bool Wait(TimeDelta timeout);
    bool WaitForever() { return Wait(TimeDelta::PlusInfinity()); }

private:
    pthread_mutex_t mutex_;
    pthread_cond_t cond_;
    const bool manual_reset_;
    bool signaled_;
};
    
} // namespace xferstat

#endif
