#ifndef _XFER_BASE_TIME_CLOCK_H_
#define _XFER_BASE_TIME_CLOCK_H_

#include "base/defines.hpp"
#include "xfer/base/units/timestamp.hpp"

namespace xferstat {

// Source of the current time for the estimator and the task runners, so
// tests can substitute a simulated one.
class Clock {
public:
    virtual ~Clock() = default;

    virtual Timestamp CurrentTime() = 0;

    // The monotonic system clock.
    static std::unique_ptr<Clock> GetRealTimeClock();
};

class RealTimeClock final : public Clock {
public:
    Timestamp CurrentTime() override;
};
    
} // namespace xferstat

#endif
