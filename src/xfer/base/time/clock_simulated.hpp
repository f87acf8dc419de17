#ifndef _XFER_BASE_TIME_CLOCK_SIMULATED_H_
#define _XFER_BASE_TIME_CLOCK_SIMULATED_H_

#include "base/defines.hpp"
#include "xfer/base/time/clock.hpp"

#include <atomic>

namespace xferstat {

// A clock that only moves when told to. Safe to read from any thread
// while another one advances it.
class SimulatedClock final : public Clock {
public:
    explicit SimulatedClock(Timestamp start_time);

    Timestamp CurrentTime() override;

    // `delta` must not be negative.
    void AdvanceTime(TimeDelta delta);

private:
    std::atomic<int64_t> now_us_;
};

} // namespace xferstat

#endif
