#include "xfer/base/time/clock_simulated.hpp"

namespace xferstat {

SimulatedClock::SimulatedClock(Timestamp start_time)
    : now_us_(start_time.us()) {}

Timestamp SimulatedClock::CurrentTime() {
    return Timestamp::Micros(now_us_.load());
}

void SimulatedClock::AdvanceTime(TimeDelta delta) {
    assert(delta >= TimeDelta::Zero());
    now_us_ += delta.us();
}

} // namespace xferstat
