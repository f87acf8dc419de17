#include "xfer/base/time/clock.hpp"
#include "common/utils_time.hpp"

namespace xferstat {

std::unique_ptr<Clock> Clock::GetRealTimeClock() {
    return std::make_unique<RealTimeClock>();
}

Timestamp RealTimeClock::CurrentTime() {
    return Timestamp::Micros(utils::time::TimeInMicros());
}
    
} // namespace xferstat
