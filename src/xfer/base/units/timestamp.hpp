#ifndef _XFER_BASE_UNITS_TIMESTAMP_H_
#define _XFER_BASE_UNITS_TIMESTAMP_H_

#include "base/defines.hpp"
#include "xfer/base/units/unit_base.hpp"
#include "xfer/base/units/time_delta.hpp"

namespace xferstat {

// A point in time since the epoch of the clock it was read from, with
// microsecond resolution. Two timestamps differ by a TimeDelta.
class Timestamp final : public UnitBase<Timestamp> {
public:
    template <typename T>
    static constexpr Timestamp Seconds(T value) { return FromScaled(value, 1'000'000); }
    template <typename T>
    static constexpr Timestamp Millis(T value) { return FromScaled(value, 1'000); }
    template <typename T>
    static constexpr Timestamp Micros(T value) { return FromScaled(value, 1); }

    template <typename T = int64_t>
    constexpr T seconds() const { return ToScaled<T>(1'000'000); }
    template <typename T = int64_t>
    constexpr T ms() const { return ToScaled<T>(1'000); }
    template <typename T = int64_t>
    constexpr T us() const { return ToScaled<T>(1); }

    constexpr Timestamp operator+(TimeDelta delta) const {
        return Timestamp(AddTicks(ticks_, delta.ticks_));
    }
    constexpr Timestamp operator-(TimeDelta delta) const {
        return Timestamp(AddTicks(ticks_, NegateTicks(delta.ticks_)));
    }
    constexpr TimeDelta operator-(Timestamp other) const {
        return TimeDelta(AddTicks(ticks_, NegateTicks(other.ticks_)));
    }

private:
    friend class UnitBase<Timestamp>;
    explicit constexpr Timestamp(int64_t us) : UnitBase(us) {}
};
    
} // namespace xferstat

#endif
