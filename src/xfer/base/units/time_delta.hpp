#ifndef _XFER_BASE_UNITS_TIME_DELTA_H_
#define _XFER_BASE_UNITS_TIME_DELTA_H_

#include "base/defines.hpp"
#include "xfer/base/units/unit_base.hpp"

namespace xferstat {

// A signed duration with microsecond resolution.
class TimeDelta final : public UnitBase<TimeDelta> {
public:
    template <typename T>
    static constexpr TimeDelta Seconds(T value) { return FromScaled(value, 1'000'000); }
    template <typename T>
    static constexpr TimeDelta Millis(T value) { return FromScaled(value, 1'000); }
    template <typename T>
    static constexpr TimeDelta Micros(T value) { return FromScaled(value, 1); }

    template <typename T = int64_t>
    constexpr T seconds() const { return ToScaled<T>(1'000'000); }
    template <typename T = int64_t>
    constexpr T ms() const { return ToScaled<T>(1'000); }
    template <typename T = int64_t>
    constexpr T us() const { return ToScaled<T>(1); }

    constexpr TimeDelta operator+(TimeDelta other) const {
        return TimeDelta(AddTicks(ticks_, other.ticks_));
    }
    constexpr TimeDelta operator-(TimeDelta other) const {
        return TimeDelta(AddTicks(ticks_, NegateTicks(other.ticks_)));
    }
    constexpr TimeDelta& operator+=(TimeDelta other) {
        ticks_ = AddTicks(ticks_, other.ticks_);
        return *this;
    }

    // Scaling an infinite duration by a positive factor keeps it infinite.
    template <typename T>
    constexpr TimeDelta operator*(T factor) const {
        static_assert(std::is_arithmetic<T>::value, "");
        if (IsInfinite()) {
            assert(factor > 0);
            return *this;
        }
        if constexpr (std::is_floating_point<T>::value) {
            return Micros(static_cast<double>(ticks_) * factor);
        } else {
            return Micros(ticks_ * static_cast<int64_t>(factor));
        }
    }

private:
    friend class UnitBase<TimeDelta>;
    friend class Timestamp;
    explicit constexpr TimeDelta(int64_t us) : UnitBase(us) {}
};
    
} // namespace xferstat

#endif
