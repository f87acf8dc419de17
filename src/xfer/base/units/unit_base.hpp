#ifndef _XFER_BASE_UNITS_UNIT_BASE_H_
#define _XFER_BASE_UNITS_UNIT_BASE_H_

#include "base/defines.hpp"
#include "common/utils_numeric.hpp"

#include <stdint.h>
#include <cmath>
#include <limits>
#include <type_traits>

namespace xferstat {

// Shared storage of the time units: a signed count of microseconds where
// the two extreme values stand for plus and minus infinity. An infinite
// operand absorbs any finite one.
template <class Unit_T>
class UnitBase {
public:
    static constexpr Unit_T Zero() { return Unit_T(0); }
    static constexpr Unit_T PlusInfinity() { return Unit_T(kPlusInfinity); }
    static constexpr Unit_T MinusInfinity() { return Unit_T(kMinusInfinity); }

    UnitBase() = delete;

    constexpr bool IsZero() const { return ticks_ == 0; }
    constexpr bool IsPlusInfinity() const { return ticks_ == kPlusInfinity; }
    constexpr bool IsMinusInfinity() const { return ticks_ == kMinusInfinity; }
    constexpr bool IsInfinite() const { return IsPlusInfinity() || IsMinusInfinity(); }
    constexpr bool IsFinite() const { return !IsInfinite(); }

    constexpr bool operator==(const Unit_T& other) const { return ticks_ == other.ticks_; }
    constexpr bool operator!=(const Unit_T& other) const { return ticks_ != other.ticks_; }
    constexpr bool operator<(const Unit_T& other) const { return ticks_ < other.ticks_; }
    constexpr bool operator<=(const Unit_T& other) const { return ticks_ <= other.ticks_; }
    constexpr bool operator>(const Unit_T& other) const { return ticks_ > other.ticks_; }
    constexpr bool operator>=(const Unit_T& other) const { return ticks_ >= other.ticks_; }

protected:
    static constexpr int64_t kPlusInfinity = std::numeric_limits<int64_t>::max();
    static constexpr int64_t kMinusInfinity = std::numeric_limits<int64_t>::min();

    explicit constexpr UnitBase(int64_t ticks) : ticks_(ticks) {}

    // `ticks_per_unit` is the number of microseconds in one `value`.
    template <typename T>
    static constexpr Unit_T FromScaled(T value, int64_t ticks_per_unit) {
        static_assert(std::is_arithmetic<T>::value, "");
        if constexpr (std::is_floating_point<T>::value) {
            if (std::isinf(value)) {
                return value > 0 ? PlusInfinity() : MinusInfinity();
            }
            assert(!std::isnan(value));
            const double ticks = std::round(static_cast<double>(value) * ticks_per_unit);
            assert((utils::numeric::is_value_in_range<int64_t, double>(ticks)));
            return Unit_T(static_cast<int64_t>(ticks));
        } else {
            assert(utils::numeric::is_value_in_range<int64_t>(value));
            const int64_t units = static_cast<int64_t>(value);
            assert(units < kPlusInfinity / ticks_per_unit);
            assert(units > kMinusInfinity / ticks_per_unit);
            return Unit_T(units * ticks_per_unit);
        }
    }

    // Integral results are rounded to the nearest unit, halves away from zero.
    template <typename T>
    constexpr T ToScaled(int64_t ticks_per_unit) const {
        static_assert(std::is_arithmetic<T>::value, "");
        if constexpr (std::is_floating_point<T>::value) {
            if (IsPlusInfinity()) {
                return std::numeric_limits<T>::infinity();
            }
            if (IsMinusInfinity()) {
                return -std::numeric_limits<T>::infinity();
            }
            return static_cast<T>(ticks_) / ticks_per_unit;
        } else {
            assert(IsFinite());
            const int64_t half = ticks_ >= 0 ? ticks_per_unit / 2 : -(ticks_per_unit / 2);
            return utils::numeric::checked_static_cast<T>((ticks_ + half) / ticks_per_unit);
        }
    }

    static constexpr int64_t AddTicks(int64_t lhs, int64_t rhs) {
        if (lhs == kPlusInfinity || rhs == kPlusInfinity) {
            assert(lhs != kMinusInfinity && rhs != kMinusInfinity);
            return kPlusInfinity;
        }
        if (lhs == kMinusInfinity || rhs == kMinusInfinity) {
            return kMinusInfinity;
        }
        return lhs + rhs;
    }

    static constexpr int64_t NegateTicks(int64_t ticks) {
        if (ticks == kPlusInfinity) {
            return kMinusInfinity;
        }
        if (ticks == kMinusInfinity) {
            return kPlusInfinity;
        }
        return -ticks;
    }

    int64_t ticks_;
};
    
} // namespace xferstat

#endif
