#ifndef _COMMON_UTILS_NUMERIC_H_
#define _COMMON_UTILS_NUMERIC_H_

#include "base/defines.hpp"

#include <limits>
#include <type_traits>

namespace xferstat {
namespace utils {
namespace numeric {

// is_value_in_range
template <typename Dst, typename Src,
          typename std::enable_if<std::is_integral<Dst>::value && 
                                  std::is_integral<Src>::value>::type* = nullptr>
inline constexpr bool is_value_in_range(Src value) {
    using DstLimits = std::numeric_limits<Dst>;
    if constexpr (std::is_signed<Src>::value && !std::is_signed<Dst>::value) {
        if (value < 0) {
            return false;
        }
        return static_cast<typename std::make_unsigned<Src>::type>(value) <= DstLimits::max();
    } else if constexpr (!std::is_signed<Src>::value && std::is_signed<Dst>::value) {
        return value <= static_cast<typename std::make_unsigned<Dst>::type>(DstLimits::max());
    } else {
        return value >= DstLimits::lowest() && value <= DstLimits::max();
    }
}

template <typename Dst, typename Src,
          typename std::enable_if<!std::is_integral<Dst>::value || 
                                  !std::is_integral<Src>::value>::type* = nullptr>
inline constexpr bool is_value_in_range(Src value) {
    return value >= static_cast<Src>(std::numeric_limits<Dst>::lowest()) && 
           value <= static_cast<Src>(std::numeric_limits<Dst>::max());
}

// checked_static_cast
template <typename Dst, typename Src>
inline constexpr Dst checked_static_cast(Src value) {
    assert((is_value_in_range<Dst, Src>(value)));
    return static_cast<Dst>(value);
}

// saturated_add
// Returns `a + b`, or the max value of T if the sum overflows.
template <typename T,
          typename std::enable_if<std::is_unsigned<T>::value, T>::type* = nullptr>
inline constexpr T saturated_add(T a, T b) {
    return a > std::numeric_limits<T>::max() - b ? std::numeric_limits<T>::max() : a + b;
}

// saturated_sub
// Returns `a - b`, or 0 if `b` is greater than `a`.
template <typename T,
          typename std::enable_if<std::is_unsigned<T>::value, T>::type* = nullptr>
inline constexpr T saturated_sub(T a, T b) {
    return a > b ? a - b : 0;
}

} // namespace numeric
} // namespace utils
} // namespace xferstat

#endif
