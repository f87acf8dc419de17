#ifndef _XFER_BASE_NUMERICS_WINDOWED_EXP_FILTER_H_
#define _XFER_BASE_NUMERICS_WINDOWED_EXP_FILTER_H_

#include "base/defines.hpp"

#include <deque>

namespace xferstat {

// This class keeps the most recent `max_samples` samples and smooths
// them with an exponential moving average that is re-folded over the
// whole window on every new sample:
// y(0) = 0, y(k) = alpha * x(k) + (1 - alpha) * y(k-1).
// Evicted samples no longer contribute to the filtered value.
class WindowedExpFilter {
public:
    WindowedExpFilter(size_t max_samples, double alpha);
    ~WindowedExpFilter();

    size_t max_samples() const { return max_samples_; }
    double alpha() const { return alpha_; }
    size_t num_samples() const { return samples_.size(); }

    // Returns the filtered value over the current window,
    // 0 if no sample was added.
    double filtered() const { return filtered_value_; }

    double AddSample(double sample);

    void Reset();

private:
    const size_t max_samples_;
    const double alpha_;
    std::deque<double> samples_;
    double filtered_value_;
};
    
} // namespace xferstat

#endif
