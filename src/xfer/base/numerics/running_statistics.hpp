#ifndef _XFER_BASE_NUMERICS_RUNNING_STATISTICS_H_
#define _XFER_BASE_NUMERICS_RUNNING_STATISTICS_H_

#include "base/defines.hpp"

#include <cassert>
#include <cmath>
#include <optional>
#include <type_traits>

namespace xferstat {

// This class is used to compute mean, variance and standard deviation
// using Welford's method for variance.
// See https://en.wikipedia.org/wiki/Algorithms_for_calculating_variance#Welford's_online_algorithm
template<typename T,
         typename std::enable_if<std::is_convertible<T, double>::value, T>::type* = nullptr>
class RunningStatistics {
public:
    RunningStatistics() 
        : count_(0),
          mean_(0.0),
          cumulated_variance_(0.0) {}

    void AddSample(T sample) {
        ++count_;
        // Welford's incremental update.
        const double delta = sample - mean_;
        mean_ += delta / count_;
        const double delta2 = sample - mean_;
        cumulated_variance_ += delta * delta2;
    }

    // Adds `sample` as the `num_samples`th one, for callers that also count
    // the samples they skip. `num_samples` must be greater than the count.
    void AddSample(T sample, int64_t num_samples) {
        assert(num_samples > count_);
        count_ = num_samples;
        const double delta = sample - mean_;
        mean_ += delta / count_;
        cumulated_variance_ += delta * (sample - mean_);
    }

    int64_t sample_count() const { return count_; }

    // Sum of squared differences from the current mean.
    double cumulated_variance() const { return cumulated_variance_; }

    std::optional<double> mean() const { 
        return count_ > 0 ? std::optional<double>(mean_) : std::nullopt; 
    }
    std::optional<double> Variance() const { 
        return count_ > 0 ? std::optional<double>(cumulated_variance_ / count_) : std::nullopt; 
    }
    // The cumulated variance may drift slightly below zero due to 
    // rounding errors, the absolute value is used to keep it real.
    std::optional<double> StandardDeviation() const { 
        return count_ > 0 ? std::optional<double>(std::sqrt(std::fabs(*Variance()))) : std::nullopt; 
    }

private:
    int64_t count_;
    double mean_;
    double cumulated_variance_;
};
    
} // namespace xferstat

#endif
