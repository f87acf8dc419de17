#include "xfer/base/numerics/windowed_exp_filter.hpp"

namespace xferstat {

WindowedExpFilter::WindowedExpFilter(size_t max_samples, double alpha) 
    : max_samples_(max_samples),
      alpha_(alpha),
      filtered_value_(0.0) {
    assert(max_samples_ > 0);
    assert(alpha_ > 0.0 && alpha_ <= 1.0);
}

WindowedExpFilter::~WindowedExpFilter() = default;

double WindowedExpFilter::AddSample(double sample) {
    samples_.push_back(sample);
    while (samples_.size() > max_samples_) {
        samples_.pop_front();
    }
    // Fold from the oldest sample.
    double value = 0.0;
    for (double s : samples_) {
        value = alpha_ * s + (1.0 - alpha_) * value;
    }
    filtered_value_ = value;
    return filtered_value_;
}

void WindowedExpFilter::Reset() {
    samples_.clear();
    filtered_value_ = 0.0;
}
    
} // namespace xferstat
