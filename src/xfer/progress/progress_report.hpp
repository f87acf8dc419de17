#ifndef _XFER_PROGRESS_PROGRESS_REPORT_H_
#define _XFER_PROGRESS_PROGRESS_REPORT_H_

#include "base/defines.hpp"

#include <string>

namespace xferstat {

struct XFER_CPP_EXPORT ProgressReport {
    // In [0, 100].
    double percent_complete = 0.0;
    uint64_t eta_seconds = 0;
    uint64_t total_bytes = 0;
    uint64_t elapsed_seconds = 0;
    double speed_bytes_per_sec = 0.0;
    bool stalled = false;

    // Renders the report as a single progress line:
    // <total bytes> <HH:MM:SS> [<speed>/s] [<bar>] <percent>% ETA <eta>
    std::string ToString() const;
};

namespace utils {
namespace progress {

// 1536 -> "1.5 KB"
std::string FormatBytes(double bytes);
// 3725 -> "1h2min", 125 -> "2min", 42 -> "42sec"
std::string FormatEta(uint64_t eta_seconds);
// 3725 -> "01:02:05"
std::string FormatElapsed(uint64_t elapsed_seconds);

} // namespace progress
} // namespace utils
} // namespace xferstat

#endif
