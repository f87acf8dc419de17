#include "xfer/progress/progress_report.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace xferstat {
namespace {

constexpr int kProgressBarWidth = 40;
constexpr const char* kByteUnits[] = {"B", "KB", "MB", "GB", "TB"};
constexpr size_t kNumByteUnits = sizeof(kByteUnits) / sizeof(kByteUnits[0]);

std::string ProgressBar(double percent_complete) {
    double fraction = std::max(0.0, std::min(percent_complete / 100.0, 1.0));
    int filled = static_cast<int>(fraction * kProgressBarWidth);
    return std::string(filled, '=') + std::string(kProgressBarWidth - filled, ' ');
}

} // namespace

namespace utils {
namespace progress {

std::string FormatBytes(double bytes) {
    size_t unit = 0;
    while (bytes >= 1024.0 && unit + 1 < kNumByteUnits) {
        bytes /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << bytes << " " << kByteUnits[unit];
    return oss.str();
}

std::string FormatEta(uint64_t eta_seconds) {
    std::ostringstream oss;
    if (eta_seconds >= 3600) {
        oss << eta_seconds / 3600 << "h" << (eta_seconds % 3600) / 60 << "min";
    } else if (eta_seconds >= 60) {
        oss << eta_seconds / 60 << "min";
    } else {
        oss << eta_seconds << "sec";
    }
    return oss.str();
}

std::string FormatElapsed(uint64_t elapsed_seconds) {
    std::ostringstream oss;
    oss << std::setfill('0') 
        << std::setw(2) << elapsed_seconds / 3600 << ":"
        << std::setw(2) << (elapsed_seconds % 3600) / 60 << ":"
        << std::setw(2) << elapsed_seconds % 60;
    return oss.str();
}

} // namespace progress
} // namespace utils

std::string ProgressReport::ToString() const {
    using namespace utils::progress;
    const double speed = stalled ? 0.0 : speed_bytes_per_sec;
    std::ostringstream oss;
    oss << FormatBytes(static_cast<double>(total_bytes)) << " "
        << FormatElapsed(elapsed_seconds) << " "
        << "[" << FormatBytes(speed) << "/s] "
        << "[" << ProgressBar(percent_complete) << "] "
        << std::fixed << std::setprecision(0) << std::floor(percent_complete) << "% "
        << "ETA " << (stalled ? "Stalled!" : FormatEta(eta_seconds));
    return oss.str();
}

} // namespace xferstat
