#include "backup_simulator.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>

namespace backup_simulator {
namespace {

constexpr std::chrono::milliseconds kStepInterval(100);
constexpr int kStepsPerSecond = 10;
    
} // namespace

BackupSimulator::BackupSimulator(const Options& options) 
    : options_(options) {}

BackupSimulator::~BackupSimulator() = default;

xferstat::SizeEvidence BackupSimulator::CollectEvidence() const {
    xferstat::SizeEvidence evidence;
    evidence.new_file_bytes = options_.new_bytes;
    evidence.changed_file_bytes = options_.changed_bytes;
    return evidence;
}

void BackupSimulator::RunLivePass(const TransferCallback& transfer_callback) {
    const uint64_t bytes_per_step = std::max<uint64_t>(options_.rate / kStepsPerSecond, 1);
    uint64_t new_bytes_left = options_.new_bytes;
    uint64_t changed_bytes_left = options_.changed_bytes;
    double raw_delta_size = 0.0;
    uint64_t volume_bytes = 0;
    num_volumes_ = 1;

    while (new_bytes_left > 0 || changed_bytes_left > 0) {
        std::this_thread::sleep_for(kStepInterval);

        // New files come first, their delta is the whole file.
        const uint64_t new_bytes = std::min(bytes_per_step, new_bytes_left);
        const uint64_t changed_bytes = std::min(bytes_per_step - new_bytes, changed_bytes_left);
        new_bytes_left -= new_bytes;
        changed_bytes_left -= changed_bytes;
        raw_delta_size += new_bytes + changed_bytes * options_.delta_ratio;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            stats_.new_file_bytes += new_bytes;
            stats_.changed_file_bytes += changed_bytes;
            stats_.raw_delta_size = static_cast<uint64_t>(raw_delta_size);
        }

        const uint64_t total_written = static_cast<uint64_t>(std::floor(raw_delta_size * options_.compress_ratio));
        volume_bytes += total_written - written_bytes_;
        written_bytes_ = total_written;
        if (volume_bytes >= options_.volume_size) {
            transfer_callback(options_.volume_size, options_.volume_size);
            volume_bytes -= options_.volume_size;
            ++num_volumes_;
            PLOG_DEBUG << "Volume " << num_volumes_ - 1 << " completed, starting volume " << num_volumes_ << ".";
        }
        transfer_callback(volume_bytes, options_.volume_size);
    }
}

xferstat::DeltaStats BackupSimulator::CurrentStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace backup_simulator
