#ifndef _BACKUP_SIMULATOR_BACKUP_SIMULATOR_H_
#define _BACKUP_SIMULATOR_BACKUP_SIMULATOR_H_

#include "options.hpp"
#include "base/thread_annotation.hpp"
#include "xfer/progress/size_evidence.hpp"

#include <functional>
#include <mutex>

namespace backup_simulator {

// Simulates the two passes of a backup: the evidence pass reports the sizes
// to back up, the live pass produces deltas from the source files and writes
// them compressed in volumes of a fixed size.
class BackupSimulator {
public:
    // Called with the bytes written since the start of the current volume.
    using TransferCallback = std::function<void(uint64_t bytecount, uint64_t total_bytes)>;
public:
    explicit BackupSimulator(const Options& options);
    ~BackupSimulator();

    xferstat::SizeEvidence CollectEvidence() const;

    // Blocks until all the source bytes were processed.
    void RunLivePass(const TransferCallback& transfer_callback) XFER_LOCKS_EXCLUDED(mutex_);

    // Thread-safe.
    xferstat::DeltaStats CurrentStats() const XFER_LOCKS_EXCLUDED(mutex_);

    uint64_t num_volumes() const { return num_volumes_; }
    uint64_t written_bytes() const { return written_bytes_; }

private:
    const Options options_;
    uint64_t num_volumes_ = 0;
    uint64_t written_bytes_ = 0;

    mutable std::mutex mutex_;
    xferstat::DeltaStats stats_ XFER_GUARDED_BY(mutex_);
};

} // namespace backup_simulator

#endif
