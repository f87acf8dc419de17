#ifndef _XFER_PROGRESS_SIZE_EVIDENCE_H_
#define _XFER_PROGRESS_SIZE_EVIDENCE_H_

#include "base/defines.hpp"
#include "common/utils_numeric.hpp"

namespace xferstat {

// Sizes collected by the evidence-gathering (dry-run) pass.
struct XFER_CPP_EXPORT SizeEvidence {
    uint64_t new_file_bytes = 0;
    uint64_t changed_file_bytes = 0;

    uint64_t total() const {
        return utils::numeric::saturated_add(new_file_bytes, changed_file_bytes);
    }
};

// Sizes processed so far by the live pass, read on every tick.
struct XFER_CPP_EXPORT DeltaStats {
    uint64_t new_file_bytes = 0;
    uint64_t changed_file_bytes = 0;
    // Size of the raw (uncompressed) deltas produced so far.
    uint64_t raw_delta_size = 0;

    uint64_t changed_plus_new() const {
        return utils::numeric::saturated_add(new_file_bytes, changed_file_bytes);
    }
};

} // namespace xferstat

#endif
