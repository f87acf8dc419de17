#ifndef _XFER_PROGRESS_PROGRESS_SINK_H_
#define _XFER_PROGRESS_PROGRESS_SINK_H_

#include "base/defines.hpp"
#include "xfer/progress/progress_report.hpp"

namespace xferstat {

// Receives the progress reports, called on the reporting task queue.
// Implementations must not block.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void OnTransferProgress(const ProgressReport& report) = 0;
};

} // namespace xferstat

#endif
