#ifndef _XFER_PROGRESS_LOG_PROGRESS_SINK_H_
#define _XFER_PROGRESS_LOG_PROGRESS_SINK_H_

#include "base/defines.hpp"
#include "xfer/progress/progress_sink.hpp"

#include <functional>

namespace xferstat {

// Writes every report as a progress line to the log.
class XFER_CPP_EXPORT LogProgressSink : public ProgressSink {
public:
    LogProgressSink();
    ~LogProgressSink() override;

    void OnTransferProgress(const ProgressReport& report) override;
};

class XFER_CPP_EXPORT CallbackProgressSink : public ProgressSink {
public:
    using Callback = std::function<void(const ProgressReport& report)>;
public:
    explicit CallbackProgressSink(Callback callback);
    ~CallbackProgressSink() override;

    void OnTransferProgress(const ProgressReport& report) override;

private:
    const Callback callback_;
};

} // namespace xferstat

#endif
