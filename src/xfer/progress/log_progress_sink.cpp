#include "xfer/progress/log_progress_sink.hpp"

#include <plog/Log.h>

#include <stdexcept>

namespace xferstat {

// LogProgressSink
LogProgressSink::LogProgressSink() = default;

LogProgressSink::~LogProgressSink() = default;

void LogProgressSink::OnTransferProgress(const ProgressReport& report) {
    PLOG_INFO << report.ToString();
}

// CallbackProgressSink
CallbackProgressSink::CallbackProgressSink(Callback callback) 
    : callback_(std::move(callback)) {
    if (!callback_) {
        throw std::invalid_argument("Progress callback must not be empty.");
    }
}

CallbackProgressSink::~CallbackProgressSink() = default;

void CallbackProgressSink::OnTransferProgress(const ProgressReport& report) {
    callback_(report);
}

} // namespace xferstat
