#include "xfer/base/task_utils/task_queue.hpp"
#include "xfer/base/task_utils/task_queue_impl_boost.hpp"

#include <plog/Log.h>

namespace xferstat {

TaskQueue::TaskQueue(std::string name) 
    : impl_(TaskQueueImplBoost::Create(std::move(name))) {}

TaskQueue::~TaskQueue() {
    impl_.reset();
    PLOG_VERBOSE << "Task queue destroyed.";
}

} // namespace xferstat
