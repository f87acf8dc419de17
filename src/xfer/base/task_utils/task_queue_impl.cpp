#include "xfer/base/task_utils/task_queue_impl.hpp"

#include <utility>

namespace xferstat {
namespace {

XFER_CONST_INIT thread_local TaskQueueImpl* tls_task_queue = nullptr;

} // namespace

TaskQueueImpl* TaskQueueImpl::Current() {
    return tls_task_queue;
}

TaskQueueImpl::ScopedCurrent::ScopedCurrent(TaskQueueImpl* task_queue) 
    : outer_(std::exchange(tls_task_queue, task_queue)) {}

TaskQueueImpl::ScopedCurrent::~ScopedCurrent() {
    tls_task_queue = outer_;
}

} // namespace xferstat
