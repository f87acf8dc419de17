#ifndef _XFER_BASE_TASK_UTILS_QUEUED_TASK_H_
#define _XFER_BASE_TASK_UTILS_QUEUED_TASK_H_

#include "base/defines.hpp"
#include "xfer/base/task_utils/pending_task_safety_flag.hpp"

#include <type_traits>

namespace xferstat {

// A unit of work posted to a TaskQueueImpl.
class QueuedTask {
public:
    virtual ~QueuedTask() = default;
    virtual void Run() = 0;
};

namespace internal {

template <typename Closure>
class LambdaTask final : public QueuedTask {
public:
    explicit LambdaTask(Closure closure) : closure_(std::move(closure)) {}
    void Run() override { closure_(); }

private:
    Closure closure_;
};

} // namespace internal

template <typename Closure>
std::unique_ptr<QueuedTask> ToQueuedTask(Closure&& closure) {
    using Task = internal::LambdaTask<typename std::decay<Closure>::type>;
    return std::make_unique<Task>(std::forward<Closure>(closure));
}

// The returned task does nothing if `safety_flag` was cleared before it runs.
template <typename Closure>
std::unique_ptr<QueuedTask> ToQueuedTask(std::shared_ptr<PendingTaskSafetyFlag> safety_flag,
                                         Closure&& closure) {
    return ToQueuedTask([safety_flag = std::move(safety_flag), 
                         closure = std::forward<Closure>(closure)]() mutable {
        safety_flag->RunIfAlive(closure);
    });
}
    
} // namespace xferstat

#endif
