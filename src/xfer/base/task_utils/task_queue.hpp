#ifndef _XFER_BASE_TASK_UTILS_TASK_QUEUE_H_
#define _XFER_BASE_TASK_UTILS_TASK_QUEUE_H_

#include "base/defines.hpp"
#include "xfer/base/task_utils/task_queue_impl.hpp"

#include <string>

namespace xferstat {

// Owns a task queue running on its own thread named `name`. Destroying it
// drops the pending delayed tasks and joins the thread.
class XFER_CPP_EXPORT TaskQueue final {
public:
    explicit TaskQueue(std::string name);
    ~TaskQueue();

    template <typename Closure>
    void Post(Closure&& closure) {
        impl_->Post(ToQueuedTask(std::forward<Closure>(closure)));
    }
    template <typename Closure>
    void PostDelayed(TimeDelta delay, Closure&& closure) {
        impl_->PostDelayed(delay, ToQueuedTask(std::forward<Closure>(closure)));
    }

    bool IsCurrent() const { return impl_->IsCurrent(); }

    TaskQueueImpl* Get() const { return impl_.get(); }

private:
    TaskQueueImplPtr impl_;
};

} // namespace xferstat

#endif
