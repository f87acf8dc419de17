#include "xfer/base/task_utils/pending_task_safety_flag.hpp"

namespace xferstat {

std::shared_ptr<PendingTaskSafetyFlag> PendingTaskSafetyFlag::Create() {
    return std::shared_ptr<PendingTaskSafetyFlag>(new PendingTaskSafetyFlag());
}

bool PendingTaskSafetyFlag::alive() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return alive_;
}

void PendingTaskSafetyFlag::SetNotAlive() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    alive_ = false;
}

} // namespace xferstat
