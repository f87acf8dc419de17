#ifndef _XFER_BASE_TASK_UTILS_PENDING_TASK_SAFETY_FLAG_H_
#define _XFER_BASE_TASK_UTILS_PENDING_TASK_SAFETY_FLAG_H_

#include "base/defines.hpp"
#include "base/thread_annotation.hpp"

#include <mutex>

namespace xferstat {

// Shared by an object and the tasks it posts, so the tasks can outlive it.
// Guarded closures are skipped once the flag is cleared. `SetNotAlive`
// waits for a guarded closure running on another thread to return, and may
// be called from inside a guarded closure.
class PendingTaskSafetyFlag final {
public:
    static std::shared_ptr<PendingTaskSafetyFlag> Create();

    bool alive() const XFER_LOCKS_EXCLUDED(mutex_);
    void SetNotAlive() XFER_LOCKS_EXCLUDED(mutex_);

    // Returns whether `closure` ran.
    template <typename Closure>
    bool RunIfAlive(Closure&& closure) XFER_LOCKS_EXCLUDED(mutex_) {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (!alive_) {
            return false;
        }
        closure();
        return true;
    }
    
private:
    PendingTaskSafetyFlag() = default;

    mutable std::recursive_mutex mutex_;
    bool alive_ XFER_GUARDED_BY(mutex_) = true;
};

} // namespace xferstat

#endif
