// ============================================================================
// taskloop/sched/task_queue.cpp - Task Queue Implementation
// ============================================================================

#include "taskloop/sched/task_queue.hpp"

#include "taskloop/core/check.hpp"

#include <utility>

namespace taskloop {

void TaskQueue::WaitAwaitable::await_suspend(std::coroutine_handle<> handle) {
    TASKLOOP_CHECK(!queue_.waiter_, "TaskQueue supports a single waiting consumer");
    queue_.waiter_ = handle;

    TaskQueue* queue = &queue_;
    stop_callback_ = token_.OnStop([queue, handle] {
        if (queue->waiter_ == handle) {
            queue->WakeWaiter();
        }
    });
}

bool TaskQueue::WaitAwaitable::await_resume() {
    token_.RemoveCallback(stop_callback_);
    stop_callback_ = kNoStopCallback;
    return !token_.StopRequested();
}

void TaskQueue::Push(PendingTask task) {
    TASKLOOP_CHECK(task.work.Valid(), "TaskQueue::Push() with an empty Task");
    items_.push_back(std::move(task));
    WakeWaiter();
}

std::vector<PendingTask> TaskQueue::DrainAll() {
    std::vector<PendingTask> batch;
    batch.reserve(items_.size());
    while (!items_.empty()) {
        batch.push_back(std::move(items_.front()));
        items_.pop_front();
    }
    return batch;
}

void TaskQueue::WakeWaiter() {
    if (!waiter_) return;
    auto handle = std::exchange(waiter_, nullptr);
    executor_.Schedule(handle);
}

}  // namespace taskloop
