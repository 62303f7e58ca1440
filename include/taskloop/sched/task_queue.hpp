// ============================================================================
// taskloop/sched/task_queue.hpp - Unbounded FIFO of Pending Tasks
// ============================================================================
//
// TaskQueue sits between AddTask() and the consumer loop.
//
// - Push() never suspends, never blocks and never fails: the queue is
//   unbounded. If the consumer is parked on WaitNonEmpty(), Push()
//   schedules it on the executor rather than resuming it inline, so the
//   pushing code returns before any queued work starts.
//
// - WaitNonEmpty(token) is the consumer's only suspension point. It yields
//   true once something is queued and false once the token is stopped;
//   there is no polling interval.
//
// - DrainAll() hands over everything queued, oldest first.
//
// One consumer at a time may wait; a second concurrent waiter is a
// programming error.
//
// USAGE:
// ------
//   while (co_await queue.WaitNonEmpty(token)) {
//       for (auto& task : queue.DrainAll()) Launch(std::move(task));
//   }
//
// ============================================================================

#pragma once

#include "taskloop/core/stop_token.hpp"
#include "taskloop/io/executor.hpp"
#include "taskloop/sched/work.hpp"

#include <coroutine>
#include <cstddef>
#include <deque>
#include <utility>
#include <vector>

namespace taskloop {

class TaskQueue {
   public:
    explicit TaskQueue(Executor& executor) : executor_(executor) {}

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    // ========================================================================
    // WaitAwaitable
    // ========================================================================
    class WaitAwaitable {
       public:
        WaitAwaitable(TaskQueue& queue, StopToken token) : queue_(queue), token_(std::move(token)) {}

        bool await_ready() const noexcept { return token_.StopRequested() || !queue_.Empty(); }

        void await_suspend(std::coroutine_handle<> handle);

        // True if items are waiting, false if stopped. A stop wins over
        // queued items: they stay queued for the next consumer.
        bool await_resume();

       private:
        TaskQueue& queue_;
        StopToken token_;
        StopCallbackId stop_callback_ = kNoStopCallback;
    };

    // ========================================================================
    // Public API
    // ========================================================================

    void Push(PendingTask task);

    [[nodiscard]] WaitAwaitable WaitNonEmpty(StopToken token) { return WaitAwaitable(*this, std::move(token)); }

    [[nodiscard]] std::vector<PendingTask> DrainAll();

    size_t Size() const noexcept { return items_.size(); }
    bool Empty() const noexcept { return items_.empty(); }
    bool HasWaiter() const noexcept { return static_cast<bool>(waiter_); }

   private:
    void WakeWaiter();

    Executor& executor_;
    std::deque<PendingTask> items_;
    std::coroutine_handle<> waiter_;
};

}  // namespace taskloop
