// ============================================================================
// taskloop/io/timer.hpp - Cooperative Sleeps
// ============================================================================
//
// AsyncSleep suspends the awaiting coroutine on the current executor for a
// fixed duration. It is what task and job bodies use to wait without
// blocking the loop.
//
// StoppableSleep is the sleep a job runner takes between invocations. It
// races the executor's timer against a StopToken: whichever fires first
// resumes the runner, and a stop withdraws the timer so an hour-long
// interval neither delays Stop() nor keeps the loop alive.
//
// USAGE:
// ------
//   co_await AsyncSleep(50ms);
//
//   bool elapsed = co_await StoppableSleep(executor, interval, token);
//   if (!elapsed) co_return;   // stop requested
//
// ============================================================================

#pragma once

#include "taskloop/core/stop_token.hpp"
#include "taskloop/io/executor.hpp"

#include <chrono>
#include <coroutine>
#include <memory>
#include <utility>

namespace taskloop {

// ============================================================================
// AsyncSleep
// ============================================================================
class AsyncSleep {
   public:
    template <typename Rep, typename Period>
    explicit AsyncSleep(std::chrono::duration<Rep, Period> duration)
        : duration_(std::chrono::duration_cast<std::chrono::milliseconds>(duration)) {}

    bool await_ready() const noexcept { return false; }

    // Without a current executor there is nothing to resume us later, so
    // the sleep completes immediately.
    bool await_suspend(std::coroutine_handle<> handle) const {
        Executor* executor = GetCurrentExecutor();
        if (!executor) {
            return false;
        }
        executor->ScheduleAfter(duration_, handle);
        return true;
    }

    void await_resume() const noexcept {}

   private:
    std::chrono::milliseconds duration_;
};

// ============================================================================
// StoppableSleep
// ============================================================================
class StoppableSleep {
   public:
    template <typename Rep, typename Period>
    StoppableSleep(Executor& executor, std::chrono::duration<Rep, Period> duration, StopToken token)
        : executor_(executor),
          duration_(std::chrono::duration_cast<std::chrono::milliseconds>(duration)),
          token_(std::move(token)) {}

    // Already stopped: don't suspend at all
    bool await_ready() const noexcept { return token_.StopRequested(); }

    void await_suspend(std::coroutine_handle<> handle) {
        state_ = std::make_shared<WakeState>(executor_, handle);

        auto state = state_;
        timer_ = executor_.PostAfter(duration_, [state] { state->Wake(false); });
        stop_callback_ = token_.OnStop([state] { state->Wake(true); });
    }

    // True if the full duration elapsed, false if a stop cut it short.
    bool await_resume() {
        if (!state_) return false;

        token_.RemoveCallback(stop_callback_);
        if (state_->interrupted) {
            executor_.CancelTimer(timer_);
            return false;
        }
        return true;
    }

   private:
    // Shared by the timer callback and the stop callback; the first one to
    // fire schedules the sleeper, the other finds `woken` set.
    struct WakeState {
        WakeState(Executor& ex, std::coroutine_handle<> h) : executor(ex), waiter(h) {}

        void Wake(bool by_stop) {
            if (woken) return;
            woken = true;
            interrupted = by_stop;
            executor.Schedule(waiter);
        }

        Executor& executor;
        std::coroutine_handle<> waiter;
        bool woken = false;
        bool interrupted = false;
    };

    Executor& executor_;
    std::chrono::milliseconds duration_;
    StopToken token_;
    std::shared_ptr<WakeState> state_;
    TimerId timer_ = kInvalidTimerId;
    StopCallbackId stop_callback_ = kNoStopCallback;
};

}  // namespace taskloop
