// ============================================================================
// taskloop/io/executor.hpp - Host Execution Context Interface
// ============================================================================
//
// The Executor is the single-threaded cooperative context the scheduler
// shares with the host server. TaskLoop never owns a thread or an event
// loop of its own: it only schedules coroutine resumptions and timers onto
// the Executor it was given.
//
// DESIGN PHILOSOPHY:
// ------------------
// 1. SINGLE-THREADED: Every resumption happens on the thread running Run().
//    Code between two suspension points runs without interruption, which
//    is the only mutual exclusion the scheduler relies on.
//
// 2. NEVER INLINE: Schedule() and Post() only queue. A caller that
//    schedules work always returns before that work starts.
//
// 3. CANCELLABLE TIMERS: PostAfter() returns a TimerId so an interval
//    sleep interrupted by Stop() can withdraw its timer instead of leaving
//    it to keep the loop alive.
//
// USAGE:
// ------
//   Executor& exec = *GetCurrentExecutor();
//   exec.Schedule(handle);
//   TimerId id = exec.PostAfter(5s, [] { ... });
//   exec.CancelTimer(id);
//
// ============================================================================

#pragma once

#include <chrono>
#include <coroutine>
#include <cstdint>
#include <functional>

namespace taskloop {

using TimerId = std::uint64_t;

// Never returned by PostAfter(); CancelTimer(kInvalidTimerId) is a no-op.
inline constexpr TimerId kInvalidTimerId = 0;

class Executor {
   public:
    virtual ~Executor() = default;

    // ========================================================================
    // Event Loop Control
    // ========================================================================

    // Run until Stop() is called or no work remains
    virtual void Run() = 0;

    // One non-blocking iteration
    virtual void RunOnce() = 0;

    virtual void Stop() = 0;

    [[nodiscard]] virtual bool IsRunning() const = 0;

    // ========================================================================
    // Coroutine Scheduling
    // ========================================================================

    virtual void Schedule(std::coroutine_handle<> handle) = 0;

    // Resume `handle` after `delay`. Not cancellable.
    virtual void ScheduleAfter(std::chrono::milliseconds delay, std::coroutine_handle<> handle) = 0;

    // ========================================================================
    // Callbacks
    // ========================================================================

    virtual void Post(std::function<void()> callback) = 0;

    // Run `callback` after `delay` unless CancelTimer() gets there first.
    virtual TimerId PostAfter(std::chrono::milliseconds delay, std::function<void()> callback) = 0;

    // Withdraw a pending PostAfter() callback. Cancelling a timer that
    // already fired or was already cancelled has no effect.
    virtual void CancelTimer(TimerId id) = 0;
};

// ============================================================================
// Thread-Local Executor Access
// ============================================================================

[[nodiscard]] Executor* GetCurrentExecutor();

void SetCurrentExecutor(Executor* executor);

class ExecutorGuard {
   public:
    explicit ExecutorGuard(Executor* executor);
    ~ExecutorGuard();

    ExecutorGuard(const ExecutorGuard&) = delete;
    ExecutorGuard& operator=(const ExecutorGuard&) = delete;

   private:
    Executor* previous_;
};

}  // namespace taskloop
