// ============================================================================
// taskloop/io/libuv_executor.hpp - libuv-based Event Loop
// ============================================================================
//
// LibuvExecutor is the Executor a host server runs on. It wraps a libuv
// loop, the same event loop the host's sockets live on, so request
// handling, recurring jobs and background tasks interleave on one thread.
//
// ARCHITECTURE:
// -------------
// - uv_loop_t:  the event loop
// - uv_async_t: wakes the loop when work is queued (from any thread)
// - uv_idle_t:  drains the ready/callback/timer queues while work exists
// - uv_timer_t: one per ScheduleAfter()/PostAfter(), created on the loop
//               thread only (libuv timers are not thread-safe)
//
// Callback timers from PostAfter() are tracked by id so CancelTimer() can
// stop them, and so the destructor can close any that are still pending
// instead of waiting for them to expire. CancelTimer() on the loop thread
// retires an armed timer before it returns; from other threads it is
// queued like every other request.
//
// ============================================================================

#pragma once

#include "taskloop/core/error.hpp"
#include "taskloop/core/result.hpp"
#include "taskloop/io/executor.hpp"

#include <atomic>
#include <chrono>
#include <coroutine>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <unordered_map>
#include <uv.h>
#include <vector>

namespace taskloop {

class LibuvExecutor : public Executor {
   public:
    // Returns an error if libuv fails to initialize its loop or handles.
    static Result<std::unique_ptr<LibuvExecutor>, Error> Create();

    ~LibuvExecutor() override;

    LibuvExecutor(const LibuvExecutor&) = delete;
    LibuvExecutor& operator=(const LibuvExecutor&) = delete;

    // ========================================================================
    // Executor Interface
    // ========================================================================

    void Run() override;
    void RunOnce() override;
    void Stop() override;
    bool IsRunning() const override;

    void Schedule(std::coroutine_handle<> handle) override;
    void ScheduleAfter(std::chrono::milliseconds delay, std::coroutine_handle<> handle) override;
    void Post(std::function<void()> callback) override;
    TimerId PostAfter(std::chrono::milliseconds delay, std::function<void()> callback) override;
    void CancelTimer(TimerId id) override;

    // Callback timers currently armed on the loop (loop thread only)
    size_t ActiveTimerCount() const { return active_timers_.size(); }

   private:
    LibuvExecutor();

    // Payload of every uv_timer_t we create. Exactly one of `handle` and
    // `callback` is set.
    struct TimerEntry {
        LibuvExecutor* owner = nullptr;
        TimerId id = kInvalidTimerId;
        std::coroutine_handle<> handle;
        std::function<void()> callback;
    };

    struct TimerRequest {
        std::chrono::milliseconds delay;
        std::coroutine_handle<> handle;
    };

    struct CallbackTimerRequest {
        TimerId id;
        std::chrono::milliseconds delay;
        std::function<void()> callback;
    };

    static void OnAsync(uv_async_t* handle);
    static void OnTimer(uv_timer_t* handle);
    static void OnIdle(uv_idle_t* handle);
    static void OnTimerClose(uv_handle_t* handle);

    void ProcessReadyQueue();
    bool StartTimer(TimerEntry* entry, std::chrono::milliseconds delay);
    void CloseTimer(uv_timer_t* timer);

    uv_loop_t loop_;
    uv_async_t async_;
    uv_idle_t idle_;
    std::atomic<bool> running_{false};
    bool idle_active_ = false;

    // Guarded by queue_mutex_; filled from any thread
    std::mutex queue_mutex_;
    std::queue<std::coroutine_handle<>> ready_queue_;
    std::queue<std::function<void()>> callback_queue_;
    std::queue<TimerRequest> timer_queue_;
    std::queue<CallbackTimerRequest> callback_timer_queue_;
    std::vector<TimerId> cancel_queue_;

    std::atomic<TimerId> next_timer_id_{kInvalidTimerId + 1};

    // Loop thread only
    std::unordered_map<TimerId, uv_timer_t*> active_timers_;
};

}  // namespace taskloop
