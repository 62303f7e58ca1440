// ============================================================================
// taskloop/core/detached_task.hpp - Self-Destroying Coroutine
// ============================================================================
//
// DetachedTask is the coroutine type for work nobody awaits. TaskLoop wraps
// the consumer loop, each job runner and the isolating wrapper around every
// fire-and-forget task in one with MakeDetached(). Its frame destroys itself when the body finishes,
// after invoking an optional completion callback.
//
// KEY DESIGN:
// -----------
// - initial_suspend -> suspend_always (nothing runs at creation)
// - final_suspend   -> run callback, then destroy the frame
// - ScheduleOn()    -> hand the first resumption to an executor, so the
//                      caller returns before any of the body runs
// - A DetachedTask that is never started destroys its frame in the
//   destructor; once started, the frame owns itself.
//
// USAGE:
// ------
//   auto runner = MakeDetached(Watch(state));
//   runner.SetCallback([state] { state->live_runners--; });
//   runner.ScheduleOn(executor);
//
// ============================================================================

#pragma once

#include "taskloop/core/check.hpp"
#include "taskloop/core/task.hpp"
#include "taskloop/io/executor.hpp"

#include <coroutine>
#include <cstdlib>
#include <functional>
#include <utility>

namespace taskloop {

class DetachedTask {
   public:
    struct promise_type {
        std::function<void()> callback;

        DetachedTask get_return_object() noexcept {
            return DetachedTask{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        std::suspend_always initial_suspend() noexcept { return {}; }

        auto final_suspend() noexcept {
            struct FinalAwaiter {
                bool await_ready() noexcept { return false; }
                void await_suspend(std::coroutine_handle<promise_type> h) noexcept {
                    // The frame is gone before the callback runs, so the
                    // callback may tear down state the frame referenced.
                    auto callback = std::move(h.promise().callback);
                    h.destroy();
                    if (callback) {
                        callback();
                    }
                }
                void await_resume() noexcept {}
            };
            return FinalAwaiter{};
        }

        void return_void() noexcept {}

        // Consumers are built with -fno-exceptions; nothing can reach this.
        void unhandled_exception() noexcept { std::abort(); }
    };

    using Handle = std::coroutine_handle<promise_type>;

    explicit DetachedTask(Handle h) noexcept : handle_(h) {}

    DetachedTask(DetachedTask&& other) noexcept
        : handle_(std::exchange(other.handle_, nullptr)), started_(other.started_) {}

    DetachedTask& operator=(DetachedTask&& other) noexcept {
        if (this != &other) {
            if (handle_ && !started_) {
                handle_.destroy();
            }
            handle_ = std::exchange(other.handle_, nullptr);
            started_ = other.started_;
        }
        return *this;
    }

    DetachedTask(const DetachedTask&) = delete;
    DetachedTask& operator=(const DetachedTask&) = delete;

    ~DetachedTask() {
        if (handle_ && !started_) {
            handle_.destroy();
        }
    }

    void SetCallback(std::function<void()> cb) {
        TASKLOOP_CHECK(handle_ && !started_, "SetCallback on a started or empty DetachedTask");
        handle_.promise().callback = std::move(cb);
    }

    void ScheduleOn(Executor& executor) {
        TASKLOOP_CHECK(handle_ && !started_, "DetachedTask started twice");
        started_ = true;
        executor.Schedule(handle_);
    }

   private:
    Handle handle_;
    bool started_ = false;
};

// Wrap a Task<void> so it can run without an awaiting owner.
inline DetachedTask MakeDetached(Task<void> task) {
    co_await std::move(task);
}

}  // namespace taskloop
