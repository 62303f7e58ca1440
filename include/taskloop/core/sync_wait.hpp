// ============================================================================
// taskloop/core/sync_wait.hpp - Run a Task to Completion Inline
// ============================================================================
//
// SyncWait() is the bridge from plain code (main(), a test body) into a Task
// that completes without ever suspending on an executor: registry actions,
// lifespan hooks that only flip flags, Result plumbing.
//
// The task is resumed on the calling thread. If it suspends on something
// that needs a running executor (AsyncSleep, the task queue, Stop()),
// nothing would ever resume it, so SyncWait fails a TASKLOOP_CHECK instead
// of hanging. Drive such tasks with Executor::Run().
//
// USAGE:
// ------
//   Status s = SyncWait(job.action());
//
// ============================================================================

#pragma once

#include "taskloop/core/check.hpp"
#include "taskloop/core/task.hpp"

#include <optional>
#include <utility>

namespace taskloop {

namespace detail {

template <typename T>
Task<void> SyncWaitRunner(Task<T> task, std::optional<T>& out, bool& done) {
    out.emplace(co_await std::move(task));
    done = true;
}

inline Task<void> SyncWaitRunner(Task<void> task, bool& done) {
    co_await std::move(task);
    done = true;
}

}  // namespace detail

template <typename T>
T SyncWait(Task<T> task) {
    std::optional<T> result;
    bool done = false;

    auto runner = detail::SyncWaitRunner(std::move(task), result, done);
    runner.GetHandle().resume();

    TASKLOOP_CHECK(done, "SyncWait: task suspended and needs a running executor");
    return std::move(*result);
}

inline void SyncWait(Task<void> task) {
    bool done = false;

    auto runner = detail::SyncWaitRunner(std::move(task), done);
    runner.GetHandle().resume();

    TASKLOOP_CHECK(done, "SyncWait: task suspended and needs a running executor");
}

}  // namespace taskloop
