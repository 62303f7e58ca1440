// ============================================================================
// taskloop/core/task.hpp - Lazy Coroutine Type
// ============================================================================
//
// Task<T> is the unit of asynchronous work everywhere in taskloop: the body
// of a fire-and-forget task, one invocation of a recurring job, the Stop()
// handshake of the controller.
//
// A Task is LAZY. Creating it allocates the coroutine frame but runs nothing;
// the body starts when the Task is co_awaited (or when its handle is resumed
// by an executor). This is what lets AddTask() capture work at enqueue time
// and defer every line of it to the consumer.
//
// When the body finishes, control transfers straight back to the awaiting
// coroutine (symmetric transfer), so long await chains do not grow the stack.
//
// USAGE:
// ------
//   Task<int> CountRows() { co_return 42; }
//
//   Task<Status> Report() {
//       int rows = co_await CountRows();
//       if (rows == 0) co_return Err(make_error_code(Errc::TaskFailed));
//       co_return Ok();
//   }
//
// ============================================================================

#pragma once

#include "taskloop/core/check.hpp"

#include <coroutine>
#include <cstdlib>
#include <optional>
#include <utility>

namespace taskloop {

// ============================================================================
// Symmetric transfer
// ============================================================================
// GCC with AddressSanitizer does not emit the tail call that symmetric
// transfer relies on (https://gcc.gnu.org/bugzilla/show_bug.cgi?id=100897).
// Under that combination await_suspend resumes the target directly instead.
//
#if defined(__GNUG__) && !defined(__clang__) && defined(__SANITIZE_ADDRESS__)
#define TASKLOOP_ASAN_SYMMETRIC_TRANSFER_BROKEN 1
#else
#define TASKLOOP_ASAN_SYMMETRIC_TRANSFER_BROKEN 0
#endif

#if TASKLOOP_ASAN_SYMMETRIC_TRANSFER_BROKEN
using SymmetricTransferResult = void;

inline void SymmetricTransfer(std::coroutine_handle<> target) noexcept {
    target.resume();
}
#else
using SymmetricTransferResult = std::coroutine_handle<>;

inline std::coroutine_handle<> SymmetricTransfer(std::coroutine_handle<> target) noexcept {
    return target;
}
#endif

template <typename T>
class Task;

namespace detail {

// Shared by TaskPromise<T> and TaskPromise<void>: continuation bookkeeping
// and the final awaiter that hands control back to whoever awaited us.
class TaskPromiseBase {
   public:
    std::suspend_always initial_suspend() noexcept { return {}; }

    template <typename Promise>
    struct FinalAwaiter {
        bool await_ready() noexcept { return false; }

        SymmetricTransferResult await_suspend(std::coroutine_handle<Promise> finishing) noexcept {
            auto continuation = static_cast<TaskPromiseBase&>(finishing.promise()).continuation_;
            return SymmetricTransfer(continuation ? continuation : std::noop_coroutine());
        }

        void await_resume() noexcept {}
    };

    // -fno-exceptions is part of the taskloop usage requirements, so no
    // task body can throw. Nothing can reach this.
    void unhandled_exception() noexcept { std::abort(); }

    void SetContinuation(std::coroutine_handle<> cont) noexcept {
        TASKLOOP_CHECK(!awaited_, "Task co_awaited twice");
        awaited_ = true;
        continuation_ = cont;
    }

   private:
    std::coroutine_handle<> continuation_;
    bool awaited_ = false;
};

}  // namespace detail

// ============================================================================
// TaskPromise<T>
// ============================================================================
template <typename T>
class TaskPromise : public detail::TaskPromiseBase {
   public:
    Task<T> get_return_object() noexcept;

    FinalAwaiter<TaskPromise> final_suspend() noexcept { return {}; }

    void return_value(T value) noexcept { result_ = std::move(value); }

    T&& GetResult() && noexcept { return std::move(result_.value()); }

   private:
    std::optional<T> result_;
};

template <>
class TaskPromise<void> : public detail::TaskPromiseBase {
   public:
    Task<void> get_return_object() noexcept;

    FinalAwaiter<TaskPromise> final_suspend() noexcept { return {}; }

    void return_void() noexcept {}

    void GetResult() && noexcept {}
};

// ============================================================================
// Task<T>
// ============================================================================
// Move-only owner of the coroutine frame. The destructor destroys the frame,
// so a Task that is dropped before being awaited simply never runs.
//
template <typename T>
class [[nodiscard("Task must be co_awaited or handed to a scheduler")]] Task {
   public:
    using promise_type = TaskPromise<T>;
    using Handle = std::coroutine_handle<promise_type>;

    explicit Task(Handle handle) noexcept : handle_(handle) {}

    ~Task() {
        if (handle_) {
            handle_.destroy();
        }
    }

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    Task(Task&& other) noexcept : handle_(std::exchange(other.handle_, nullptr)) {}

    Task& operator=(Task&& other) noexcept {
        if (this != &other) {
            if (handle_) {
                handle_.destroy();
            }
            handle_ = std::exchange(other.handle_, nullptr);
        }
        return *this;
    }

    struct Awaiter {
        Handle handle_;

        bool await_ready() noexcept { return false; }

        // Record who is waiting, then start (or continue) the task body.
        SymmetricTransferResult await_suspend(std::coroutine_handle<> awaiting) noexcept {
            handle_.promise().SetContinuation(awaiting);
            return SymmetricTransfer(handle_);
        }

        T await_resume() noexcept { return std::move(handle_.promise()).GetResult(); }
    };

    [[nodiscard]] Awaiter operator co_await() noexcept {
        TASKLOOP_CHECK(handle_, "co_await on an empty Task");
        return Awaiter{handle_};
    }

    [[nodiscard]] Handle GetHandle() const noexcept { return handle_; }

    // False for a moved-from Task.
    [[nodiscard]] bool Valid() const noexcept { return static_cast<bool>(handle_); }

   private:
    Handle handle_;
};

template <typename T>
Task<T> TaskPromise<T>::get_return_object() noexcept {
    return Task<T>{Task<T>::Handle::from_promise(*this)};
}

inline Task<void> TaskPromise<void>::get_return_object() noexcept {
    return Task<void>{Task<void>::Handle::from_promise(*this)};
}

}  // namespace taskloop
