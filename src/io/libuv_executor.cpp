// ============================================================================
// taskloop/io/libuv_executor.cpp - libuv-based Event Loop Implementation
// ============================================================================

#include "taskloop/io/libuv_executor.hpp"

#include "taskloop/core/check.hpp"

#include <utility>

namespace taskloop {

// ============================================================================
// Construction / Destruction
// ============================================================================

LibuvExecutor::LibuvExecutor() = default;

Result<std::unique_ptr<LibuvExecutor>, Error> LibuvExecutor::Create() {
    auto executor = std::unique_ptr<LibuvExecutor>(new LibuvExecutor());

    int result = uv_loop_init(&executor->loop_);
    if (result != 0) return Err(make_error_code(Errc::IoError));

    result = uv_async_init(&executor->loop_, &executor->async_, OnAsync);
    if (result != 0) {
        uv_loop_close(&executor->loop_);
        return Err(make_error_code(Errc::IoError));
    }
    executor->async_.data = executor.get();

    result = uv_idle_init(&executor->loop_, &executor->idle_);
    if (result != 0) {
        uv_close(reinterpret_cast<uv_handle_t*>(&executor->async_), nullptr);
        uv_run(&executor->loop_, UV_RUN_ONCE);
        uv_loop_close(&executor->loop_);
        return Err(make_error_code(Errc::IoError));
    }
    executor->idle_.data = executor.get();

    return Ok(std::move(executor));
}

LibuvExecutor::~LibuvExecutor() {
    if (running_) {
        Stop();
    }

    uv_close(reinterpret_cast<uv_handle_t*>(&async_), nullptr);
    uv_close(reinterpret_cast<uv_handle_t*>(&idle_), nullptr);

    // Pending callback timers (an interrupted job interval, a sleep nobody
    // waits for any more) must not hold the loop open until they expire.
    auto timers = std::move(active_timers_);
    for (auto& [id, timer] : timers) {
        CloseTimer(timer);
    }

    // Resumption timers from ScheduleAfter() still run to completion: the
    // coroutine frames they resume are owned elsewhere.
    while (uv_loop_alive(&loop_)) {
        uv_run(&loop_, UV_RUN_ONCE);
    }

    uv_loop_close(&loop_);
}

// ============================================================================
// Event Loop Control
// ============================================================================

void LibuvExecutor::Run() {
    running_ = true;
    ExecutorGuard guard(this);
    uv_run(&loop_, UV_RUN_DEFAULT);
    running_ = false;
}

void LibuvExecutor::RunOnce() {
    ExecutorGuard guard(this);
    uv_run(&loop_, UV_RUN_NOWAIT);
}

void LibuvExecutor::Stop() {
    uv_stop(&loop_);
    running_ = false;
}

bool LibuvExecutor::IsRunning() const {
    return running_;
}

// ============================================================================
// Scheduling
// ============================================================================

void LibuvExecutor::Schedule(std::coroutine_handle<> handle) {
    TASKLOOP_CHECK(handle, "Schedule() with a null coroutine handle");
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        ready_queue_.push(handle);
    }
    uv_async_send(&async_);
}

void LibuvExecutor::ScheduleAfter(std::chrono::milliseconds delay, std::coroutine_handle<> handle) {
    TASKLOOP_CHECK(handle, "ScheduleAfter() with a null coroutine handle");
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        timer_queue_.push({delay, handle});
    }
    uv_async_send(&async_);
}

void LibuvExecutor::Post(std::function<void()> callback) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        callback_queue_.push(std::move(callback));
    }
    uv_async_send(&async_);
}

TimerId LibuvExecutor::PostAfter(std::chrono::milliseconds delay, std::function<void()> callback) {
    TimerId id = next_timer_id_.fetch_add(1, std::memory_order_relaxed);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        callback_timer_queue_.push({id, delay, std::move(callback)});
    }
    uv_async_send(&async_);
    return id;
}

void LibuvExecutor::CancelTimer(TimerId id) {
    if (id == kInvalidTimerId) return;

    // On the loop thread an armed timer is retired right away. A timer whose
    // PostAfter() request has not been processed yet goes through the queue.
    if (GetCurrentExecutor() == this) {
        auto it = active_timers_.find(id);
        if (it != active_timers_.end()) {
            uv_timer_t* timer = it->second;
            active_timers_.erase(it);
            CloseTimer(timer);
            return;
        }
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        cancel_queue_.push_back(id);
    }
    uv_async_send(&async_);
}

// ============================================================================
// libuv Callbacks
// ============================================================================

void LibuvExecutor::OnAsync(uv_async_t* handle) {
    auto* self = static_cast<LibuvExecutor*>(handle->data);
    if (!self->idle_active_) {
        uv_idle_start(&self->idle_, OnIdle);
        self->idle_active_ = true;
    }
}

void LibuvExecutor::OnTimer(uv_timer_t* handle) {
    auto* entry = static_cast<TimerEntry*>(handle->data);

    if (entry->id != kInvalidTimerId) {
        entry->owner->active_timers_.erase(entry->id);
    }

    // Close first: the callback may re-enter the executor (PostAfter,
    // CancelTimer on its own id) and must find this timer already retired.
    auto callback = std::move(entry->callback);
    auto resume = entry->handle;
    uv_close(reinterpret_cast<uv_handle_t*>(handle), OnTimerClose);

    if (resume) {
        resume.resume();
    } else if (callback) {
        callback();
    }
}

void LibuvExecutor::OnIdle(uv_idle_t* handle) {
    auto* self = static_cast<LibuvExecutor*>(handle->data);
    self->ProcessReadyQueue();

    std::lock_guard<std::mutex> lock(self->queue_mutex_);
    if (self->ready_queue_.empty() && self->callback_queue_.empty() && self->timer_queue_.empty() &&
        self->callback_timer_queue_.empty() && self->cancel_queue_.empty()) {
        uv_idle_stop(handle);
        self->idle_active_ = false;
    }
}

void LibuvExecutor::OnTimerClose(uv_handle_t* handle) {
    auto* timer = reinterpret_cast<uv_timer_t*>(handle);
    delete static_cast<TimerEntry*>(timer->data);
    delete timer;
}

// ============================================================================
// Internal Helpers
// ============================================================================

bool LibuvExecutor::StartTimer(TimerEntry* entry, std::chrono::milliseconds delay) {
    auto* timer = new uv_timer_t;
    if (uv_timer_init(&loop_, timer) != 0) {
        delete timer;
        return false;
    }
    timer->data = entry;
    uint64_t timeout = delay.count() > 0 ? static_cast<uint64_t>(delay.count()) : 0;
    uv_timer_start(timer, OnTimer, timeout, 0);

    if (entry->id != kInvalidTimerId) {
        active_timers_.emplace(entry->id, timer);
    }
    return true;
}

void LibuvExecutor::CloseTimer(uv_timer_t* timer) {
    uv_timer_stop(timer);
    uv_close(reinterpret_cast<uv_handle_t*>(timer), OnTimerClose);
}

void LibuvExecutor::ProcessReadyQueue() {
    std::queue<std::coroutine_handle<>> ready;
    std::queue<std::function<void()>> callbacks;
    std::queue<TimerRequest> timers;
    std::queue<CallbackTimerRequest> callback_timers;
    std::vector<TimerId> cancels;

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        std::swap(ready, ready_queue_);
        std::swap(callbacks, callback_queue_);
        std::swap(timers, timer_queue_);
        std::swap(callback_timers, callback_timer_queue_);
        std::swap(cancels, cancel_queue_);
    }

    while (!ready.empty()) {
        auto handle = ready.front();
        ready.pop();
        handle.resume();
    }

    while (!callbacks.empty()) {
        auto callback = std::move(callbacks.front());
        callbacks.pop();
        callback();
    }

    while (!timers.empty()) {
        auto req = timers.front();
        timers.pop();

        auto* entry = new TimerEntry{this, kInvalidTimerId, req.handle, nullptr};
        if (!StartTimer(entry, req.delay)) {
            // No timer available: resume now rather than strand the coroutine
            delete entry;
            req.handle.resume();
        }
    }

    while (!callback_timers.empty()) {
        auto req = std::move(callback_timers.front());
        callback_timers.pop();

        auto* entry = new TimerEntry{this, req.id, nullptr, std::move(req.callback)};
        if (!StartTimer(entry, req.delay)) {
            auto callback = std::move(entry->callback);
            delete entry;
            callback();
        }
    }

    // Cancellations run after creation so a PostAfter()/CancelTimer() pair
    // that lands in the same batch still cancels.
    for (TimerId id : cancels) {
        auto it = active_timers_.find(id);
        if (it == active_timers_.end()) continue;  // already fired
        uv_timer_t* timer = it->second;
        active_timers_.erase(it);
        CloseTimer(timer);
    }
}

}  // namespace taskloop
