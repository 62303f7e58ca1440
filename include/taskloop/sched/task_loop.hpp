// ============================================================================
// taskloop/sched/task_loop.hpp - Background Task and Recurring Job Scheduler
// ============================================================================
//
// TaskLoop runs two kinds of work on the executor a host server already
// runs on:
//
// - fire-and-forget tasks queued with AddTask(), executed once each by a
//   consumer coroutine, launched in the order they were queued
// - recurring jobs registered before Start(), each driven by its own runner
//   coroutine that invokes the job, then sleeps out its interval
//
// No unit of work can bring the loop down. A task or job invocation that
// returns an error Status is logged with its label or job name and counted;
// the consumer keeps draining and the runner keeps its schedule.
//
// LIFECYCLE:
// ----------
//   kStopped --Start()--> kStarting --> kRunning --Stop()--> kStopping
//       ^                                                        |
//       +---------------- every runner has exited ---------------+
//
// Start() only schedules runners, so the caller returns before any work
// runs. Stop() signals every runner, interrupting interval sleeps and the
// queue wait but never an invocation in flight, and completes once the
// last runner has exited. A stopped loop can be started again.
//
// Everything runners touch lives in a shared state block they co-own, so
// destroying the TaskLoop while runners are still winding down is safe.
//
// USAGE:
// ------
//   TaskLoop loop(executor);
//
//   auto refresh = loop.Recurring(30s, "refresh-cache")([]() -> Task<Status> {
//       co_return co_await RefreshCache();
//   });
//
//   loop.AddTask("send-welcome", SendWelcomeMail(user));
//   loop.Start();
//   ...
//   co_await loop.Stop();
//
// ============================================================================

#pragma once

#include "taskloop/core/detached_task.hpp"
#include "taskloop/core/error.hpp"
#include "taskloop/core/log.hpp"
#include "taskloop/core/result.hpp"
#include "taskloop/core/stop_token.hpp"
#include "taskloop/core/task.hpp"
#include "taskloop/io/executor.hpp"
#include "taskloop/sched/job_registry.hpp"
#include "taskloop/sched/work.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace taskloop {

enum class LoopState : std::uint8_t {
    kStopped,
    kStarting,
    kRunning,
    kStopping,
};

[[nodiscard]] const char* LoopStateName(LoopState state) noexcept;

// When a job runs for the first time after Start()
enum class FirstRun : std::uint8_t {
    kImmediate,
    kAfterInterval,
};

struct TaskLoopStats {
    std::uint64_t tasks_enqueued = 0;
    std::uint64_t tasks_launched = 0;
    std::uint64_t tasks_succeeded = 0;
    std::uint64_t tasks_failed = 0;
    std::uint64_t job_invocations = 0;
    std::uint64_t job_failures = 0;
};

struct JobStats {
    std::uint64_t invocations = 0;
    std::uint64_t failures = 0;
    Error last_error;
};

class TaskLoop {
   public:
    struct Options {
        // Shared with the runners, so it stays alive until the last one has
        // exited even if the TaskLoop is destroyed first. Empty selects
        // DefaultLogger().
        std::shared_ptr<Logger> logger;
        FirstRun first_run = FirstRun::kImmediate;
    };

    // ========================================================================
    // Registrar - returned by Recurring()
    // ========================================================================
    //
    // Registers the callable it is applied to and hands it back untouched,
    // so the action can still be called directly:
    //
    //   auto cleanup = loop.Recurring(1min)([] { return Cleanup(); });
    //   co_await cleanup();
    //
    class Registrar {
       public:
        Registrar(TaskLoop& loop, std::chrono::milliseconds interval, std::string name)
            : loop_(loop), interval_(interval), name_(std::move(name)) {}

        template <typename F>
        F operator()(F action) {
            using R = std::invoke_result_t<F&>;
            static_assert(std::is_same_v<R, Task<Status>> || std::is_same_v<R, Task<void>>,
                          "recurring actions must return Task<Status> or Task<void>");

            JobAction job_action;
            if constexpr (std::is_same_v<R, Task<void>>) {
                job_action = AdaptVoidAction(action);
            } else {
                job_action = action;
            }

            auto registered = loop_.Register(interval_, name_, std::move(job_action));
            if (registered.IsErr()) {
                loop_.GetLogger().Error("taskloop: recurring job '" + name_ +
                                        "' not registered: " + DescribeError(registered.Error()));
            }
            return action;
        }

       private:
        TaskLoop& loop_;
        std::chrono::milliseconds interval_;
        std::string name_;
    };

    explicit TaskLoop(Executor& executor);
    TaskLoop(Executor& executor, Options options);
    ~TaskLoop();

    TaskLoop(const TaskLoop&) = delete;
    TaskLoop& operator=(const TaskLoop&) = delete;

    // ========================================================================
    // Registration (stopped loop only)
    // ========================================================================

    // Returns the name the job runs under.
    Result<std::string, Error> Register(RecurringJob job);
    Result<std::string, Error> Register(std::chrono::milliseconds interval, std::string name, JobAction action);

    [[nodiscard]] Registrar Recurring(std::chrono::milliseconds interval, std::string name = {}) {
        return Registrar(*this, interval, std::move(name));
    }

    // ========================================================================
    // Fire-and-forget tasks (any state)
    // ========================================================================
    //
    // Queues `work` and returns without running any of it. Returns the
    // label the task is logged under.

    std::string AddTask(Task<Status> work);
    std::string AddTask(std::string label, Task<Status> work);
    std::string AddTask(Task<void> work);
    std::string AddTask(std::string label, Task<void> work);

    // ========================================================================
    // Lifecycle
    // ========================================================================

    Status Start();

    // Completes when every runner has exited; immediately if already
    // stopped. Concurrent callers all wait for the same stop.
    //
    // A job action must not co_await Stop(): its runner cannot exit while
    // the action is suspended, so the wait never completes. Actions call
    // RequestStop() instead.
    [[nodiscard]] Task<void> Stop();

    // Signal the runners without waiting for them. Safe from inside a task
    // or job action.
    void RequestStop();

    // ========================================================================
    // Introspection
    // ========================================================================

    LoopState State() const noexcept;
    bool IsRunning() const noexcept { return State() == LoopState::kRunning; }

    // Tasks queued but not yet launched
    size_t PendingTasks() const noexcept;

    std::vector<std::string> JobNames() const;
    TaskLoopStats GetStats() const;
    std::optional<JobStats> GetJobStats(const std::string& name) const;

    Executor& GetExecutor() const noexcept;
    Logger& GetLogger() const noexcept;

   private:
    struct Shared;

    static Task<void> StopAndWait(std::shared_ptr<Shared> shared);
    static void BeginStop(Shared& shared);
    static void SpawnRunner(const std::shared_ptr<Shared>& shared, Task<void> body);
    static void OnRunnerExit(Shared& shared);

    static void Launch(const std::shared_ptr<Shared>& shared, PendingTask pending);
    static Task<void> ConsumeLoop(std::shared_ptr<Shared> shared, StopToken token);
    static Task<void> RunIsolated(std::shared_ptr<Shared> shared, PendingTask pending);
    static Task<void> RunJob(std::shared_ptr<Shared> shared, RecurringJob job, StopToken token);

    std::shared_ptr<Shared> shared_;
};

}  // namespace taskloop
