// ============================================================================
// taskloop/sched/task_loop.cpp - TaskLoop Implementation
// ============================================================================

#include "taskloop/sched/task_loop.hpp"

#include "taskloop/core/check.hpp"
#include "taskloop/io/timer.hpp"
#include "taskloop/sched/task_queue.hpp"

#include <coroutine>
#include <unordered_map>
#include <utility>

namespace taskloop {

const char* LoopStateName(LoopState state) noexcept {
    switch (state) {
        case LoopState::kStopped:
            return "stopped";
        case LoopState::kStarting:
            return "starting";
        case LoopState::kRunning:
            return "running";
        case LoopState::kStopping:
            return "stopping";
    }
    return "unknown";
}

// ============================================================================
// Shared state
// ============================================================================
//
// Owned jointly by the TaskLoop and every runner, launched task and stop
// waiter. Touched from the executor's thread only.
//
struct TaskLoop::Shared {
    Shared(Executor& ex, Options options)
        : executor(ex),
          logger_owner(options.logger ? std::move(options.logger)
                                      : std::shared_ptr<Logger>(std::shared_ptr<Logger>{}, &DefaultLogger())),
          logger(*logger_owner),
          first_run(options.first_run),
          queue(ex) {}

    Executor& executor;
    // Non-owning alias when DefaultLogger() is in use
    std::shared_ptr<Logger> logger_owner;
    Logger& logger;
    FirstRun first_run;

    TaskQueue queue;
    JobRegistry registry;

    LoopState state = LoopState::kStopped;
    StopSource stop_source;
    size_t live_runners = 0;
    std::vector<std::coroutine_handle<>> stop_waiters;

    std::uint64_t next_task_seq = 1;
    TaskLoopStats stats;
    std::unordered_map<std::string, JobStats> job_stats;
};

namespace {

std::string Quoted(const std::string& name) {
    return "'" + name + "'";
}

}  // namespace

TaskLoop::TaskLoop(Executor& executor) : TaskLoop(executor, Options{}) {}

TaskLoop::TaskLoop(Executor& executor, Options options)
    : shared_(std::make_shared<Shared>(executor, std::move(options))) {}

TaskLoop::~TaskLoop() {
    if (shared_->state == LoopState::kRunning || shared_->state == LoopState::kStarting) {
        BeginStop(*shared_);
    }
}

// ============================================================================
// Registration
// ============================================================================

Result<std::string, Error> TaskLoop::Register(RecurringJob job) {
    Shared& s = *shared_;
    if (s.state != LoopState::kStopped) {
        s.logger.Warn("taskloop: cannot register job " + Quoted(job.name) + " while the loop is " +
                      LoopStateName(s.state));
        return Err(make_error_code(Errc::AlreadyRunning));
    }

    auto interval = job.interval;
    auto added = s.registry.Add(std::move(job));
    if (added.IsErr()) {
        return added;
    }

    s.job_stats.try_emplace(added.Value());
    s.logger.Debug("taskloop: registered job " + Quoted(added.Value()) + " every " +
                   std::to_string(interval.count()) + "ms");
    return added;
}

Result<std::string, Error> TaskLoop::Register(std::chrono::milliseconds interval, std::string name,
                                              JobAction action) {
    return Register(RecurringJob{std::move(name), interval, std::move(action)});
}

// ============================================================================
// Fire-and-forget tasks
// ============================================================================

std::string TaskLoop::AddTask(Task<Status> work) {
    return AddTask(std::string{}, std::move(work));
}

std::string TaskLoop::AddTask(std::string label, Task<Status> work) {
    TASKLOOP_CHECK(work.Valid(), "AddTask() with an empty Task");
    Shared& s = *shared_;

    std::uint64_t seq = s.next_task_seq++;
    if (label.empty()) {
        label = "task-" + std::to_string(seq);
    }

    s.stats.tasks_enqueued++;
    s.logger.Trace("taskloop: queued task " + Quoted(label));

    std::string result = label;
    s.queue.Push(PendingTask{std::move(label), std::move(work)});
    return result;
}

std::string TaskLoop::AddTask(Task<void> work) {
    TASKLOOP_CHECK(work.Valid(), "AddTask() with an empty Task");
    return AddTask(std::string{}, AsStatusTask(std::move(work)));
}

std::string TaskLoop::AddTask(std::string label, Task<void> work) {
    TASKLOOP_CHECK(work.Valid(), "AddTask() with an empty Task");
    return AddTask(std::move(label), AsStatusTask(std::move(work)));
}

// ============================================================================
// Lifecycle
// ============================================================================

Status TaskLoop::Start() {
    Shared& s = *shared_;
    if (s.state != LoopState::kStopped) {
        s.logger.Warn(std::string("taskloop: Start() ignored, the loop is ") + LoopStateName(s.state));
        return Err(make_error_code(Errc::AlreadyRunning));
    }

    s.state = LoopState::kStarting;
    s.stop_source = StopSource{};
    StopToken token = s.stop_source.GetToken();

    for (const RecurringJob& job : s.registry) {
        SpawnRunner(shared_, RunJob(shared_, job, token));
    }
    SpawnRunner(shared_, ConsumeLoop(shared_, token));

    s.state = LoopState::kRunning;
    s.logger.Info("taskloop: started with " + std::to_string(s.registry.Size()) + " recurring job(s), " +
                  std::to_string(s.queue.Size()) + " task(s) pending");
    return Ok();
}

Task<void> TaskLoop::Stop() {
    return StopAndWait(shared_);
}

void TaskLoop::RequestStop() {
    BeginStop(*shared_);
}

Task<void> TaskLoop::StopAndWait(std::shared_ptr<Shared> shared) {
    if (shared->state == LoopState::kStopped) {
        shared->logger.Info("taskloop: Stop() on a loop that is not running");
        co_return;
    }

    BeginStop(*shared);

    struct StopAwaiter {
        Shared& shared;

        bool await_ready() const noexcept { return shared.state == LoopState::kStopped; }
        void await_suspend(std::coroutine_handle<> handle) { shared.stop_waiters.push_back(handle); }
        void await_resume() const noexcept {}
    };

    co_await StopAwaiter{*shared};
}

void TaskLoop::BeginStop(Shared& s) {
    if (s.state != LoopState::kRunning && s.state != LoopState::kStarting) {
        return;
    }
    s.state = LoopState::kStopping;
    s.logger.Info("taskloop: stopping " + std::to_string(s.live_runners) + " runner(s)");
    s.stop_source.RequestStop();
}

void TaskLoop::SpawnRunner(const std::shared_ptr<Shared>& shared, Task<void> body) {
    shared->live_runners++;
    auto runner = MakeDetached(std::move(body));
    runner.SetCallback([shared] { OnRunnerExit(*shared); });
    runner.ScheduleOn(shared->executor);
}

void TaskLoop::OnRunnerExit(Shared& s) {
    TASKLOOP_CHECK(s.live_runners > 0, "runner exit without a live runner");
    if (--s.live_runners > 0 || s.state != LoopState::kStopping) {
        return;
    }

    s.state = LoopState::kStopped;
    s.logger.Info("taskloop: stopped");

    auto waiters = std::move(s.stop_waiters);
    s.stop_waiters.clear();
    for (auto handle : waiters) {
        s.executor.Schedule(handle);
    }
}

// ============================================================================
// Runners
// ============================================================================

Task<void> TaskLoop::ConsumeLoop(std::shared_ptr<Shared> shared, StopToken token) {
    shared->logger.Debug("taskloop: task consumer started");

    while (co_await shared->queue.WaitNonEmpty(token)) {
        // No suspension until the whole batch is launched
        for (auto& pending : shared->queue.DrainAll()) {
            Launch(shared, std::move(pending));
        }
    }

    shared->logger.Debug("taskloop: task consumer exited, " + std::to_string(shared->queue.Size()) +
                         " task(s) left queued");
}

void TaskLoop::Launch(const std::shared_ptr<Shared>& shared, PendingTask pending) {
    shared->stats.tasks_launched++;
    MakeDetached(RunIsolated(shared, std::move(pending))).ScheduleOn(shared->executor);
}

Task<void> TaskLoop::RunIsolated(std::shared_ptr<Shared> shared, PendingTask pending) {
    shared->logger.Trace("taskloop: task " + Quoted(pending.label) + " started");

    Status status = co_await std::move(pending.work);
    if (status.IsOk()) {
        shared->stats.tasks_succeeded++;
        shared->logger.Trace("taskloop: task " + Quoted(pending.label) + " finished");
        co_return;
    }

    shared->stats.tasks_failed++;
    shared->logger.Error("taskloop: task " + Quoted(pending.label) + " failed: " + DescribeError(status.Error()));
}

Task<void> TaskLoop::RunJob(std::shared_ptr<Shared> shared, RecurringJob job, StopToken token) {
    Executor& executor = shared->executor;
    shared->logger.Info("taskloop: job " + Quoted(job.name) + " running every " +
                        std::to_string(job.interval.count()) + "ms");

    if (shared->first_run == FirstRun::kAfterInterval) {
        if (!co_await StoppableSleep(executor, job.interval, token)) {
            co_return;
        }
    }

    while (!token.StopRequested()) {
        shared->logger.Trace("taskloop: job " + Quoted(job.name) + " invoked");
        Status status = co_await job.action();

        // Looked up after the invocation: the map may have changed meanwhile
        JobStats& stats = shared->job_stats[job.name];
        stats.invocations++;
        shared->stats.job_invocations++;

        if (status.IsErr()) {
            stats.failures++;
            stats.last_error = status.Error();
            shared->stats.job_failures++;
            shared->logger.Error("taskloop: job " + Quoted(job.name) + " failed: " + DescribeError(status.Error()));
        }

        if (!co_await StoppableSleep(executor, job.interval, token)) {
            break;
        }
    }

    shared->logger.Debug("taskloop: job " + Quoted(job.name) + " exited");
}

// ============================================================================
// Introspection
// ============================================================================

LoopState TaskLoop::State() const noexcept {
    return shared_->state;
}

size_t TaskLoop::PendingTasks() const noexcept {
    return shared_->queue.Size();
}

std::vector<std::string> TaskLoop::JobNames() const {
    return shared_->registry.Names();
}

TaskLoopStats TaskLoop::GetStats() const {
    return shared_->stats;
}

std::optional<JobStats> TaskLoop::GetJobStats(const std::string& name) const {
    auto it = shared_->job_stats.find(name);
    if (it == shared_->job_stats.end()) {
        return std::nullopt;
    }
    return it->second;
}

Executor& TaskLoop::GetExecutor() const noexcept {
    return shared_->executor;
}

Logger& TaskLoop::GetLogger() const noexcept {
    return shared_->logger;
}

}  // namespace taskloop
