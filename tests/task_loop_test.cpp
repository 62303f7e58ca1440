// ============================================================================
// TaskLoop Tests
// ============================================================================
//
// Every test drives a real LibuvExecutor: the body runs as a coroutine on
// the loop and stops the executor when it returns.
//
// ============================================================================

#include "taskloop/sched/task_loop.hpp"

#include "taskloop/core/sync_wait.hpp"
#include "taskloop/io/libuv_executor.hpp"
#include "taskloop/io/timer.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

using namespace taskloop;
using namespace std::chrono_literals;

class TaskLoopTest : public ::testing::Test {
   protected:
    void SetUp() override {
        executor_ = LibuvExecutor::Create().Value();
        logger_->SetSink([this](const LogRecord& record) { records_.push_back(record); });
    }

    // Runners still winding down log into records_, so they go first
    void TearDown() override { executor_.reset(); }

    TaskLoop::Options Opts(FirstRun first_run = FirstRun::kImmediate) {
        TaskLoop::Options options;
        options.logger = logger_;
        options.first_run = first_run;
        return options;
    }

    // Run `body` on the executor until it completes.
    void Drive(Task<void> body) {
        auto wrapper = [](LibuvExecutor& executor, Task<void> inner) -> Task<void> {
            co_await std::move(inner);
            executor.Stop();
        };
        auto t = wrapper(*executor_, std::move(body));
        executor_->Schedule(t.GetHandle());
        executor_->Run();
    }

    bool Logged(LogLevel level, const std::string& fragment) const {
        for (const auto& record : records_) {
            if (record.level == level && record.message.find(fragment) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    static Task<Status> Fail() { co_return Err(make_error_code(Errc::TaskFailed)); }

    std::unique_ptr<LibuvExecutor> executor_;
    std::shared_ptr<Logger> logger_ = std::make_shared<Logger>(LogLevel::kTrace);
    std::vector<LogRecord> records_;
};

// ============================================================================
// Fire-and-forget tasks
// ============================================================================

TEST_F(TaskLoopTest, EmptyTaskIsRejectedAtEnqueue) {
    TaskLoop loop(*executor_, Opts());
    auto work = []() -> Task<void> { co_return; };
    Task<void> task = work();
    Task<void> taken = std::move(task);

    EXPECT_DEATH(loop.AddTask(std::move(task)), "AddTask\\(\\) with an empty Task");
    EXPECT_EQ(loop.PendingTasks(), 0u);
    EXPECT_TRUE(taken.Valid());
}

TEST_F(TaskLoopTest, TasksQueuedBeforeStartRunAfterStart) {
    TaskLoop loop(*executor_, Opts());
    int runs = 0;
    auto work = [&]() -> Task<void> {
        runs++;
        co_return;
    };

    loop.AddTask(work());
    loop.AddTask(work());
    loop.AddTask(work());
    EXPECT_EQ(loop.PendingTasks(), 3u);
    EXPECT_EQ(runs, 0);

    Drive([&]() -> Task<void> {
        EXPECT_TRUE(loop.Start().IsOk());
        EXPECT_EQ(runs, 0);  // Start() only schedules
        co_await AsyncSleep(20ms);
        EXPECT_EQ(runs, 3);
        co_await loop.Stop();
    }());

    EXPECT_EQ(loop.PendingTasks(), 0u);
    auto stats = loop.GetStats();
    EXPECT_EQ(stats.tasks_enqueued, 3u);
    EXPECT_EQ(stats.tasks_launched, 3u);
    EXPECT_EQ(stats.tasks_succeeded, 3u);
}

TEST_F(TaskLoopTest, LaunchOrderMatchesEnqueueOrder) {
    TaskLoop loop(*executor_, Opts());
    std::vector<int> started;
    std::vector<int> finished;

    // Later tasks sleep less, so they finish first
    auto work = [&](int id) -> Task<void> {
        started.push_back(id);
        co_await AsyncSleep(std::chrono::milliseconds(40 - id * 10));
        finished.push_back(id);
    };

    for (int i = 0; i < 4; ++i) {
        loop.AddTask(work(i));
    }

    Drive([&]() -> Task<void> {
        EXPECT_TRUE(loop.Start().IsOk());
        co_await AsyncSleep(80ms);
        co_await loop.Stop();
    }());

    EXPECT_EQ(started, (std::vector<int>{0, 1, 2, 3}));
    EXPECT_EQ(finished, (std::vector<int>{3, 2, 1, 0}));
}

TEST_F(TaskLoopTest, AddTaskReturnsBeforeWorkRuns) {
    TaskLoop loop(*executor_, Opts());
    bool ran = false;
    auto work = [&]() -> Task<void> {
        ran = true;
        co_return;
    };

    Drive([&]() -> Task<void> {
        EXPECT_TRUE(loop.Start().IsOk());
        co_await AsyncSleep(5ms);

        loop.AddTask(work());
        EXPECT_FALSE(ran);

        co_await AsyncSleep(10ms);
        EXPECT_TRUE(ran);
        co_await loop.Stop();
    }());
}

TEST_F(TaskLoopTest, FailingTaskDoesNotBlockLaterTasks) {
    TaskLoop loop(*executor_, Opts());
    int later_runs = 0;
    auto later = [&]() -> Task<Status> {
        later_runs++;
        co_return Ok();
    };

    loop.AddTask("first", later());
    loop.AddTask("broken", Fail());
    loop.AddTask("second", later());

    Drive([&]() -> Task<void> {
        EXPECT_TRUE(loop.Start().IsOk());
        co_await AsyncSleep(20ms);
        // Work added after the failure still runs
        loop.AddTask("third", later());
        co_await AsyncSleep(20ms);
        co_await loop.Stop();
    }());

    EXPECT_EQ(later_runs, 3);
    auto stats = loop.GetStats();
    EXPECT_EQ(stats.tasks_failed, 1u);
    EXPECT_EQ(stats.tasks_succeeded, 3u);
    EXPECT_TRUE(Logged(LogLevel::kError, "task 'broken' failed"));
    EXPECT_TRUE(Logged(LogLevel::kError, "Task failed"));
}

TEST_F(TaskLoopTest, DefaultLabelsAreSequential) {
    TaskLoop loop(*executor_, Opts());
    auto noop = []() -> Task<void> { co_return; };

    EXPECT_EQ(loop.AddTask(noop()), "task-1");
    EXPECT_EQ(loop.AddTask("named", noop()), "named");
    EXPECT_EQ(loop.AddTask(noop()), "task-3");

    std::string failing_label = loop.AddTask(Fail());
    EXPECT_EQ(failing_label, "task-4");

    Drive([&]() -> Task<void> {
        EXPECT_TRUE(loop.Start().IsOk());
        co_await AsyncSleep(10ms);
        co_await loop.Stop();
    }());

    EXPECT_TRUE(Logged(LogLevel::kError, "task 'task-4' failed"));
}

// ============================================================================
// Recurring jobs
// ============================================================================

TEST_F(TaskLoopTest, JobCountsFollowTheirIntervals) {
    TaskLoop loop(*executor_, Opts());
    int fast = 0;
    int slow = 0;

    // The fast job fails every other time; the slow one must not notice
    ASSERT_TRUE(loop.Register(10ms, "fast", [&]() -> Task<Status> {
                        if (++fast % 2 == 0) co_return Err(make_error_code(Errc::TaskFailed));
                        co_return Ok();
                    })
                    .IsOk());
    ASSERT_TRUE(loop.Register(30ms, "slow", [&]() -> Task<Status> {
                        slow++;
                        co_return Ok();
                    })
                    .IsOk());

    Drive([&]() -> Task<void> {
        EXPECT_TRUE(loop.Start().IsOk());
        co_await AsyncSleep(300ms);
        co_await loop.Stop();
    }());

    // Immediate first run, then one per interval (minus drift)
    EXPECT_GE(fast, 12);
    EXPECT_LE(fast, 32);
    EXPECT_GE(slow, 5);
    EXPECT_LE(slow, 12);
    EXPECT_GT(fast, slow);

    auto fast_stats = loop.GetJobStats("fast");
    ASSERT_TRUE(fast_stats.has_value());
    EXPECT_EQ(fast_stats->invocations, static_cast<std::uint64_t>(fast));
    EXPECT_EQ(fast_stats->failures, static_cast<std::uint64_t>(fast / 2));
    EXPECT_EQ(fast_stats->last_error, Errc::TaskFailed);

    auto slow_stats = loop.GetJobStats("slow");
    ASSERT_TRUE(slow_stats.has_value());
    EXPECT_EQ(slow_stats->failures, 0u);
    EXPECT_FALSE(static_cast<bool>(slow_stats->last_error));
}

TEST_F(TaskLoopTest, AlwaysFailingJobKeepsRunning) {
    TaskLoop loop(*executor_, Opts());
    int calls = 0;

    ASSERT_TRUE(loop.Register(5ms, "flaky", [&]() -> Task<Status> {
                        calls++;
                        co_return Err(std::make_error_code(std::errc::connection_refused));
                    })
                    .IsOk());

    Drive([&]() -> Task<void> {
        EXPECT_TRUE(loop.Start().IsOk());
        co_await AsyncSleep(80ms);
        co_await loop.Stop();
    }());

    EXPECT_GE(calls, 4);
    auto stats = loop.GetStats();
    EXPECT_EQ(stats.job_invocations, static_cast<std::uint64_t>(calls));
    EXPECT_EQ(stats.job_failures, static_cast<std::uint64_t>(calls));
    EXPECT_TRUE(Logged(LogLevel::kError, "job 'flaky' failed"));
}

TEST_F(TaskLoopTest, FirstRunAfterInterval) {
    TaskLoop loop(*executor_, Opts(FirstRun::kAfterInterval));
    int calls = 0;

    ASSERT_TRUE(loop.Register(50ms, "delayed", [&]() -> Task<Status> {
                        calls++;
                        co_return Ok();
                    })
                    .IsOk());

    Drive([&]() -> Task<void> {
        EXPECT_TRUE(loop.Start().IsOk());
        co_await AsyncSleep(20ms);
        EXPECT_EQ(calls, 0);
        co_await AsyncSleep(60ms);
        EXPECT_GE(calls, 1);
        co_await loop.Stop();
    }());
}

TEST_F(TaskLoopTest, ZeroIntervalJobDoesNotStarveTasks) {
    TaskLoop loop(*executor_, Opts());
    int spins = 0;
    bool task_ran = false;
    auto work = [&]() -> Task<void> {
        task_ran = true;
        co_return;
    };

    ASSERT_TRUE(loop.Register(0ms, "spin", [&]() -> Task<Status> {
                        spins++;
                        co_return Ok();
                    })
                    .IsOk());

    Drive([&]() -> Task<void> {
        EXPECT_TRUE(loop.Start().IsOk());
        co_await AsyncSleep(5ms);
        loop.AddTask(work());
        co_await AsyncSleep(20ms);
        co_await loop.Stop();
    }());

    EXPECT_TRUE(task_ran);
    EXPECT_GT(spins, 1);
}

TEST_F(TaskLoopTest, RecurringRegistrarReturnsActionUnchanged) {
    TaskLoop loop(*executor_, Opts());
    int calls = 0;

    auto action = loop.Recurring(1h, "hourly")([&]() -> Task<void> {
        calls++;
        co_return;
    });

    EXPECT_EQ(loop.JobNames(), (std::vector<std::string>{"hourly"}));

    // Still callable on its own
    SyncWait(action());
    EXPECT_EQ(calls, 1);

    Drive([&]() -> Task<void> {
        EXPECT_TRUE(loop.Start().IsOk());
        co_await AsyncSleep(10ms);
        co_await loop.Stop();
    }());

    EXPECT_EQ(calls, 2);
}

TEST_F(TaskLoopTest, RegistrarLogsRejection) {
    TaskLoop loop(*executor_, Opts());
    auto noop = []() -> Task<Status> { co_return Ok(); };

    loop.Recurring(1s, "dup")(noop);
    auto returned = loop.Recurring(1s, "dup")(noop);

    EXPECT_TRUE(SyncWait(returned()).IsOk());
    EXPECT_EQ(loop.JobNames().size(), 1u);
    EXPECT_TRUE(Logged(LogLevel::kError, "recurring job 'dup' not registered"));
}

TEST_F(TaskLoopTest, DuplicateJobNameRejected) {
    TaskLoop loop(*executor_, Opts());
    auto noop = []() -> Task<Status> { co_return Ok(); };

    ASSERT_TRUE(loop.Register(1s, "report", noop).IsOk());
    auto dup = loop.Register(2s, "report", noop);
    ASSERT_TRUE(dup.IsErr());
    EXPECT_EQ(dup.Error(), Errc::DuplicateJob);
    EXPECT_EQ(loop.JobNames().size(), 1u);
}

TEST_F(TaskLoopTest, UnnamedJobsGetDefaultNames) {
    TaskLoop loop(*executor_, Opts());
    auto noop = []() -> Task<Status> { co_return Ok(); };

    auto first = loop.Register(1s, "", noop);
    auto second = loop.Register(RecurringJob{"", 1s, noop});
    ASSERT_TRUE(first.IsOk());
    ASSERT_TRUE(second.IsOk());
    EXPECT_EQ(first.Value(), "job-1");
    EXPECT_EQ(second.Value(), "job-2");
}

// ============================================================================
// Lifecycle
// ============================================================================

TEST_F(TaskLoopTest, StartTwiceIsRejected) {
    TaskLoop loop(*executor_, Opts());
    int calls = 0;

    ASSERT_TRUE(loop.Register(1h, "once", [&]() -> Task<Status> {
                        calls++;
                        co_return Ok();
                    })
                    .IsOk());

    Drive([&]() -> Task<void> {
        EXPECT_TRUE(loop.Start().IsOk());
        auto again = loop.Start();
        EXPECT_TRUE(again.IsErr());
        if (again.IsErr()) EXPECT_EQ(again.Error(), Errc::AlreadyRunning);
        EXPECT_EQ(loop.State(), LoopState::kRunning);

        co_await AsyncSleep(20ms);
        co_await loop.Stop();
    }());

    // A second runner would have produced a second immediate call
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(Logged(LogLevel::kWarn, "Start() ignored"));
}

TEST_F(TaskLoopTest, RegisterWhileRunningIsRejected) {
    TaskLoop loop(*executor_, Opts());
    auto noop = []() -> Task<Status> { co_return Ok(); };

    Drive([&]() -> Task<void> {
        EXPECT_TRUE(loop.Start().IsOk());
        auto late = loop.Register(1s, "late", noop);
        EXPECT_TRUE(late.IsErr());
        if (late.IsErr()) EXPECT_EQ(late.Error(), Errc::AlreadyRunning);
        co_await loop.Stop();
    }());

    EXPECT_TRUE(loop.JobNames().empty());
    EXPECT_TRUE(Logged(LogLevel::kWarn, "cannot register job 'late'"));

    // Stopped again: accepted
    EXPECT_TRUE(loop.Register(1s, "late", noop).IsOk());
}

TEST_F(TaskLoopTest, StopThenStartRestarts) {
    TaskLoop loop(*executor_, Opts());
    int job_calls = 0;
    bool queued_while_stopped_ran = false;
    auto late_work = [&]() -> Task<void> {
        queued_while_stopped_ran = true;
        co_return;
    };

    ASSERT_TRUE(loop.Register(10ms, "tick", [&]() -> Task<Status> {
                        job_calls++;
                        co_return Ok();
                    })
                    .IsOk());

    Drive([&]() -> Task<void> {
        EXPECT_TRUE(loop.Start().IsOk());
        co_await AsyncSleep(35ms);
        co_await loop.Stop();
        EXPECT_EQ(loop.State(), LoopState::kStopped);

        int calls_at_stop = job_calls;
        EXPECT_GE(calls_at_stop, 2);

        loop.AddTask(late_work());
        co_await AsyncSleep(30ms);
        // Nothing runs while stopped
        EXPECT_EQ(job_calls, calls_at_stop);
        EXPECT_FALSE(queued_while_stopped_ran);
        EXPECT_EQ(loop.PendingTasks(), 1u);

        EXPECT_TRUE(loop.Start().IsOk());
        co_await AsyncSleep(35ms);
        EXPECT_GT(job_calls, calls_at_stop);
        EXPECT_TRUE(queued_while_stopped_ran);
        co_await loop.Stop();
    }());

    EXPECT_EQ(loop.State(), LoopState::kStopped);
}

TEST_F(TaskLoopTest, StopInterruptsLongIntervalSleep) {
    TaskLoop loop(*executor_, Opts());
    std::chrono::steady_clock::duration stop_took{};

    ASSERT_TRUE(loop.Register(1h, "hourly", []() -> Task<Status> { co_return Ok(); }).IsOk());

    Drive([&]() -> Task<void> {
        EXPECT_TRUE(loop.Start().IsOk());
        co_await AsyncSleep(10ms);

        auto begin = std::chrono::steady_clock::now();
        co_await loop.Stop();
        stop_took = std::chrono::steady_clock::now() - begin;
    }());

    EXPECT_LT(stop_took, 500ms);
    EXPECT_EQ(executor_->ActiveTimerCount(), 0u);
}

TEST_F(TaskLoopTest, StopWaitsForInFlightInvocation) {
    TaskLoop loop(*executor_, Opts());
    bool invocation_finished = false;

    ASSERT_TRUE(loop.Register(1h, "slow", [&]() -> Task<Status> {
                        co_await AsyncSleep(40ms);
                        invocation_finished = true;
                        co_return Ok();
                    })
                    .IsOk());

    Drive([&]() -> Task<void> {
        EXPECT_TRUE(loop.Start().IsOk());
        co_await AsyncSleep(10ms);
        co_await loop.Stop();
        EXPECT_TRUE(invocation_finished);
    }());
}

TEST_F(TaskLoopTest, StopOnStoppedLoopCompletesImmediately) {
    TaskLoop loop(*executor_, Opts());

    SyncWait(loop.Stop());
    EXPECT_EQ(loop.State(), LoopState::kStopped);
    EXPECT_TRUE(Logged(LogLevel::kInfo, "not running"));
}

TEST_F(TaskLoopTest, ConcurrentStopCallersShareOneStop) {
    TaskLoop loop(*executor_, Opts());
    int stopped = 0;

    ASSERT_TRUE(loop.Register(1h, "idle", []() -> Task<Status> { co_return Ok(); }).IsOk());

    auto waiter = [&]() -> Task<void> {
        co_await loop.Stop();
        EXPECT_EQ(loop.State(), LoopState::kStopped);
        stopped++;
    };

    Drive([&]() -> Task<void> {
        EXPECT_TRUE(loop.Start().IsOk());
        co_await AsyncSleep(5ms);

        // Runs after this coroutine has begun the stop, so it joins it
        auto other = MakeDetached(waiter());
        other.ScheduleOn(*executor_);

        co_await waiter();
        co_await AsyncSleep(5ms);
    }());

    EXPECT_EQ(stopped, 2);
}

TEST_F(TaskLoopTest, RequestStopSignalsWithoutWaiting) {
    TaskLoop loop(*executor_, Opts());

    Drive([&]() -> Task<void> {
        EXPECT_TRUE(loop.Start().IsOk());
        co_await AsyncSleep(5ms);

        loop.RequestStop();
        EXPECT_EQ(loop.State(), LoopState::kStopping);
        EXPECT_FALSE(loop.IsRunning());

        co_await AsyncSleep(10ms);
        EXPECT_EQ(loop.State(), LoopState::kStopped);
    }());
}

TEST_F(TaskLoopTest, DestroyWhileRunningIsSafe) {
    int calls = 0;

    Drive([&]() -> Task<void> {
        {
            TaskLoop loop(*executor_, Opts());
            EXPECT_TRUE(loop.Register(5ms, "orphan", [&]() -> Task<Status> {
                                calls++;
                                co_return Ok();
                            })
                            .IsOk());
            EXPECT_TRUE(loop.Start().IsOk());
            co_await AsyncSleep(12ms);
        }
        int calls_at_destroy = calls;
        co_await AsyncSleep(20ms);
        EXPECT_EQ(calls, calls_at_destroy);
    }());

    EXPECT_GE(calls, 1);
    EXPECT_TRUE(Logged(LogLevel::kInfo, "stopped"));
}

TEST_F(TaskLoopTest, InjectedLoggerLivesUntilRunnersExit) {
    std::weak_ptr<Logger> watch;
    bool alive_after_destroy = false;

    Drive([&]() -> Task<void> {
        {
            auto logger = std::make_shared<Logger>(LogLevel::kTrace);
            logger->SetSink([this](const LogRecord& record) { records_.push_back(record); });
            watch = logger;

            TaskLoop::Options options;
            options.logger = std::move(logger);
            TaskLoop loop(*executor_, std::move(options));
            EXPECT_TRUE(loop.Register(1h, "idle", []() -> Task<Status> { co_return Ok(); }).IsOk());
            EXPECT_TRUE(loop.Start().IsOk());
            co_await AsyncSleep(5ms);
        }
        // Only the runners still winding down hold it now
        alive_after_destroy = !watch.expired();
        co_await AsyncSleep(10ms);
    }());

    EXPECT_TRUE(alive_after_destroy);
    EXPECT_TRUE(watch.expired());
    EXPECT_TRUE(Logged(LogLevel::kInfo, "taskloop: stopped"));
}

TEST_F(TaskLoopTest, JobCanStopItsOwnLoop) {
    TaskLoop loop(*executor_, Opts());
    int calls = 0;

    ASSERT_TRUE(loop.Register(1ms, "last-run", [&]() -> Task<Status> {
                        if (++calls == 3) loop.RequestStop();
                        co_return Ok();
                    })
                    .IsOk());

    Drive([&]() -> Task<void> {
        EXPECT_TRUE(loop.Start().IsOk());
        co_await AsyncSleep(50ms);
    }());

    EXPECT_EQ(loop.State(), LoopState::kStopped);
    EXPECT_EQ(calls, 3);
}

// ============================================================================
// Re-entrant enqueueing
// ============================================================================

TEST_F(TaskLoopTest, AddTaskFromInsideTask) {
    TaskLoop loop(*executor_, Opts());
    bool child_ran = false;

    auto child = [&]() -> Task<void> {
        child_ran = true;
        co_return;
    };
    auto parent = [&]() -> Task<void> {
        loop.AddTask("child", child());
        co_return;
    };
    loop.AddTask("parent", parent());

    Drive([&]() -> Task<void> {
        EXPECT_TRUE(loop.Start().IsOk());
        co_await AsyncSleep(20ms);
        co_await loop.Stop();
    }());

    EXPECT_TRUE(child_ran);
    EXPECT_EQ(loop.GetStats().tasks_succeeded, 2u);
}

TEST_F(TaskLoopTest, AddTaskFromInsideJob) {
    TaskLoop loop(*executor_, Opts());
    int spawned_runs = 0;

    auto spawned = [&]() -> Task<void> {
        spawned_runs++;
        co_return;
    };
    ASSERT_TRUE(loop.Register(10ms, "producer", [&]() -> Task<Status> {
                        loop.AddTask(spawned());
                        co_return Ok();
                    })
                    .IsOk());

    Drive([&]() -> Task<void> {
        EXPECT_TRUE(loop.Start().IsOk());
        co_await AsyncSleep(35ms);
        co_await loop.Stop();
    }());

    auto job = loop.GetJobStats("producer");
    ASSERT_TRUE(job.has_value());
    EXPECT_GE(spawned_runs, 2);
    EXPECT_EQ(loop.GetStats().tasks_enqueued, job->invocations);
}

// ============================================================================
// Introspection
// ============================================================================

TEST_F(TaskLoopTest, StateNames) {
    EXPECT_STREQ(LoopStateName(LoopState::kStopped), "stopped");
    EXPECT_STREQ(LoopStateName(LoopState::kStarting), "starting");
    EXPECT_STREQ(LoopStateName(LoopState::kRunning), "running");
    EXPECT_STREQ(LoopStateName(LoopState::kStopping), "stopping");
}

TEST_F(TaskLoopTest, ExecutorOnlyConstructionUsesDefaultLogger) {
    TaskLoop loop(*executor_);
    EXPECT_EQ(&loop.GetLogger(), &DefaultLogger());
    EXPECT_EQ(loop.State(), LoopState::kStopped);
    EXPECT_EQ(loop.PendingTasks(), 0u);
}

TEST_F(TaskLoopTest, UnknownJobHasNoStats) {
    TaskLoop loop(*executor_, Opts());
    EXPECT_FALSE(loop.GetJobStats("nope").has_value());
    EXPECT_EQ(&loop.GetExecutor(), executor_.get());
    EXPECT_EQ(&loop.GetLogger(), logger_.get());
}
