// ============================================================================
// Example 02: Recurring Jobs Bound to a Server's Lifespan
// ============================================================================
//
// Registers two recurring jobs, attaches the TaskLoop to a Lifespan, and
// lets a stand-in "server" run for a while. The jobs start with the server
// and stop with it.
//
// Set TASKLOOP_LOG_LEVEL=debug to watch the scheduler's own records.
//
// RUN:
//   cd build && ./examples/02_recurring_jobs
//
// ============================================================================

#include "taskloop/host/lifespan.hpp"
#include "taskloop/io/libuv_executor.hpp"
#include "taskloop/io/timer.hpp"
#include "taskloop/sched/task_loop.hpp"

#include <chrono>
#include <iostream>

using namespace taskloop;
using namespace std::chrono_literals;

namespace {

int g_heartbeats = 0;
int g_sweeps = 0;

}  // namespace

// Stand-in for the HTTP server's accept loop
Task<void> Serve(std::chrono::milliseconds uptime) {
    std::cout << "serving for " << uptime.count() << "ms" << std::endl;
    co_await AsyncSleep(uptime);
    std::cout << "server shutting down" << std::endl;
}

Task<void> Host(LibuvExecutor& executor, Lifespan& lifespan) {
    Status status = co_await lifespan.Run(Serve(500ms));
    if (status.IsErr()) {
        std::cerr << "startup failed: " << DescribeError(status.Error()) << std::endl;
    }
    executor.Stop();
}

int main() {
    auto created = LibuvExecutor::Create();
    if (created.IsErr()) {
        std::cerr << "executor: " << DescribeError(created.Error()) << std::endl;
        return 1;
    }
    auto executor = std::move(created).Value();

    TaskLoop loop(*executor);

    loop.Recurring(100ms, "heartbeat")([]() -> Task<void> {
        std::cout << "heartbeat " << ++g_heartbeats << std::endl;
        co_return;
    });

    // Fails every third sweep; the schedule carries on regardless
    loop.Recurring(200ms, "sweep-sessions")([]() -> Task<Status> {
        if (++g_sweeps % 3 == 0) {
            co_return Err(make_error_code(Errc::IoError));
        }
        std::cout << "swept sessions" << std::endl;
        co_return Ok();
    });

    Lifespan lifespan;
    lifespan.Attach(loop);

    auto host = Host(*executor, lifespan);
    executor->Schedule(host.GetHandle());
    executor->Run();

    auto stats = loop.GetStats();
    std::cout << "job invocations: " << stats.job_invocations << ", failures: " << stats.job_failures << std::endl;
    return 0;
}
