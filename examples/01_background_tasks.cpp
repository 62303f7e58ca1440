// ============================================================================
// Example 01: Fire-and-Forget Background Tasks
// ============================================================================
//
// Queues a handful of background tasks on a TaskLoop sharing a LibuvExecutor
// with the rest of the program. One task fails; the others are unaffected
// and the failure shows up in the log.
//
// RUN:
//   cd build && ./examples/01_background_tasks
//
// ============================================================================

#include "taskloop/io/libuv_executor.hpp"
#include "taskloop/io/timer.hpp"
#include "taskloop/sched/task_loop.hpp"

#include <chrono>
#include <iostream>
#include <string>

using namespace taskloop;
using namespace std::chrono_literals;

// Pretend to deliver a message
Task<Status> SendEmail(std::string to, std::chrono::milliseconds latency) {
    co_await AsyncSleep(latency);
    if (to.find('@') == std::string::npos) {
        co_return Err(make_error_code(Errc::InvalidArgument));
    }
    std::cout << "sent mail to " << to << std::endl;
    co_return Ok();
}

Task<void> WarmCache() {
    co_await AsyncSleep(20ms);
    std::cout << "cache warmed" << std::endl;
}

Task<void> Main(LibuvExecutor& executor, TaskLoop& loop) {
    // Queued before Start(): they wait for the consumer
    loop.AddTask("welcome-alice", SendEmail("alice@example.com", 30ms));
    loop.AddTask("welcome-bob", SendEmail("bob", 10ms));
    loop.AddTask(WarmCache());

    if (auto started = loop.Start(); started.IsErr()) {
        std::cerr << "start failed: " << DescribeError(started.Error()) << std::endl;
        executor.Stop();
        co_return;
    }

    co_await AsyncSleep(50ms);

    // Work can be queued at any time, including from inside other work
    loop.AddTask("welcome-carol", SendEmail("carol@example.com", 5ms));
    co_await AsyncSleep(20ms);

    co_await loop.Stop();

    auto stats = loop.GetStats();
    std::cout << "tasks: " << stats.tasks_succeeded << " succeeded, " << stats.tasks_failed << " failed"
              << std::endl;
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

    auto main_task = Main(*executor, loop);
    executor->Schedule(main_task.GetHandle());
    executor->Run();
    return 0;
}
