// ============================================================================
// taskloop/host/lifespan.hpp - Startup/Shutdown Hooks Around a Served Body
// ============================================================================
//
// Lifespan ties components such as a TaskLoop to the life of the host
// server. The host hands Run() the coroutine that serves requests; Run()
// brings every registered component up first and takes them down after
// the served body returns.
//
// ORDERING:
// ---------
// - Startup hooks run in registration order.
// - Shutdown hooks run in reverse registration order, after `serve`.
// - If a startup hook fails, `serve` never runs: the shutdown hooks
//   registered before the failing one run (in reverse) and Run() returns
//   the hook's error.
//
// The Lifespan must outlive the Task returned by Run().
//
// USAGE:
// ------
//   Lifespan lifespan;
//   lifespan.Attach(loop);
//   lifespan.OnShutdown("flush-metrics", [] { return FlushMetrics(); });
//
//   Status status = co_await lifespan.Run(server.Serve());
//
// ============================================================================

#pragma once

#include "taskloop/core/error.hpp"
#include "taskloop/core/log.hpp"
#include "taskloop/core/result.hpp"
#include "taskloop/core/task.hpp"
#include "taskloop/sched/task_loop.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace taskloop {

using StartupHook = std::function<Status()>;
using ShutdownHook = std::function<Task<void>()>;

class Lifespan {
   public:
    // nullptr selects DefaultLogger()
    explicit Lifespan(Logger* logger = nullptr);

    Lifespan(const Lifespan&) = delete;
    Lifespan& operator=(const Lifespan&) = delete;

    void OnStartup(std::string name, StartupHook hook);
    void OnShutdown(std::string name, ShutdownHook hook);

    // Start() on startup, Stop() on shutdown, as a single stage.
    void Attach(TaskLoop& loop, std::string name = "taskloop");

    [[nodiscard]] Task<Status> Run(Task<void> serve);

    size_t StageCount() const noexcept { return stages_.size(); }

   private:
    // One registration. A stage has a startup hook, a shutdown hook or both.
    struct Stage {
        std::string name;
        StartupHook startup;
        ShutdownHook shutdown;
    };

    // Shutdown hooks of stages_[0, count), last first
    Task<void> ShutdownFirst(size_t count);

    Logger& logger_;
    std::vector<Stage> stages_;
};

}  // namespace taskloop
