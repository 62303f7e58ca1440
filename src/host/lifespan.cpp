// ============================================================================
// taskloop/host/lifespan.cpp - Lifespan Implementation
// ============================================================================

#include "taskloop/host/lifespan.hpp"

#include "taskloop/core/check.hpp"

#include <utility>

namespace taskloop {

Lifespan::Lifespan(Logger* logger) : logger_(logger ? *logger : DefaultLogger()) {}

void Lifespan::OnStartup(std::string name, StartupHook hook) {
    TASKLOOP_CHECK(static_cast<bool>(hook), "OnStartup() with an empty hook");
    stages_.push_back(Stage{std::move(name), std::move(hook), {}});
}

void Lifespan::OnShutdown(std::string name, ShutdownHook hook) {
    TASKLOOP_CHECK(static_cast<bool>(hook), "OnShutdown() with an empty hook");
    stages_.push_back(Stage{std::move(name), {}, std::move(hook)});
}

void Lifespan::Attach(TaskLoop& loop, std::string name) {
    stages_.push_back(Stage{
        std::move(name),
        [&loop]() { return loop.Start(); },
        [&loop]() { return loop.Stop(); },
    });
}

Task<Status> Lifespan::Run(Task<void> serve) {
    TASKLOOP_CHECK(serve.Valid(), "Lifespan::Run() with an empty Task");

    for (size_t i = 0; i < stages_.size(); ++i) {
        const Stage& stage = stages_[i];
        if (!stage.startup) continue;

        logger_.Debug("lifespan: starting '" + stage.name + "'");
        Status status = stage.startup();
        if (status.IsErr()) {
            logger_.Error("lifespan: startup of '" + stage.name + "' failed: " + DescribeError(status.Error()));
            co_await ShutdownFirst(i);
            co_return status;
        }
    }

    logger_.Info("lifespan: startup complete, serving");
    co_await std::move(serve);

    logger_.Info("lifespan: shutting down");
    co_await ShutdownFirst(stages_.size());
    co_return Ok();
}

Task<void> Lifespan::ShutdownFirst(size_t count) {
    for (size_t i = count; i > 0; --i) {
        const Stage& stage = stages_[i - 1];
        if (!stage.shutdown) continue;

        logger_.Debug("lifespan: shutting down '" + stage.name + "'");
        co_await stage.shutdown();
    }
}

}  // namespace taskloop
