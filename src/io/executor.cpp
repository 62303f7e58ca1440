// ============================================================================
// taskloop/io/executor.cpp - Current Executor Tracking
// ============================================================================

#include "taskloop/io/executor.hpp"

namespace taskloop {

namespace {
thread_local Executor* t_current_executor = nullptr;
}  // namespace

Executor* GetCurrentExecutor() {
    return t_current_executor;
}

void SetCurrentExecutor(Executor* executor) {
    t_current_executor = executor;
}

ExecutorGuard::ExecutorGuard(Executor* executor) : previous_(t_current_executor) {
    t_current_executor = executor;
}

ExecutorGuard::~ExecutorGuard() {
    t_current_executor = previous_;
}

}  // namespace taskloop
