// ============================================================================
// taskloop/sched/work.hpp - Units of Work
// ============================================================================
//
// The two shapes of work the scheduler runs:
//
// - PendingTask: a fire-and-forget Task<Status> captured by AddTask(), with
//   the label used to identify it in log records. Consumed exactly once.
//
// - JobAction: a factory producing a fresh Task<Status> for each invocation
//   of a recurring job.
//
// Work that cannot fail may be written as Task<void>; AsStatusTask() and
// AdaptVoidAction() lift it into the Status-returning form.
//
// ============================================================================

#pragma once

#include "taskloop/core/result.hpp"
#include "taskloop/core/task.hpp"

#include <functional>
#include <string>
#include <utility>

namespace taskloop {

struct PendingTask {
    std::string label;
    Task<Status> work;
};

using JobAction = std::function<Task<Status>()>;

// A void task always succeeds.
inline Task<Status> AsStatusTask(Task<void> work) {
    co_await std::move(work);
    co_return Ok();
}

inline JobAction AdaptVoidAction(std::function<Task<void>()> action) {
    if (!action) return {};
    return [action = std::move(action)]() { return AsStatusTask(action()); };
}

}  // namespace taskloop
