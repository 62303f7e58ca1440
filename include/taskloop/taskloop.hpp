// ============================================================================
// taskloop/taskloop.hpp - Main Include Header
// ============================================================================
//
// Pulls in the whole taskloop library. Include individual headers for
// smaller translation units.
//
// USAGE:
// ------
//   #include <taskloop/taskloop.hpp>
//   using namespace taskloop;
//
// ============================================================================

#pragma once

// Core primitives
#include "taskloop/core/check.hpp"
#include "taskloop/core/detached_task.hpp"
#include "taskloop/core/error.hpp"
#include "taskloop/core/log.hpp"
#include "taskloop/core/result.hpp"
#include "taskloop/core/stop_token.hpp"
#include "taskloop/core/sync_wait.hpp"
#include "taskloop/core/task.hpp"

// Execution context
#include "taskloop/io/executor.hpp"
#include "taskloop/io/libuv_executor.hpp"
#include "taskloop/io/timer.hpp"

// Scheduler
#include "taskloop/sched/job_registry.hpp"
#include "taskloop/sched/task_loop.hpp"
#include "taskloop/sched/task_queue.hpp"
#include "taskloop/sched/work.hpp"

// Host integration
#include "taskloop/host/lifespan.hpp"
