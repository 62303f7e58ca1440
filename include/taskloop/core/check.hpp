// ============================================================================
// taskloop/core/check.hpp - Always-On Precondition Checks
// ============================================================================
//
// TASKLOOP_CHECK(cond, msg) stays enabled in Release builds. It is reserved
// for programming errors that no caller can recover from: enqueueing a
// moved-from Task, awaiting a Task twice, scheduling a null handle.
//
// Recoverable conditions (lifecycle misuse, duplicate job names, failing
// work) go through Result<T, Error> instead.
//
// ============================================================================

#pragma once

#include <cstdio>
#include <cstdlib>
#include <source_location>

namespace taskloop::detail {

[[noreturn]] inline void CheckFail(const char* cond_str, const char* msg, const std::source_location& loc) {
    std::fprintf(stderr, "TASKLOOP_CHECK(%s) failed: %s\n  in %s (%s:%u)\n", cond_str, msg, loc.function_name(),
                 loc.file_name(), static_cast<unsigned>(loc.line()));
    std::fflush(stderr);
    std::abort();
}

}  // namespace taskloop::detail

#define TASKLOOP_CHECK(cond, msg)                                                       \
    do {                                                                                \
        if (!(cond)) [[unlikely]] {                                                     \
            ::taskloop::detail::CheckFail(#cond, msg, std::source_location::current()); \
        }                                                                               \
    } while (0)
