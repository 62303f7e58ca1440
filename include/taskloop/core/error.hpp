// ============================================================================
// taskloop/core/error.hpp - Error Codes for taskloop
// ============================================================================
//
// Every failure the scheduler reports, and every failure a unit of work
// hands back to it, is a std::error_code. Scheduler failures use the
// "taskloop" category below; work may return codes from any category
// (std::errc, a database driver's category, ...).
//
// USAGE:
// ------
//   Result<void, Error> r = loop.Start();
//   if (r.IsErr() && r.Error() == Errc::AlreadyRunning) { ... }
//
// ============================================================================

#pragma once

#include <string>
#include <system_error>

namespace taskloop {

enum class Errc {
    NoExecutor = 1,
    InvalidArgument,
    IoError,
    AlreadyRunning,
    NotRunning,
    DuplicateJob,
    InvalidInterval,
    TimerInitFailed,
    TaskFailed,
    StartupFailed,
};

const std::error_category& TaskloopCategory() noexcept;

std::error_code make_error_code(Errc e) noexcept;

using Error = std::error_code;

// "category:value (message)", the form errors take in log records
[[nodiscard]] std::string DescribeError(const Error& error);

}  // namespace taskloop

namespace std {
template <>
struct is_error_code_enum<taskloop::Errc> : true_type {};
}  // namespace std
