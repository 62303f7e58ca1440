// ============================================================================
// taskloop/core/error.cpp - Error Category Implementation
// ============================================================================

#include "taskloop/core/error.hpp"

#include <string>

namespace taskloop {

namespace {

class TaskloopCategoryImpl : public std::error_category {
   public:
    const char* name() const noexcept override { return "taskloop"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::NoExecutor:
                return "No current executor";
            case Errc::InvalidArgument:
                return "Invalid argument";
            case Errc::IoError:
                return "I/O error";
            case Errc::AlreadyRunning:
                return "Task loop is not stopped";
            case Errc::NotRunning:
                return "Task loop is not running";
            case Errc::DuplicateJob:
                return "A recurring job with this name is already registered";
            case Errc::InvalidInterval:
                return "Recurring job interval must not be negative";
            case Errc::TimerInitFailed:
                return "Failed to initialize timer";
            case Errc::TaskFailed:
                return "Task failed";
            case Errc::StartupFailed:
                return "Startup hook failed";
            default:
                return "Unknown taskloop error";
        }
    }
};

}  // namespace

const std::error_category& TaskloopCategory() noexcept {
    static const TaskloopCategoryImpl instance;
    return instance;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), TaskloopCategory()};
}

std::string DescribeError(const Error& error) {
    return std::string(error.category().name()) + ":" + std::to_string(error.value()) + " (" + error.message() + ")";
}

}  // namespace taskloop
