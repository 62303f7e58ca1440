// ============================================================================
// taskloop/sched/job_registry.hpp - Recurring Job Definitions
// ============================================================================
//
// JobRegistry maps job names to their definitions, in registration order.
// It is filled while the loop is stopped and read by Start(), which spawns
// one runner per entry.
//
// Rules enforced by Add():
// - interval must not be negative         -> Errc::InvalidInterval
// - action must not be empty              -> Errc::InvalidArgument
// - names are unique                      -> Errc::DuplicateJob
// - an empty name becomes "job-<n>", the first free n counting from the
//   registry size + 1
//
// ============================================================================

#pragma once

#include "taskloop/core/error.hpp"
#include "taskloop/core/result.hpp"
#include "taskloop/sched/work.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace taskloop {

struct RecurringJob {
    std::string name;
    std::chrono::milliseconds interval{0};
    JobAction action;
};

class JobRegistry {
   public:
    using const_iterator = std::vector<RecurringJob>::const_iterator;

    // Returns the name the job was registered under.
    Result<std::string, Error> Add(RecurringJob job);

    [[nodiscard]] bool Contains(std::string_view name) const;
    [[nodiscard]] const RecurringJob* Find(std::string_view name) const;
    [[nodiscard]] std::vector<std::string> Names() const;

    size_t Size() const noexcept { return jobs_.size(); }
    bool Empty() const noexcept { return jobs_.empty(); }

    const_iterator begin() const noexcept { return jobs_.begin(); }
    const_iterator end() const noexcept { return jobs_.end(); }

   private:
    std::string DefaultName() const;

    std::vector<RecurringJob> jobs_;
};

}  // namespace taskloop
