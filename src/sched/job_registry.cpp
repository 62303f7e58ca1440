// ============================================================================
// taskloop/sched/job_registry.cpp - Job Registry Implementation
// ============================================================================

#include "taskloop/sched/job_registry.hpp"

#include <utility>

namespace taskloop {

Result<std::string, Error> JobRegistry::Add(RecurringJob job) {
    if (job.interval.count() < 0) {
        return Err(make_error_code(Errc::InvalidInterval));
    }
    if (!job.action) {
        return Err(make_error_code(Errc::InvalidArgument));
    }
    if (job.name.empty()) {
        job.name = DefaultName();
    } else if (Contains(job.name)) {
        return Err(make_error_code(Errc::DuplicateJob));
    }

    std::string name = job.name;
    jobs_.push_back(std::move(job));
    return Ok(std::move(name));
}

bool JobRegistry::Contains(std::string_view name) const {
    return Find(name) != nullptr;
}

const RecurringJob* JobRegistry::Find(std::string_view name) const {
    for (const auto& job : jobs_) {
        if (job.name == name) return &job;
    }
    return nullptr;
}

std::vector<std::string> JobRegistry::Names() const {
    std::vector<std::string> names;
    names.reserve(jobs_.size());
    for (const auto& job : jobs_) {
        names.push_back(job.name);
    }
    return names;
}

std::string JobRegistry::DefaultName() const {
    size_t n = jobs_.size() + 1;
    std::string name = "job-" + std::to_string(n);
    while (Contains(name)) {
        name = "job-" + std::to_string(++n);
    }
    return name;
}

}  // namespace taskloop
