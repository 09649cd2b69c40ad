#include "contribution/Task.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <nlohmann/json.hpp>

namespace tandem::contribution {

std::string to_string(const TaskState s) {
    switch (s) {
        case TaskState::Running: return "running";
        case TaskState::Completed: return "completed";
        case TaskState::Aborted: return "aborted";
        case TaskState::Failed: return "failed";
    }
    return "unknown";
}

ContributionTask::ContributionTask(std::string category, Granted grant)
    : id_(boost::uuids::to_string(boost::uuids::random_generator()())),
      category_(std::move(category)),
      grant_(std::move(grant)),
      startedAt_(util::nowMillis()) {}

ResourceUsage ContributionTask::usage() const {
    std::scoped_lock lock(mutex_);
    auto u = usage_;
    u.wall_seconds = static_cast<double>(util::nowMillis() - startedAt_) / 1000.0;
    return u;
}

std::string ContributionTask::finishReason() const {
    std::scoped_lock lock(mutex_);
    return finishReason_;
}

void ContributionTask::setProgress(const double p) { progress_.store(std::clamp(p, 0.0, 1.0)); }

void ContributionTask::addUsage(const double cpuSeconds, const uint64_t ramMb, const uint64_t bytes) {
    std::scoped_lock lock(mutex_);
    usage_.cpu_seconds += cpuSeconds;
    usage_.peak_ram_mb = std::max(usage_.peak_ram_mb, ramMb);
    usage_.bytes_transferred += bytes;
}

void ContributionTask::abort(const std::string& reason) {
    abort_.store(true);
    finish(TaskState::Aborted, reason);
}

void ContributionTask::finish(const TaskState final, const std::string& reason) {
    auto expected = TaskState::Running;
    if (!state_.compare_exchange_strong(expected, final)) return;
    std::scoped_lock lock(mutex_);
    finishReason_ = reason;
}

void to_json(nlohmann::json& j, const ResourceUsage& u) {
    j = {
        {"cpu_seconds", u.cpu_seconds},
        {"peak_ram_mb", u.peak_ram_mb},
        {"bytes_transferred", u.bytes_transferred},
        {"wall_seconds", u.wall_seconds}
    };
}

void to_json(nlohmann::json& j, const TaskReport& r) {
    j = {
        {"task_id", r.task_id},
        {"category", r.category},
        {"state", to_string(r.state)},
        {"reason", r.reason},
        {"progress", r.progress},
        {"started_at", util::millisToString(r.started_at)},
        {"finished_at", util::millisToString(r.finished_at)},
        {"usage", r.usage}
    };
}

}
