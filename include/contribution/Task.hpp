#pragma once

#include "contribution/Decision.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace tandem::contribution {

enum class TaskState { Running, Completed, Aborted, Failed };

std::string to_string(TaskState s);

struct ResourceUsage {
    double cpu_seconds{};
    uint64_t peak_ram_mb{};
    uint64_t bytes_transferred{};
    double wall_seconds{};
};

// One admitted unit of background work. Created only from a Granted decision; the workload
// sees it through TaskContext and must poll shouldAbort() between steps.
class ContributionTask {
public:
    ContributionTask(std::string category, Granted grant);

    [[nodiscard]] const std::string& id() const { return id_; }
    [[nodiscard]] const std::string& category() const { return category_; }
    [[nodiscard]] const Granted& grant() const { return grant_; }
    [[nodiscard]] int64_t startedAt() const { return startedAt_; }

    [[nodiscard]] double progress() const { return progress_.load(); }
    [[nodiscard]] TaskState state() const { return state_.load(); }
    [[nodiscard]] bool abortRequested() const { return abort_.load(); }
    [[nodiscard]] ResourceUsage usage() const;
    [[nodiscard]] std::string finishReason() const;

    void setProgress(double p);
    void addUsage(double cpuSeconds, uint64_t ramMb, uint64_t bytes);

    void abort(const std::string& reason);
    void finish(TaskState final, const std::string& reason = {});

private:
    std::string id_;
    std::string category_;
    Granted grant_;
    int64_t startedAt_;

    std::atomic<double> progress_{0.0};
    std::atomic<TaskState> state_{TaskState::Running};
    std::atomic<bool> abort_{false};

    mutable std::mutex mutex_;
    ResourceUsage usage_;
    std::string finishReason_;
};

// What a workload is allowed to see of its task.
class TaskContext {
public:
    explicit TaskContext(ContributionTask& task) : task_(task) {}

    [[nodiscard]] bool shouldAbort() const { return task_.abortRequested(); }
    [[nodiscard]] const Granted& limits() const { return task_.grant(); }
    void reportProgress(const double p) { task_.setProgress(p); }
    void addUsage(const double cpuSeconds, const uint64_t ramMb, const uint64_t bytes) { task_.addUsage(cpuSeconds, ramMb, bytes); }

private:
    ContributionTask& task_;
};

class Workload {
public:
    virtual ~Workload() = default;

    [[nodiscard]] virtual std::string category() const = 0;

    // Returns when done or when ctx.shouldAbort() turns true. Throws on failure.
    virtual void run(TaskContext& ctx) = 0;
};

class WorkSource {
public:
    virtual ~WorkSource() = default;

    // Next piece of work that fits the grant, or nullptr if there is none.
    virtual std::shared_ptr<Workload> next(const Granted& grant) = 0;
};

struct TaskReport {
    std::string task_id;
    std::string category;
    TaskState state{TaskState::Completed};
    std::string reason;
    double progress{};
    int64_t started_at{};
    int64_t finished_at{};
    ResourceUsage usage;
};

class UsageReporter {
public:
    virtual ~UsageReporter() = default;

    virtual void report(const TaskReport& r) = 0;
};

void to_json(nlohmann::json& j, const ResourceUsage& u);
void to_json(nlohmann::json& j, const TaskReport& r);

}
