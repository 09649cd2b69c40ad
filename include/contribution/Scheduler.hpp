#pragma once

#include "concurrency/AsyncService.hpp"
#include "config/Config.hpp"
#include "contribution/PermissionEngine.hpp"
#include "contribution/SettingsStore.hpp"
#include "contribution/Task.hpp"
#include "resource/Analyzer.hpp"

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace tandem::contribution {

// Admits at most one contribution task at a time and re-checks permission on every tick.
// A denial while a task runs aborts it on that same tick. No new task is admitted until
// every aborted workload has returned. Usage reports are sent outside the lock.
class Scheduler final : public concurrency::AsyncService {
public:
    using Clock = std::function<LocalTime()>;

    Scheduler(std::shared_ptr<SettingsStore> settings,
              std::shared_ptr<resource::Analyzer> analyzer,
              std::shared_ptr<WorkSource> source,
              std::shared_ptr<UsageReporter> reporter,
              const config::ContributionConfig& cfg,
              Clock clock = &LocalTime::now);

    ~Scheduler() override;

    void tick();

    [[nodiscard]] std::shared_ptr<const ContributionTask> current() const;
    [[nodiscard]] std::optional<Denied> lastDenial() const;
    [[nodiscard]] std::optional<TaskReport> lastReport() const;
    [[nodiscard]] std::size_t drainingCount() const;

    void abortCurrent(const std::string& reason);

protected:
    void runLoop() override;

    [[nodiscard]] std::shared_ptr<spdlog::logger> logger() const override;

private:
    struct Running {
        std::shared_ptr<ContributionTask> task;
        std::future<void> worker;
    };

    std::shared_ptr<SettingsStore> settings_;
    std::shared_ptr<resource::Analyzer> analyzer_;
    std::shared_ptr<WorkSource> source_;
    std::shared_ptr<UsageReporter> reporter_;
    config::ContributionConfig cfg_;
    Clock clock_;
    PermissionEngine engine_;

    mutable std::mutex mutex_;
    std::optional<Running> running_;
    std::vector<std::future<void>> draining_; // aborted workers still unwinding
    std::optional<Denied> lastDenial_;
    bool denialLogged_{false};
    std::optional<TaskReport> lastReport_;
    std::vector<TaskReport> unreported_;
    bool drainingLogged_{false};

    void admit(const Settings& settings, const resource::Snapshot& snap, const LocalTime& now,
               const resource::Forecast& forecast);
    void supervise(const Settings& settings, const resource::Snapshot& snap, const LocalTime& now,
                   const resource::Forecast& forecast);
    void stopRunning(TaskState final, const std::string& reason);
    void noteDenial(const Denied& d);
    void noteDraining();
    void reap();
    void flushReports();
};

}
