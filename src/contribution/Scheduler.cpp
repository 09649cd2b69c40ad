#include "contribution/Scheduler.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"

#include <algorithm>

using namespace tandem::contribution;
using namespace tandem::log;

Scheduler::Scheduler(std::shared_ptr<SettingsStore> settings,
                     std::shared_ptr<resource::Analyzer> analyzer,
                     std::shared_ptr<WorkSource> source,
                     std::shared_ptr<UsageReporter> reporter,
                     const config::ContributionConfig& cfg,
                     Clock clock)
    : AsyncService("ContributionScheduler"),
      settings_(std::move(settings)),
      analyzer_(std::move(analyzer)),
      source_(std::move(source)),
      reporter_(std::move(reporter)),
      cfg_(cfg),
      clock_(std::move(clock)),
      engine_(cfg) {}

Scheduler::~Scheduler() {
    stop();
    abortCurrent("scheduler shutting down");
    std::scoped_lock lock(mutex_);
    for (auto& f : draining_) f.wait();
}

std::shared_ptr<spdlog::logger> Scheduler::logger() const { return Registry::contribution(); }

void Scheduler::runLoop() {
    while (!shouldStop()) {
        tick();
        lazySleep(cfg_.tick_interval);
    }
    abortCurrent("scheduler stopping");
}

void Scheduler::tick() {
    const auto settings = settings_->get();
    const auto snap = analyzer_->latest();
    const auto forecast = analyzer_->forecast();
    const auto now = clock_();

    {
        std::scoped_lock lock(mutex_);
        reap();

        if (running_) supervise(*settings, *snap, now, forecast);
        else if (draining_.empty()) admit(*settings, *snap, now, forecast);
        else noteDraining();
    }
    flushReports();
}

void Scheduler::admit(const Settings& settings, const resource::Snapshot& snap, const LocalTime& now,
                      const resource::Forecast& forecast) {
    const auto decision = engine_.evaluate(settings, snap, now, std::nullopt, forecast);
    if (const auto* denied = std::get_if<Denied>(&decision)) {
        noteDenial(*denied);
        return;
    }

    const auto& grant = std::get<Granted>(decision);
    const auto workload = source_->next(grant);
    if (!workload) return;

    // Narrow the grant to the category actually being run.
    const auto narrowed = engine_.evaluate(settings, snap, now, workload->category(), forecast);
    if (const auto* denied = std::get_if<Denied>(&narrowed)) {
        noteDenial(*denied);
        return;
    }

    if (denialLogged_) Registry::contribution()->info("[Scheduler] Contribution permitted again");
    lastDenial_.reset();
    denialLogged_ = false;

    auto task = std::make_shared<ContributionTask>(workload->category(), std::get<Granted>(narrowed));
    auto worker = std::async(std::launch::async, [task, workload] {
        TaskContext ctx(*task);
        workload->run(ctx);
    });

    Registry::contribution()->info("[Scheduler] Started task {} ({}) with cpu<={:.0f}% ram<={}MB for at most {}s",
                                   task->id(), task->category(), task->grant().max_cpu_percent,
                                   task->grant().max_ram_mb, task->grant().max_duration_seconds);
    running_ = Running{std::move(task), std::move(worker)};
}

void Scheduler::supervise(const Settings& settings, const resource::Snapshot& snap, const LocalTime& now,
                          const resource::Forecast& forecast) {
    auto& task = running_->task;

    if (running_->worker.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        try {
            running_->worker.get();
            if (!task->abortRequested()) task->setProgress(1.0);
            stopRunning(task->abortRequested() ? TaskState::Aborted : TaskState::Completed, {});
        } catch (const std::exception& e) {
            stopRunning(TaskState::Failed, e.what());
        }
        return;
    }

    const auto decision = engine_.evaluate(settings, snap, now, task->category(), forecast);
    if (const auto* denied = std::get_if<Denied>(&decision)) {
        noteDenial(*denied);
        stopRunning(TaskState::Aborted, denied->message());
        return;
    }

    const auto elapsedMs = util::nowMillis() - task->startedAt();
    if (elapsedMs >= static_cast<int64_t>(task->grant().max_duration_seconds) * 1000)
        stopRunning(TaskState::Aborted, "session time limit reached");
}

void Scheduler::stopRunning(const TaskState final, const std::string& reason) {
    auto task = running_->task;

    if (final == TaskState::Aborted) {
        task->abort(reason);
        if (running_->worker.valid()) draining_.push_back(std::move(running_->worker));
    } else {
        task->finish(final, reason);
    }

    TaskReport report;
    report.task_id = task->id();
    report.category = task->category();
    report.state = task->state();
    report.reason = task->finishReason();
    report.progress = task->progress();
    report.started_at = task->startedAt();
    report.finished_at = util::nowMillis();
    report.usage = task->usage();

    running_.reset();

    Registry::audit()->info("[Contribution] task={} category={} state={} reason='{}' progress={:.2f} "
                            "cpu_s={:.2f} peak_ram_mb={} bytes={} wall_s={:.1f}",
                            report.task_id, report.category, to_string(report.state), report.reason,
                            report.progress, report.usage.cpu_seconds, report.usage.peak_ram_mb,
                            report.usage.bytes_transferred, report.usage.wall_seconds);

    if (report.state == TaskState::Completed)
        Registry::contribution()->info("[Scheduler] Task {} completed", report.task_id);
    else
        Registry::contribution()->warn("[Scheduler] Task {} {}: {}", report.task_id, to_string(report.state), report.reason);

    lastReport_ = report;
    unreported_.push_back(std::move(report));
}

void Scheduler::flushReports() {
    std::vector<TaskReport> pending;
    {
        std::scoped_lock lock(mutex_);
        pending.swap(unreported_);
    }
    if (!reporter_) return;

    for (const auto& report : pending) {
        try {
            reporter_->report(report);
        } catch (const std::exception& e) {
            Registry::contribution()->error("[Scheduler] Failed to report usage for task {}: {}", report.task_id, e.what());
        }
    }
}

void Scheduler::noteDraining() {
    if (drainingLogged_) return;
    drainingLogged_ = true;
    Registry::contribution()->info("[Scheduler] Waiting for {} aborted workload(s) to exit before admitting new work",
                                   draining_.size());
}

void Scheduler::noteDenial(const Denied& d) {
    const bool changed = !lastDenial_ || lastDenial_->reason != d.reason;
    lastDenial_ = d;
    if (!changed) return;

    denialLogged_ = true;
    if (d.retry_after_seconds)
        Registry::contribution()->info("[Scheduler] Not contributing: {} (retry in {}s)", d.message(), *d.retry_after_seconds);
    else
        Registry::contribution()->info("[Scheduler] Not contributing: {}", d.message());
}

void Scheduler::reap() {
    std::erase_if(draining_, [](std::future<void>& f) {
        if (f.wait_for(std::chrono::seconds(0)) != std::future_status::ready) return false;
        try {
            f.get();
        } catch (const std::exception& e) {
            Registry::contribution()->debug("[Scheduler] Aborted workload exited with: {}", e.what());
        }
        return true;
    });
    if (draining_.empty()) drainingLogged_ = false;
}

void Scheduler::abortCurrent(const std::string& reason) {
    {
        std::scoped_lock lock(mutex_);
        if (running_) stopRunning(TaskState::Aborted, reason);
    }
    flushReports();
}

std::size_t Scheduler::drainingCount() const {
    std::scoped_lock lock(mutex_);
    return draining_.size();
}

std::shared_ptr<const ContributionTask> Scheduler::current() const {
    std::scoped_lock lock(mutex_);
    return running_ ? running_->task : nullptr;
}

std::optional<Denied> Scheduler::lastDenial() const {
    std::scoped_lock lock(mutex_);
    return lastDenial_;
}

std::optional<TaskReport> Scheduler::lastReport() const {
    std::scoped_lock lock(mutex_);
    return lastReport_;
}
