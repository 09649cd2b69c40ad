#include "runtime/Manager.hpp"
#include "concurrency/AsyncService.hpp"
#include "contribution/Scheduler.hpp"
#include "realtime/Channel.hpp"
#include "resource/Sampler.hpp"
#include "sync/ConflictResolver.hpp"
#include "sync/Manager.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace tandem::runtime;
using namespace tandem::log;

Manager::Manager(std::shared_ptr<Deps> deps, const config::Config& cfg)
    : deps_(std::move(deps)) {
    sampler_ = std::make_shared<resource::Sampler>(deps_->analyzer, cfg.resources.sample_interval);

    syncManager_ = std::make_shared<sync::Manager>(deps_->transport, deps_->pendingQueue, deps_->replica,
                                                   deps_->checkpoints, deps_->conflicts,
                                                   sync::ConflictResolver::fromConfig(cfg.conflicts.manual_types),
                                                   cfg.sync);

    if (deps_->realtimeLink) {
        channel_ = std::make_shared<realtime::Channel>(deps_->realtimeLink, cfg.realtime);
        syncManager_->attachRealtime(channel_);
    }

    scheduler_ = std::make_shared<contribution::Scheduler>(deps_->settings, deps_->analyzer, deps_->workSource,
                                                           deps_->usageReporter, cfg.contribution);

    services_.emplace_back("ResourceSampler", sampler_);
    if (channel_) services_.emplace_back("RealtimeChannel", channel_);
    services_.emplace_back("SyncManager", syncManager_);
    services_.emplace_back("ContributionScheduler", scheduler_);
}

Manager::~Manager() { stopAll(); }

void Manager::startAll() {
    Registry::tandem()->debug("[ServiceManager] Starting all services...");
    {
        std::scoped_lock lock(mutex_);
        for (const auto& [name, svc] : services_) tryStart(name, svc);
    }
    Registry::tandem()->debug("[ServiceManager] All services started.");

    startWatchdog();
}

void Manager::stopAll() {
    stopWatchdog();

    Registry::tandem()->debug("[ServiceManager] Stopping all services...");
    std::scoped_lock lock(mutex_);
    // Reverse start order: contribution stops before the sampler it depends on.
    for (auto it = services_.rbegin(); it != services_.rend(); ++it) stopService(it->first, it->second);
    Registry::tandem()->debug("[ServiceManager] All services stopped.");
}

void Manager::restartService(const std::string& name) {
    std::scoped_lock lock(mutex_);

    const auto it = std::find_if(services_.begin(), services_.end(), [&](const auto& p) { return p.first == name; });
    if (it == services_.end()) throw std::invalid_argument("Unknown service: " + name);

    Registry::tandem()->warn("[ServiceManager] Restarting service: {}", name);
    stopService(name, it->second);
    tryStart(name, it->second);
}

bool Manager::allRunning() const {
    std::scoped_lock lock(mutex_);
    return std::all_of(services_.begin(), services_.end(), [](const auto& p) { return p.second->isRunning(); });
}

void Manager::tryStart(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc) {
    if (!svc) return;
    Registry::tandem()->debug("[ServiceManager] Starting service: {}", name);
    try {
        svc->start();
    } catch (const std::exception& e) {
        Registry::tandem()->error("[ServiceManager] Failed to start {}: {}", name, e.what());
    }
}

void Manager::stopService(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc) {
    if (!svc) return;
    Registry::tandem()->debug("[ServiceManager] Stopping service: {}", name);
    svc->stop();
}

void Manager::startWatchdog() {
    if (watchdogRunning_.exchange(true)) return;

    watchdogThread_ = std::thread([this] {
        Registry::tandem()->info("[ServiceManager] Watchdog started.");
        while (watchdogRunning_.load()) {
            {
                std::scoped_lock lock(mutex_);
                for (const auto& [name, svc] : services_) {
                    if (svc->isRunning()) continue;
                    Registry::tandem()->warn("[Watchdog] {} is down, restarting...", name);
                    stopService(name, svc);
                    tryStart(name, svc);
                }
            }

            const auto deadline = std::chrono::steady_clock::now() + watchdogInterval_;
            while (watchdogRunning_.load() && std::chrono::steady_clock::now() < deadline)
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        Registry::tandem()->info("[ServiceManager] Watchdog stopped.");
    });
}

void Manager::stopWatchdog() {
    if (!watchdogRunning_.exchange(false)) return;
    if (watchdogThread_.joinable()) watchdogThread_.join();
}
