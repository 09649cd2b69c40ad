#pragma once

#include "config/Config.hpp"
#include "runtime/Deps.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace tandem::concurrency { class AsyncService; }
namespace tandem::resource { class Sampler; }
namespace tandem::sync { class Manager; }
namespace tandem::realtime { class Channel; }
namespace tandem::contribution { class Scheduler; }

namespace tandem::runtime {

class Manager {
public:
    Manager(std::shared_ptr<Deps> deps, const config::Config& cfg);

    ~Manager();

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    // Sampler first so permission checks never see a placeholder for long, then the
    // realtime channel, sync and finally contribution.
    void startAll();
    void stopAll();
    void restartService(const std::string& name);

    [[nodiscard]] bool allRunning() const;

    [[nodiscard]] const std::shared_ptr<Deps>& deps() const { return deps_; }
    [[nodiscard]] std::shared_ptr<sync::Manager> syncManager() const { return syncManager_; }
    [[nodiscard]] std::shared_ptr<realtime::Channel> realtimeChannel() const { return channel_; }
    [[nodiscard]] std::shared_ptr<contribution::Scheduler> scheduler() const { return scheduler_; }

private:
    std::shared_ptr<Deps> deps_;
    std::chrono::milliseconds watchdogInterval_{std::chrono::seconds(2)};

    std::shared_ptr<resource::Sampler> sampler_;
    std::shared_ptr<realtime::Channel> channel_;
    std::shared_ptr<sync::Manager> syncManager_;
    std::shared_ptr<contribution::Scheduler> scheduler_;

    mutable std::mutex mutex_;
    std::vector<std::pair<std::string, std::shared_ptr<concurrency::AsyncService>>> services_; // in start order

    std::thread watchdogThread_;
    std::atomic<bool> watchdogRunning_{false};

    void tryStart(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc);
    static void stopService(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc);

    void startWatchdog();
    void stopWatchdog();
};

}
