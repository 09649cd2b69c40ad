#pragma once

#include "concurrency/AsyncService.hpp"
#include "config/Config.hpp"
#include "sync/CheckpointStore.hpp"
#include "sync/ConflictResolver.hpp"
#include "sync/ConflictStore.hpp"
#include "sync/PendingQueue.hpp"
#include "sync/Replica.hpp"
#include "sync/Transport.hpp"
#include "sync/model/Status.hpp"

#include <atomic>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace tandem::realtime { class Channel; }

namespace tandem::sync {

// Runs push -> pull -> resolve -> checkpoint cycles against the remote, one at a time.
class Manager final : public concurrency::AsyncService {
public:
    Manager(std::shared_ptr<Transport> transport,
            std::shared_ptr<PendingQueue> queue,
            std::shared_ptr<Replica> replica,
            std::shared_ptr<CheckpointStore> checkpoints,
            std::shared_ptr<ConflictStore> conflicts,
            ConflictResolver resolver,
            const config::SyncConfig& cfg);

    ~Manager() override;

    // Runs a cycle now, or waits for the one already in flight and returns its report.
    // Never throws; failures are reported in the CycleReport.
    model::CycleReport syncNow();

    // Records a local mutation. With realtime enabled and the channel up, the item is also
    // offered over the channel and dequeued once the remote acks it.
    bool submitLocal(const model::SyncItem& item);

    // Entry point for items pushed to us over the realtime channel.
    void applyRemote(const model::SyncItem& item);

    void attachRealtime(std::shared_ptr<realtime::Channel> channel);

    // Host-reported connectivity. Loss moves to Offline at once; regain triggers a cycle.
    void setConnectivity(bool online);

    // Applies a user decision to a stored manual conflict. Returns false if no such conflict.
    bool resolveManually(const model::ItemKey& key, model::Resolution choice,
                         const std::optional<model::SyncItem>& merged = std::nullopt);

    // The only way out of Suspended.
    void clearCorruptQueue();

    [[nodiscard]] model::SyncStatus status() const;
    [[nodiscard]] model::State state() const { return state_.load(); }
    [[nodiscard]] bool online() const { return online_.load(); }

protected:
    void runLoop() override;

    [[nodiscard]] std::shared_ptr<spdlog::logger> logger() const override;

private:
    using ConflictMap = std::map<std::string, model::ConflictInfo>;

    std::shared_ptr<Transport> transport_;
    std::shared_ptr<PendingQueue> queue_;
    std::shared_ptr<Replica> replica_;
    std::shared_ptr<CheckpointStore> checkpoints_;
    std::shared_ptr<ConflictStore> conflicts_;
    ConflictResolver resolver_;
    config::SyncConfig cfg_;

    std::atomic<model::State> state_{model::State::Idle};
    std::atomic<bool> online_{true};

    std::mutex cycleMutex_;
    std::shared_future<model::CycleReport> inFlight_;

    // Serialises every write into the replica that depends on the dirty set.
    std::mutex applyMutex_;

    mutable std::mutex statusMutex_;
    std::optional<model::CycleReport> lastReport_;
    std::shared_ptr<realtime::Channel> channel_;

    model::CycleReport runCycle();
    void pushPhase(model::CycleReport& report, ConflictMap& conflicts);
    void pullPhase(model::CycleReport& report, ConflictMap& conflicts, std::map<model::DataType, int64_t>& advanced);
    void resolvePhase(model::CycleReport& report, const ConflictMap& conflicts);

    // Caller holds applyMutex_. Returns false when the conflict was parked for the user.
    bool settleConflict(const model::ConflictInfo& conflict);

    void recordAttempt(model::CycleReport& report, const model::SyncItem& item, const std::string& error);

    template <typename Fn>
    auto withRetry(Fn&& fn, const std::string& what) -> decltype(fn());
};

}
