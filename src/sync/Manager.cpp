#include "sync/Manager.hpp"
#include "sync/Errors.hpp"
#include "realtime/Channel.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <limits>

using namespace tandem::sync;
using namespace tandem::sync::model;
using namespace tandem::log;

Manager::Manager(std::shared_ptr<Transport> transport,
                 std::shared_ptr<PendingQueue> queue,
                 std::shared_ptr<Replica> replica,
                 std::shared_ptr<CheckpointStore> checkpoints,
                 std::shared_ptr<ConflictStore> conflicts,
                 ConflictResolver resolver,
                 const config::SyncConfig& cfg)
    : AsyncService("SyncManager"),
      transport_(std::move(transport)),
      queue_(std::move(queue)),
      replica_(std::move(replica)),
      checkpoints_(std::move(checkpoints)),
      conflicts_(std::move(conflicts)),
      resolver_(std::move(resolver)),
      cfg_(cfg) {}

Manager::~Manager() { stop(); }

std::shared_ptr<spdlog::logger> Manager::logger() const { return Registry::sync(); }

void Manager::runLoop() {
    while (!shouldStop()) {
        syncNow();
        lazySleep(std::chrono::seconds(cfg_.interval_seconds));
    }
}

CycleReport Manager::syncNow() {
    std::promise<CycleReport> promise;
    std::shared_future<CycleReport> future;
    bool owner = false;

    {
        std::scoped_lock lock(cycleMutex_);
        if (inFlight_.valid() && inFlight_.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            future = inFlight_;
        } else {
            future = promise.get_future().share();
            inFlight_ = future;
            owner = true;
        }
    }

    if (!owner) {
        Registry::sync()->debug("[SyncManager] Sync requested while a cycle is running, joining it");
        return future.get();
    }

    auto report = runCycle();
    promise.set_value(report);
    return report;
}

CycleReport Manager::runCycle() {
    CycleReport report;
    report.started_at = util::nowMillis();

    if (queue_->corrupt()) {
        state_.store(State::Suspended);
        report.outcome = CycleReport::Outcome::Suspended;
        report.error = "Pending queue is corrupt; clear it to resume sync";
    } else if (!online_.load()) {
        state_.store(State::Offline);
        report.outcome = CycleReport::Outcome::Offline;
        report.error = "No connectivity";
    } else {
        try {
            ConflictMap conflicts;
            std::map<DataType, int64_t> advanced;

            state_.store(State::Pushing);
            pushPhase(report, conflicts);

            state_.store(State::Pulling);
            pullPhase(report, conflicts, advanced);

            state_.store(State::ResolvingConflicts);
            resolvePhase(report, conflicts);

            checkpoints_->commit(advanced);
            state_.store(State::Idle);
            report.outcome = CycleReport::Outcome::Completed;
        } catch (const NetworkError& e) {
            state_.store(State::Offline);
            report.outcome = CycleReport::Outcome::Offline;
            report.error = e.what();
        } catch (const CorruptQueueError& e) {
            state_.store(State::Suspended);
            report.outcome = CycleReport::Outcome::Suspended;
            report.error = e.what();
        } catch (const std::exception& e) {
            state_.store(State::Idle);
            report.outcome = CycleReport::Outcome::Failed;
            report.error = e.what();
        }

        if (!online_.load()) state_.store(State::Offline);
    }

    report.finished_at = util::nowMillis();

    switch (report.outcome) {
        case CycleReport::Outcome::Completed:
            Registry::sync()->info("[SyncManager] Cycle completed: {} pushed, {} acknowledged, {} rejected, {} pulled, "
                                   "{} conflicts ({} auto, {} manual)",
                                   report.pushed, report.acknowledged, report.rejected, report.pulled,
                                   report.conflicts, report.auto_resolved, report.manual);
            break;
        case CycleReport::Outcome::Offline:
            Registry::sync()->info("[SyncManager] Offline ({}); {} changes remain queued", report.error, queue_->size());
            break;
        case CycleReport::Outcome::Suspended:
            Registry::sync()->error("[SyncManager] Sync suspended: {}", report.error);
            break;
        case CycleReport::Outcome::Failed:
            Registry::sync()->error("[SyncManager] Cycle failed, checkpoint unchanged: {}", report.error);
            break;
    }

    {
        std::scoped_lock lock(statusMutex_);
        lastReport_ = report;
    }
    return report;
}

template <typename Fn>
auto Manager::withRetry(Fn&& fn, const std::string& what) -> decltype(fn()) {
    return cfg_.retry.run(
        std::forward<Fn>(fn),
        [](const std::exception& e) { return dynamic_cast<const NetworkError*>(&e) != nullptr; },
        [this](const std::chrono::milliseconds delay) { return util::interruptibleSleep(delay, interruptFlag_); },
        [&what](const unsigned int attempt, const std::exception& e) {
            Registry::sync()->warn("[SyncManager] {} attempt {} failed: {}", what, attempt, e.what());
        });
}

void Manager::pushPhase(CycleReport& report, ConflictMap& conflicts) {
    const auto changes = queue_->nextBatch(std::numeric_limits<std::size_t>::max());
    if (changes.empty()) return;

    const std::size_t batchSize = std::max(1u, cfg_.batch_size);
    const std::size_t batches = (changes.size() + batchSize - 1) / batchSize;

    for (std::size_t b = 0; b < batches; ++b) {
        PushRequest req;
        for (std::size_t i = b * batchSize; i < std::min(changes.size(), (b + 1) * batchSize); ++i)
            req.items.push_back(changes[i].item);
        report.pushed += req.items.size();

        const auto resp = withRetry([&] { return transport_->push(req); }, "Push");

        std::vector<bool> settled(req.items.size(), false);
        const auto claim = [&](const std::string& id) -> std::optional<std::size_t> {
            for (std::size_t i = 0; i < req.items.size(); ++i) {
                if (settled[i] || req.items[i].id != id) continue;
                settled[i] = true;
                return i;
            }
            return std::nullopt;
        };

        std::size_t acked = 0, rejected = 0;
        for (const auto& result : resp.results) {
            const auto idx = claim(result.id);
            if (!idx) {
                Registry::sync()->warn("[SyncManager] Push result for unknown id {}", result.id);
                continue;
            }

            const auto& item = req.items[*idx];
            if (result.success) {
                queue_->acknowledge(item);
                ++acked;
                continue;
            }

            ++rejected;
            report.rejections.push_back(result);
            recordAttempt(report, item, result.error.value_or("Rejected by remote"));
        }

        for (const auto& remote : resp.conflicts) {
            auto info = remote;
            if (const auto idx = claim(remote.server_version.id)) info.local_version = req.items[*idx];
            info.suggested_resolution = resolver_.strategyFor(info.server_version.data_type);
            if (!info.detected_at) info.detected_at = util::nowMillis();
            conflicts[to_string(info.key())] = std::move(info);
        }

        for (std::size_t i = 0; i < req.items.size(); ++i)
            if (!settled[i]) recordAttempt(report, req.items[i], "No acknowledgement from remote");

        report.acknowledged += acked;
        report.rejected += rejected;
        Registry::sync()->info("[SyncManager] Push batch {}/{}: {} acknowledged, {} rejected, {} conflicts",
                               b + 1, batches, acked, rejected, resp.conflicts.size());
    }
}

void Manager::recordAttempt(CycleReport& report, const SyncItem& item, const std::string& error) {
    if (queue_->markAttempt(item.key(), error)) {
        ++report.newly_failed;
        Registry::sync()->error("[SyncManager] {} failed permanently after {} attempts: {}",
                                to_string(item.key()), queue_->maxAttempts(), error);
    } else {
        Registry::sync()->warn("[SyncManager] {} not accepted: {}", to_string(item.key()), error);
    }
}

void Manager::pullPhase(CycleReport& report, ConflictMap& conflicts, std::map<DataType, int64_t>& advanced) {
    for (const auto type : ALL_DATA_TYPES) {
        const auto since = checkpoints_->get(type);
        int64_t high = since;
        std::optional<std::string> cursor;

        while (true) {
            const PullRequest req{type, since, cursor, cfg_.page_limit};
            const auto resp = withRetry([&] { return transport_->pull(req); }, "Pull " + to_string(type));

            for (const auto& item : resp.items) {
                if (item.data_type != type)
                    throw ProtocolError("Pull for " + to_string(type) + " returned " + to_string(item.key()));
                if (!item.checksumMatches())
                    throw ProtocolError("Checksum mismatch on pulled " + to_string(item.key()));

                ++report.pulled;

                std::scoped_lock lock(applyMutex_);
                const auto pending = queue_->find(item.key());

                if (pending && item.timestamp > since) {
                    if (pending->item == item) {
                        // The remote already holds exactly our version.
                        queue_->acknowledge(item);
                        replica_->apply(item);
                        ++report.applied;
                        continue;
                    }

                    auto& slot = conflicts[to_string(item.key())];
                    if (slot.server_version.id.empty() || item.timestamp >= slot.server_version.timestamp)
                        slot = {pending->item, item, resolver_.strategyFor(type), util::nowMillis()};
                    continue;
                }

                replica_->apply(item);
                ++report.applied;
            }

            high = std::max(high, resp.server_timestamp);

            if (!resp.has_more) break;
            if (!resp.next_cursor)
                throw ProtocolError("Pull page for " + to_string(type) + " has more data but no cursor");
            cursor = resp.next_cursor;
        }

        advanced[type] = high;
    }
}

void Manager::resolvePhase(CycleReport& report, const ConflictMap& conflicts) {
    for (const auto& [_, conflict] : conflicts) {
        ++report.conflicts;
        std::scoped_lock lock(applyMutex_);
        if (settleConflict(conflict)) ++report.auto_resolved;
        else ++report.manual;
    }
}

bool Manager::settleConflict(const ConflictInfo& conflict) {
    const auto outcome = resolver_.resolve(conflict);

    if (outcome.needsUser()) {
        auto parked = conflict;
        parked.suggested_resolution = Resolution::Manual;
        conflicts_->put(parked);
        // The local version lives on inside the parked conflict until the user decides.
        queue_->discard(conflict.key());
        Registry::sync()->info("[SyncManager] {} needs a manual decision", to_string(conflict.key()));
        return false;
    }

    const auto& resolved = *outcome.resolved;
    replica_->apply(resolved);

    if (resolved == conflict.server_version) queue_->discard(conflict.key());
    else if (!queue_->enqueue(resolved))
        Registry::sync()->error("[SyncManager] Could not queue resolved {} for upload", to_string(conflict.key()));

    Registry::sync()->debug("[SyncManager] Resolved {} via {}", to_string(conflict.key()), to_string(outcome.strategy));
    return true;
}

bool Manager::submitLocal(const SyncItem& item) {
    if (!queue_->enqueue(item)) return false;

    std::shared_ptr<realtime::Channel> channel;
    {
        std::scoped_lock lock(statusMutex_);
        channel = channel_;
    }
    if (!cfg_.realtime_enabled || !channel || !online_.load() || !channel->usable()) return true;

    switch (channel->send(item)) {
        case realtime::SendResult::Delivered:
            queue_->acknowledge(item);
            break;
        case realtime::SendResult::Rejected:
            queue_->markAttempt(item.key(), "Rejected over realtime channel");
            break;
        case realtime::SendResult::NotDelivered:
            break;
    }
    return true;
}

void Manager::applyRemote(const SyncItem& item) {
    std::scoped_lock lock(applyMutex_);

    const auto pending = queue_->find(item.key());
    if (!pending) {
        replica_->apply(item);
        return;
    }

    if (pending->item == item) {
        queue_->acknowledge(item);
        replica_->apply(item);
        return;
    }

    settleConflict({pending->item, item, resolver_.strategyFor(item.data_type), util::nowMillis()});
}

void Manager::attachRealtime(std::shared_ptr<realtime::Channel> channel) {
    if (channel) channel->setItemHandler([this](const SyncItem& item) { applyRemote(item); });
    std::scoped_lock lock(statusMutex_);
    channel_ = std::move(channel);
}

void Manager::setConnectivity(const bool online) {
    if (online_.exchange(online) == online) return;

    if (!online) {
        state_.store(State::Offline);
        Registry::sync()->info("[SyncManager] Connectivity lost; {} changes stay queued", queue_->size());
        return;
    }

    if (state_.load() == State::Offline) state_.store(State::Idle);
    Registry::sync()->info("[SyncManager] Connectivity restored, syncing");
    wake();
}

bool Manager::resolveManually(const ItemKey& key, const Resolution choice, const std::optional<SyncItem>& merged) {
    std::scoped_lock lock(applyMutex_);

    const auto conflict = conflicts_->find(key);
    if (!conflict) return false;

    const auto& local = conflict->local_version;
    const auto& server = conflict->server_version;

    SyncItem chosen;
    switch (choice) {
        case Resolution::UseLocal:
            chosen = local;
            break;
        case Resolution::UseServer:
            chosen = server;
            break;
        case Resolution::LatestWins:
            chosen = ConflictResolver::latestWins(local, server);
            break;
        case Resolution::Merge:
            if (merged) chosen = *merged;
            else if (auto m = ConflictResolver::merge(local, server)) chosen = std::move(*m);
            else throw std::invalid_argument("Cannot merge " + to_string(key) + " without an explicit merged item");
            break;
        case Resolution::Manual:
            throw std::invalid_argument("Manual is not a decision");
    }

    if (!(chosen.key() == key)) throw std::invalid_argument("Merged item does not address " + to_string(key));

    if (chosen == server) {
        queue_->discard(key);
    } else {
        // A user decision is a fresh local edit and must order after the server version.
        chosen.timestamp = std::max(util::nowMillis(), server.timestamp + 1);
        chosen.rehash();
        if (!queue_->enqueue(chosen))
            throw std::runtime_error("Pending queue refused the resolution for " + to_string(key));
    }

    replica_->apply(chosen);
    conflicts_->take(key);

    Registry::sync()->info("[SyncManager] {} resolved by user via {}", to_string(key), to_string(choice));
    wake();
    return true;
}

void Manager::clearCorruptQueue() {
    queue_->clear();
    state_.store(online_.load() ? State::Idle : State::Offline);
    Registry::sync()->warn("[SyncManager] Pending queue cleared by operator, sync resumed");
    wake();
}

SyncStatus Manager::status() const {
    SyncStatus s;
    s.state = state_.load();
    s.online = online_.load();
    s.last_sync_at = checkpoints_->lastSyncAt();
    s.pending = queue_->pendingCount();
    s.failed = queue_->failedCount();
    s.unresolved_conflicts = conflicts_->size();

    std::scoped_lock lock(statusMutex_);
    s.realtime_usable = cfg_.realtime_enabled && channel_ && channel_->usable();
    s.last_report = lastReport_;
    return s;
}
