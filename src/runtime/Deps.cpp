#include "runtime/Deps.hpp"
#include "config/Credentials.hpp"
#include "contribution/HttpUsageReporter.hpp"
#include "contribution/SettingsStore.hpp"
#include "realtime/WebSocketLink.hpp"
#include "resource/Analyzer.hpp"
#include "resource/Probe.hpp"
#include "sync/CheckpointStore.hpp"
#include "sync/ConflictStore.hpp"
#include "sync/Errors.hpp"
#include "sync/PendingQueue.hpp"
#include "sync/Replica.hpp"
#include "sync/Transport.hpp"
#include "log/Registry.hpp"

using namespace tandem::runtime;
using namespace tandem::log;

std::shared_ptr<Deps> Deps::build(const config::Config& cfg) {
    Registry::tandem()->info("[Deps] Initializing...");

    auto ctx = std::make_shared<Deps>();
    const auto creds = config::loadCredentials(cfg.device.id, cfg.device.credential_file);
    const auto timeout = std::chrono::seconds(cfg.remote.request_timeout_seconds);
    const auto& stateDir = cfg.sync.state_dir;

    ctx->probe = std::make_shared<resource::LinuxProbe>();
    ctx->analyzer = std::make_shared<resource::Analyzer>(ctx->probe, cfg.resources);

    ctx->settings = std::make_shared<contribution::SettingsStore>(cfg.contribution.settings_file);
    ctx->settings->load();
    ctx->workSource = std::make_shared<contribution::NoWorkSource>();
    ctx->usageReporter = std::make_shared<contribution::HttpUsageReporter>(cfg.remote.base_url, creds, timeout);

    ctx->pendingQueue = std::make_shared<sync::PendingQueue>(stateDir / "pending.jsonl",
                                                             cfg.sync.offline_queue_max, cfg.sync.max_attempts);
    try {
        ctx->pendingQueue->load();
    } catch (const sync::CorruptQueueError& e) {
        Registry::sync()->error("[Deps] {}", e.what());
    }

    ctx->replica = std::make_shared<sync::MemoryReplica>();
    ctx->checkpoints = std::make_shared<sync::CheckpointStore>(stateDir / "checkpoints.json");
    ctx->checkpoints->load();
    ctx->conflicts = std::make_shared<sync::ConflictStore>(stateDir / "conflicts.json");
    ctx->conflicts->load();
    ctx->transport = std::make_shared<sync::HttpTransport>(cfg.remote.base_url, creds, timeout);

    if (cfg.sync.realtime_enabled)
        ctx->realtimeLink = std::make_shared<realtime::WebSocketLink>(cfg.remote.realtime_url, creds);

    Registry::tandem()->info("[Deps] Initialized.");
    return ctx;
}
