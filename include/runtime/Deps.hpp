#pragma once

#include "config/Config.hpp"

#include <memory>

namespace tandem::resource { class Analyzer; class Probe; }
namespace tandem::contribution { class SettingsStore; class WorkSource; class UsageReporter; }
namespace tandem::sync { class PendingQueue; class Replica; class CheckpointStore; class ConflictStore; class Transport; }
namespace tandem::realtime { class Link; }

namespace tandem::runtime {

// Everything the services share, built once and handed to runtime::Manager. Each member
// guards its own state; there is no lock over the whole context.
struct Deps {
    std::shared_ptr<resource::Probe> probe;
    std::shared_ptr<resource::Analyzer> analyzer;

    std::shared_ptr<contribution::SettingsStore> settings;
    std::shared_ptr<contribution::WorkSource> workSource;
    std::shared_ptr<contribution::UsageReporter> usageReporter;

    std::shared_ptr<sync::PendingQueue> pendingQueue;
    std::shared_ptr<sync::Replica> replica;
    std::shared_ptr<sync::CheckpointStore> checkpoints;
    std::shared_ptr<sync::ConflictStore> conflicts;
    std::shared_ptr<sync::Transport> transport;

    std::shared_ptr<realtime::Link> realtimeLink; // null unless sync.realtime_enabled

    // Production wiring: Linux probe, HTTP transport, websocket link, stores under sync.state_dir.
    // A corrupt pending queue is logged and left for the sync manager to report as Suspended.
    static std::shared_ptr<Deps> build(const config::Config& cfg);
};

}
