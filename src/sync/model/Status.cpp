#include "sync/model/Status.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

namespace tandem::sync::model {

std::string to_string(const State s) {
    switch (s) {
        case State::Idle: return "idle";
        case State::Pushing: return "pushing";
        case State::Pulling: return "pulling";
        case State::ResolvingConflicts: return "resolving_conflicts";
        case State::Offline: return "offline";
        case State::Suspended: return "suspended";
    }
    return "unknown";
}

std::string to_string(const CycleReport::Outcome o) {
    switch (o) {
        case CycleReport::Outcome::Completed: return "completed";
        case CycleReport::Outcome::Offline: return "offline";
        case CycleReport::Outcome::Suspended: return "suspended";
        case CycleReport::Outcome::Failed: return "failed";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const CycleReport& r) {
    j = {
        {"outcome", to_string(r.outcome)},
        {"pushed", r.pushed},
        {"acknowledged", r.acknowledged},
        {"rejected", r.rejected},
        {"newly_failed", r.newly_failed},
        {"pulled", r.pulled},
        {"applied", r.applied},
        {"conflicts", r.conflicts},
        {"auto_resolved", r.auto_resolved},
        {"manual", r.manual},
        {"rejections", r.rejections},
        {"started_at", util::millisToString(r.started_at)},
        {"finished_at", util::millisToString(r.finished_at)}
    };
    if (!r.error.empty()) j["error"] = r.error;
}

void to_json(nlohmann::json& j, const SyncStatus& s) {
    j = {
        {"state", to_string(s.state)},
        {"online", s.online},
        {"realtime_usable", s.realtime_usable},
        {"last_sync_at", s.last_sync_at ? nlohmann::json(util::millisToString(s.last_sync_at)) : nlohmann::json(nullptr)},
        {"pending", s.pending},
        {"failed", s.failed},
        {"unresolved_conflicts", s.unresolved_conflicts}
    };
    if (s.last_report) j["last_report"] = *s.last_report;
}

}
