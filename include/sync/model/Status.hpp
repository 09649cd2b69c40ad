#pragma once

#include "sync/model/Wire.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace tandem::sync::model {

enum class State { Idle, Pushing, Pulling, ResolvingConflicts, Offline, Suspended };

std::string to_string(State s);

struct CycleReport {
    enum class Outcome { Completed, Offline, Suspended, Failed };

    Outcome outcome{Outcome::Completed};
    std::string error;

    std::size_t pushed{};
    std::size_t acknowledged{};
    std::size_t rejected{};
    std::size_t newly_failed{};
    std::size_t pulled{};
    std::size_t applied{};
    std::size_t conflicts{};
    std::size_t auto_resolved{};
    std::size_t manual{};

    std::vector<PushResult> rejections;

    int64_t started_at{};
    int64_t finished_at{};

    [[nodiscard]] bool completed() const { return outcome == Outcome::Completed; }
};

std::string to_string(CycleReport::Outcome o);

struct SyncStatus {
    State state{State::Idle};
    bool online{true};
    bool realtime_usable{};
    int64_t last_sync_at{};
    std::size_t pending{};
    std::size_t failed{};
    std::size_t unresolved_conflicts{};
    std::optional<CycleReport> last_report;
};

void to_json(nlohmann::json& j, const CycleReport& r);
void to_json(nlohmann::json& j, const SyncStatus& s);

}
