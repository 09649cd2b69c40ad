#pragma once

#include "sync/model/Item.hpp"

#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace tandem::sync::model {

enum class Resolution { Merge, UseServer, UseLocal, LatestWins, Manual };

std::string to_string(Resolution r);
Resolution resolutionFromString(const std::string& str);

struct ConflictInfo {
    SyncItem local_version;
    SyncItem server_version;
    Resolution suggested_resolution{Resolution::Manual};
    int64_t detected_at{};

    [[nodiscard]] ItemKey key() const { return local_version.key(); }
};

// Outcome of running the resolver over one conflict. `resolved` is empty only for Manual.
struct ResolvedConflict {
    Resolution strategy{Resolution::Manual};
    std::optional<SyncItem> resolved;

    [[nodiscard]] bool needsUser() const { return strategy == Resolution::Manual; }
};

void to_json(nlohmann::json& j, const ConflictInfo& c);
void from_json(const nlohmann::json& j, ConflictInfo& c);

}
