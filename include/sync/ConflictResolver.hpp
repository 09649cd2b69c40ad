#pragma once

#include "sync/model/Conflict.hpp"

#include <set>
#include <string>
#include <vector>

namespace tandem::sync {

// Deterministic mapping (data_type, local, server) -> resolution. No state beyond the
// set of types the operator forces to manual review.
class ConflictResolver {
public:
    ConflictResolver() = default;
    explicit ConflictResolver(std::set<model::DataType> manualTypes);

    static ConflictResolver fromConfig(const std::vector<std::string>& manualTypeNames);

    [[nodiscard]] model::Resolution strategyFor(model::DataType type) const;

    [[nodiscard]] model::ResolvedConflict resolve(const model::SyncItem& local, const model::SyncItem& server) const;
    [[nodiscard]] model::ResolvedConflict resolve(const model::ConflictInfo& conflict) const;

    // Server wins ties.
    [[nodiscard]] static model::SyncItem latestWins(const model::SyncItem& local, const model::SyncItem& server);

    // Field-wise merge of two JSON object payloads: arrays unioned (local order first), strings
    // longest-wins with ties to the server, everything else from the newer side. Returns
    // nullopt when either side is not a JSON object or either side is a delete.
    [[nodiscard]] static std::optional<model::SyncItem> merge(const model::SyncItem& local, const model::SyncItem& server);

private:
    std::set<model::DataType> manualTypes_;
};

}
