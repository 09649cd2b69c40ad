#pragma once

#include "sync/model/Item.hpp"

#include <cstdint>
#include <nlohmann/json_fwd.hpp>

namespace tandem::sync::model {

struct PendingChange {
    SyncItem item;
    int64_t queued_at{};
    unsigned int attempt_count{};
    bool failed{};           // hit the attempt ceiling; surfaced, no longer pushed
    std::string last_error;

    [[nodiscard]] ItemKey key() const { return item.key(); }
};

void to_json(nlohmann::json& j, const PendingChange& c);
void from_json(const nlohmann::json& j, PendingChange& c);

}
