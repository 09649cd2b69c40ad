#include "sync/model/PendingChange.hpp"

#include <nlohmann/json.hpp>

namespace tandem::sync::model {

void to_json(nlohmann::json& j, const PendingChange& c) {
    j = {
        {"item", c.item},
        {"queued_at", c.queued_at},
        {"attempt_count", c.attempt_count},
        {"failed", c.failed},
        {"last_error", c.last_error}
    };
}

void from_json(const nlohmann::json& j, PendingChange& c) {
    j.at("item").get_to(c.item);
    c.queued_at = j.at("queued_at").get<int64_t>();
    c.attempt_count = j.value("attempt_count", 0u);
    c.failed = j.value("failed", false);
    c.last_error = j.value("last_error", std::string{});
}

}
