#include "sync/model/Wire.hpp"

#include <nlohmann/json.hpp>

namespace tandem::sync::model {

void to_json(nlohmann::json& j, const PullRequest& r) {
    j = {
        {"data_type", to_string(r.data_type)},
        {"since_timestamp", r.since_timestamp},
        {"limit", r.limit}
    };
    if (r.cursor) j["cursor"] = *r.cursor;
}

void from_json(const nlohmann::json& j, PullRequest& r) {
    r.data_type = dataTypeFromString(j.at("data_type").get<std::string>());
    r.since_timestamp = j.at("since_timestamp").get<int64_t>();
    r.limit = j.value("limit", 0u);
    if (j.contains("cursor") && !j["cursor"].is_null()) r.cursor = j["cursor"].get<std::string>();
    else r.cursor.reset();
}

void to_json(nlohmann::json& j, const PullResponse& r) {
    j = {
        {"items", r.items},
        {"has_more", r.has_more},
        {"server_timestamp", r.server_timestamp}
    };
    if (r.next_cursor) j["next_cursor"] = *r.next_cursor;
}

void from_json(const nlohmann::json& j, PullResponse& r) {
    r.items = j.value("items", std::vector<SyncItem>{});
    r.has_more = j.value("has_more", false);
    r.server_timestamp = j.at("server_timestamp").get<int64_t>();
    if (j.contains("next_cursor") && !j["next_cursor"].is_null()) r.next_cursor = j["next_cursor"].get<std::string>();
    else r.next_cursor.reset();
}

void to_json(nlohmann::json& j, const PushRequest& r) { j = {{"items", r.items}}; }

void from_json(const nlohmann::json& j, PushRequest& r) { j.at("items").get_to(r.items); }

void to_json(nlohmann::json& j, const PushResult& r) {
    j = {{"id", r.id}, {"success", r.success}};
    if (r.error) j["error"] = *r.error;
}

void from_json(const nlohmann::json& j, PushResult& r) {
    r.id = j.at("id").get<std::string>();
    r.success = j.at("success").get<bool>();
    if (j.contains("error") && !j["error"].is_null()) r.error = j["error"].get<std::string>();
    else r.error.reset();
}

void to_json(nlohmann::json& j, const PushResponse& r) {
    j = {{"results", r.results}, {"conflicts", r.conflicts}};
}

void from_json(const nlohmann::json& j, PushResponse& r) {
    r.results = j.value("results", std::vector<PushResult>{});
    r.conflicts = j.value("conflicts", std::vector<ConflictInfo>{});
}

}
