#pragma once

#include "sync/model/Conflict.hpp"
#include "sync/model/Item.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace tandem::sync::model {

struct PullRequest {
    DataType data_type{DataType::MemoryRecord};
    int64_t since_timestamp{};
    std::optional<std::string> cursor;
    unsigned int limit{};
};

struct PullResponse {
    std::vector<SyncItem> items;
    std::optional<std::string> next_cursor;
    bool has_more{};
    int64_t server_timestamp{};
};

struct PushRequest {
    std::vector<SyncItem> items;
};

struct PushResult {
    std::string id;
    bool success{};
    std::optional<std::string> error;
};

struct PushResponse {
    std::vector<PushResult> results;
    std::vector<ConflictInfo> conflicts;
};

void to_json(nlohmann::json& j, const PullRequest& r);
void from_json(const nlohmann::json& j, PullRequest& r);
void to_json(nlohmann::json& j, const PullResponse& r);
void from_json(const nlohmann::json& j, PullResponse& r);
void to_json(nlohmann::json& j, const PushRequest& r);
void from_json(const nlohmann::json& j, PushRequest& r);
void to_json(nlohmann::json& j, const PushResult& r);
void from_json(const nlohmann::json& j, PushResult& r);
void to_json(nlohmann::json& j, const PushResponse& r);
void from_json(const nlohmann::json& j, PushResponse& r);

}
