#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace tandem::sync::model {

enum class DataType { MemoryRecord, SessionRecord, KnowledgeChunk, Setting };

enum class Operation { Create, Update, Delete };

inline constexpr DataType ALL_DATA_TYPES[] = {
    DataType::MemoryRecord, DataType::SessionRecord, DataType::KnowledgeChunk, DataType::Setting
};

std::string to_string(DataType t);
std::string to_string(Operation op);
DataType dataTypeFromString(const std::string& str);
Operation operationFromString(const std::string& str);

// (id, data_type) addresses exactly one logical record across replicas.
struct ItemKey {
    std::string id;
    DataType data_type{DataType::MemoryRecord};

    friend bool operator==(const ItemKey&, const ItemKey&) = default;
};

struct ItemKeyHash {
    size_t operator()(const ItemKey& k) const noexcept {
        return std::hash<std::string>{}(k.id) ^ (static_cast<size_t>(k.data_type) << 1);
    }
};

struct SyncItem {
    std::string id;
    DataType data_type{DataType::MemoryRecord};
    Operation operation{Operation::Create};
    std::string payload;   // opaque serialized value; may be empty for Delete
    int64_t timestamp{};   // origin clock, ms since epoch, monotonic per origin
    std::string checksum;  // sha256 hex of payload

    SyncItem() = default;
    SyncItem(std::string id, DataType type, Operation op, std::string payload, int64_t timestamp);

    [[nodiscard]] ItemKey key() const { return {id, data_type}; }

    void rehash();
    [[nodiscard]] bool checksumMatches() const;

    friend bool operator==(const SyncItem&, const SyncItem&) = default;
};

std::string to_string(const ItemKey& key);

void to_json(nlohmann::json& j, const SyncItem& item);
void from_json(const nlohmann::json& j, SyncItem& item);

}
