#include "sync/model/Item.hpp"
#include "util/hash.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

namespace tandem::sync::model {

SyncItem::SyncItem(std::string id, const DataType type, const Operation op, std::string payload, const int64_t timestamp)
    : id(std::move(id)), data_type(type), operation(op), payload(std::move(payload)), timestamp(timestamp) {
    rehash();
}

void SyncItem::rehash() { checksum = util::sha256Hex(payload); }

bool SyncItem::checksumMatches() const { return checksum == util::sha256Hex(payload); }

std::string to_string(const DataType t) {
    switch (t) {
        case DataType::MemoryRecord: return "memory_record";
        case DataType::SessionRecord: return "session_record";
        case DataType::KnowledgeChunk: return "knowledge_chunk";
        case DataType::Setting: return "setting";
    }
    return "unknown";
}

std::string to_string(const Operation op) {
    switch (op) {
        case Operation::Create: return "create";
        case Operation::Update: return "update";
        case Operation::Delete: return "delete";
    }
    return "unknown";
}

std::string to_string(const ItemKey& key) { return to_string(key.data_type) + "/" + key.id; }

DataType dataTypeFromString(const std::string& str) {
    if (str == "memory_record") return DataType::MemoryRecord;
    if (str == "session_record") return DataType::SessionRecord;
    if (str == "knowledge_chunk") return DataType::KnowledgeChunk;
    if (str == "setting") return DataType::Setting;
    throw std::invalid_argument("Unknown data type: " + str);
}

Operation operationFromString(const std::string& str) {
    if (str == "create") return Operation::Create;
    if (str == "update") return Operation::Update;
    if (str == "delete") return Operation::Delete;
    throw std::invalid_argument("Unknown operation: " + str);
}

void to_json(nlohmann::json& j, const SyncItem& item) {
    j = {
        {"id", item.id},
        {"data_type", to_string(item.data_type)},
        {"operation", to_string(item.operation)},
        {"payload", item.payload},
        {"timestamp", item.timestamp},
        {"checksum", item.checksum}
    };
}

void from_json(const nlohmann::json& j, SyncItem& item) {
    item.id = j.at("id").get<std::string>();
    item.data_type = dataTypeFromString(j.at("data_type").get<std::string>());
    item.operation = operationFromString(j.at("operation").get<std::string>());
    item.payload = j.value("payload", std::string{});
    item.timestamp = j.at("timestamp").get<int64_t>();
    if (j.contains("checksum") && !j["checksum"].is_null()) item.checksum = j["checksum"].get<std::string>();
    else item.rehash();
}

}
