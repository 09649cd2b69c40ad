#include "sync/ConflictResolver.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

using namespace tandem::sync;
using namespace tandem::sync::model;

namespace {

nlohmann::json unionArrays(const nlohmann::json& local, const nlohmann::json& server) {
    auto out = nlohmann::json::array();
    const auto append = [&out](const nlohmann::json& v) {
        if (std::find(out.begin(), out.end(), v) == out.end()) out.push_back(v);
    };
    for (const auto& v : local) append(v);
    for (const auto& v : server) append(v);
    return out;
}

nlohmann::json mergeField(const nlohmann::json& local, const nlohmann::json& server, const bool localIsNewer) {
    if (local.is_array() && server.is_array()) return unionArrays(local, server);
    if (local.is_string() && server.is_string()) {
        const auto& l = local.get_ref<const std::string&>();
        const auto& s = server.get_ref<const std::string&>();
        return l.size() > s.size() ? local : server;
    }
    return localIsNewer ? local : server;
}

}

ConflictResolver::ConflictResolver(std::set<DataType> manualTypes) : manualTypes_(std::move(manualTypes)) {}

ConflictResolver ConflictResolver::fromConfig(const std::vector<std::string>& manualTypeNames) {
    std::set<DataType> types;
    for (const auto& name : manualTypeNames) types.insert(dataTypeFromString(name));
    return ConflictResolver(std::move(types));
}

Resolution ConflictResolver::strategyFor(const DataType type) const {
    if (manualTypes_.contains(type)) return Resolution::Manual;

    switch (type) {
        case DataType::MemoryRecord: return Resolution::Merge;
        case DataType::SessionRecord:
        case DataType::KnowledgeChunk: return Resolution::UseServer;
        case DataType::Setting: return Resolution::UseLocal;
    }
    return Resolution::LatestWins;
}

ResolvedConflict ConflictResolver::resolve(const ConflictInfo& conflict) const {
    return resolve(conflict.local_version, conflict.server_version);
}

ResolvedConflict ConflictResolver::resolve(const SyncItem& local, const SyncItem& server) const {
    switch (strategyFor(server.data_type)) {
        case Resolution::Manual: return {Resolution::Manual, std::nullopt};
        case Resolution::UseServer: return {Resolution::UseServer, server};
        case Resolution::UseLocal: return {Resolution::UseLocal, local};
        case Resolution::Merge:
            if (auto merged = merge(local, server)) return {Resolution::Merge, std::move(merged)};
            return {Resolution::LatestWins, latestWins(local, server)};
        case Resolution::LatestWins: break;
    }
    return {Resolution::LatestWins, latestWins(local, server)};
}

SyncItem ConflictResolver::latestWins(const SyncItem& local, const SyncItem& server) {
    return local.timestamp > server.timestamp ? local : server;
}

std::optional<SyncItem> ConflictResolver::merge(const SyncItem& local, const SyncItem& server) {
    if (local.operation == Operation::Delete || server.operation == Operation::Delete) return std::nullopt;

    const auto l = nlohmann::json::parse(local.payload, nullptr, false);
    const auto s = nlohmann::json::parse(server.payload, nullptr, false);
    if (!l.is_object() || !s.is_object()) return std::nullopt;

    const bool localIsNewer = local.timestamp > server.timestamp;

    auto out = nlohmann::json::object();
    for (const auto& [key, value] : s.items()) {
        if (l.contains(key)) out[key] = mergeField(l[key], value, localIsNewer);
        else out[key] = value;
    }
    for (const auto& [key, value] : l.items())
        if (!s.contains(key)) out[key] = value;

    return SyncItem(server.id, server.data_type, Operation::Update, out.dump(),
                    std::max(local.timestamp, server.timestamp));
}
