#include "sync/Replica.hpp"

using namespace tandem::sync;
using namespace tandem::sync::model;

std::optional<SyncItem> MemoryReplica::get(const ItemKey& key) const {
    std::scoped_lock lock(mutex_);
    if (const auto it = items_.find(key); it != items_.end()) return it->second;
    return std::nullopt;
}

void MemoryReplica::apply(const SyncItem& item) {
    std::scoped_lock lock(mutex_);
    if (item.operation == Operation::Delete) items_.erase(item.key());
    else items_.insert_or_assign(item.key(), item);
}

std::vector<SyncItem> MemoryReplica::items(const DataType type) const {
    std::scoped_lock lock(mutex_);
    std::vector<SyncItem> out;
    for (const auto& [key, item] : items_)
        if (key.data_type == type) out.push_back(item);
    return out;
}

std::size_t MemoryReplica::size() const {
    std::scoped_lock lock(mutex_);
    return items_.size();
}
