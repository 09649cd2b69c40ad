#pragma once

#include "sync/model/Item.hpp"

#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace tandem::sync {

// The local copy of user data the application reads from. The sync manager writes
// remote changes and conflict resolutions into it.
class Replica {
public:
    virtual ~Replica() = default;

    [[nodiscard]] virtual std::optional<model::SyncItem> get(const model::ItemKey& key) const = 0;

    // Upserts, or erases when item.operation is Delete.
    virtual void apply(const model::SyncItem& item) = 0;

    [[nodiscard]] virtual std::vector<model::SyncItem> items(model::DataType type) const = 0;
};

class MemoryReplica final : public Replica {
public:
    [[nodiscard]] std::optional<model::SyncItem> get(const model::ItemKey& key) const override;
    void apply(const model::SyncItem& item) override;
    [[nodiscard]] std::vector<model::SyncItem> items(model::DataType type) const override;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<model::ItemKey, model::SyncItem, model::ItemKeyHash> items_;
};

}
