#pragma once

#include "sync/model/Conflict.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tandem::sync {

// Conflicts waiting for a user decision. One entry per (id, data_type); a newer
// conflict for the same record replaces the older one.
class ConflictStore {
public:
    explicit ConflictStore(std::filesystem::path file);

    void load();

    void put(const model::ConflictInfo& conflict);

    std::optional<model::ConflictInfo> take(const model::ItemKey& key);

    [[nodiscard]] std::optional<model::ConflictInfo> find(const model::ItemKey& key) const;
    [[nodiscard]] std::vector<model::ConflictInfo> list() const;
    [[nodiscard]] std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::filesystem::path file_;
    std::map<std::string, model::ConflictInfo> conflicts_; // keyed by to_string(ItemKey)

    void persist() const;
};

}
