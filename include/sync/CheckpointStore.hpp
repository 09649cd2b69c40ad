#pragma once

#include "sync/model/Item.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>

namespace tandem::sync {

// Last server timestamp through which a pull was fully applied, per data type.
// Values only ever move forward.
class CheckpointStore {
public:
    explicit CheckpointStore(std::filesystem::path file);

    void load();

    [[nodiscard]] int64_t get(model::DataType type) const;

    // Applies every entry that moves its checkpoint forward and persists once.
    // Entries that would move a checkpoint backwards are ignored.
    void commit(const std::map<model::DataType, int64_t>& advanced);

    [[nodiscard]] int64_t lastSyncAt() const;

private:
    mutable std::mutex mutex_;
    std::filesystem::path file_;
    std::map<model::DataType, int64_t> checkpoints_;
    int64_t lastSyncAt_{};

    void persist() const;
};

}
