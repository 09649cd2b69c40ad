#include "sync/CheckpointStore.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

using namespace tandem::sync;
using namespace tandem::sync::model;
using namespace tandem::log;

CheckpointStore::CheckpointStore(std::filesystem::path file) : file_(std::move(file)) {}

void CheckpointStore::load() {
    std::scoped_lock lock(mutex_);
    checkpoints_.clear();
    lastSyncAt_ = 0;
    if (!std::filesystem::exists(file_)) return;

    std::ifstream in(file_);
    nlohmann::json j;
    try {
        in >> j;
        for (const auto& [name, ts] : j.at("checkpoints").items())
            checkpoints_[dataTypeFromString(name)] = ts.get<int64_t>();
        lastSyncAt_ = j.value("last_sync_at", int64_t{0});
    } catch (const std::exception& e) {
        // Falls back to a full re-pull.
        checkpoints_.clear();
        Registry::sync()->warn("[CheckpointStore] Ignoring unreadable checkpoint file {}: {}", file_.string(), e.what());
    }
}

int64_t CheckpointStore::get(const DataType type) const {
    std::scoped_lock lock(mutex_);
    if (const auto it = checkpoints_.find(type); it != checkpoints_.end()) return it->second;
    return 0;
}

void CheckpointStore::commit(const std::map<DataType, int64_t>& advanced) {
    std::scoped_lock lock(mutex_);
    for (const auto& [type, ts] : advanced) {
        auto& current = checkpoints_[type];
        if (ts > current) current = ts;
    }
    lastSyncAt_ = util::nowMillis();
    persist();
}

int64_t CheckpointStore::lastSyncAt() const {
    std::scoped_lock lock(mutex_);
    return lastSyncAt_;
}

void CheckpointStore::persist() const {
    nlohmann::json j;
    j["checkpoints"] = nlohmann::json::object();
    for (const auto& [type, ts] : checkpoints_) j["checkpoints"][to_string(type)] = ts;
    j["last_sync_at"] = lastSyncAt_;

    if (file_.has_parent_path()) std::filesystem::create_directories(file_.parent_path());
    auto tmp = file_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) throw std::runtime_error("Unable to write checkpoint file: " + tmp.string());
        out << j.dump(2);
    }
    std::filesystem::rename(tmp, file_);
}
