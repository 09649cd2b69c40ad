#include "sync/ConflictStore.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

using namespace tandem::sync;
using namespace tandem::sync::model;
using namespace tandem::log;

ConflictStore::ConflictStore(std::filesystem::path file) : file_(std::move(file)) {}

void ConflictStore::load() {
    std::scoped_lock lock(mutex_);
    conflicts_.clear();
    if (!std::filesystem::exists(file_)) return;

    std::ifstream in(file_);
    nlohmann::json j;
    in >> j; // a damaged conflict file is an operator problem; let it propagate
    for (const auto& entry : j.at("conflicts")) {
        auto c = entry.get<ConflictInfo>();
        conflicts_[to_string(c.key())] = std::move(c);
    }
    Registry::sync()->debug("[ConflictStore] Loaded {} unresolved conflicts", conflicts_.size());
}

void ConflictStore::put(const ConflictInfo& conflict) {
    std::scoped_lock lock(mutex_);
    conflicts_[to_string(conflict.key())] = conflict;
    persist();
}

std::optional<ConflictInfo> ConflictStore::take(const ItemKey& key) {
    std::scoped_lock lock(mutex_);
    const auto it = conflicts_.find(to_string(key));
    if (it == conflicts_.end()) return std::nullopt;
    auto out = std::move(it->second);
    conflicts_.erase(it);
    persist();
    return out;
}

std::optional<ConflictInfo> ConflictStore::find(const ItemKey& key) const {
    std::scoped_lock lock(mutex_);
    if (const auto it = conflicts_.find(to_string(key)); it != conflicts_.end()) return it->second;
    return std::nullopt;
}

std::vector<ConflictInfo> ConflictStore::list() const {
    std::scoped_lock lock(mutex_);
    std::vector<ConflictInfo> out;
    out.reserve(conflicts_.size());
    for (const auto& [_, c] : conflicts_) out.push_back(c);
    return out;
}

std::size_t ConflictStore::size() const {
    std::scoped_lock lock(mutex_);
    return conflicts_.size();
}

void ConflictStore::persist() const {
    nlohmann::json j;
    j["conflicts"] = nlohmann::json::array();
    for (const auto& [_, c] : conflicts_) j["conflicts"].push_back(c);

    if (file_.has_parent_path()) std::filesystem::create_directories(file_.parent_path());
    auto tmp = file_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) throw std::runtime_error("Unable to write conflict file: " + tmp.string());
        out << j.dump(2);
    }
    std::filesystem::rename(tmp, file_);
}
