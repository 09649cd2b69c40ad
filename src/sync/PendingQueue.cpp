#include "sync/PendingQueue.hpp"
#include "sync/Errors.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace tandem::sync;
using namespace tandem::sync::model;
using namespace tandem::log;

PendingQueue::PendingQueue(std::filesystem::path journal, const unsigned int maxSize, const unsigned int maxAttempts)
    : journal_(std::move(journal)), maxSize_(maxSize), maxAttempts_(maxAttempts) {}

void PendingQueue::load() {
    std::scoped_lock lock(mutex_);
    changes_.clear();
    corrupt_ = false;

    if (!std::filesystem::exists(journal_)) return;

    std::ifstream in(journal_);
    if (!in) {
        corrupt_ = true;
        throw CorruptQueueError("Unable to open pending queue journal: " + journal_.string());
    }

    std::string line;
    std::size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (line.empty()) continue;
        try {
            changes_.push_back(nlohmann::json::parse(line).get<PendingChange>());
        } catch (const std::exception& e) {
            changes_.clear();
            corrupt_ = true;
            throw CorruptQueueError("Pending queue journal " + journal_.string() + " line " +
                                    std::to_string(lineNo) + ": " + e.what());
        }
    }

    Registry::sync()->debug("[PendingQueue] Loaded {} changes from {}", changes_.size(), journal_.string());
}

bool PendingQueue::enqueue(const SyncItem& item) {
    std::scoped_lock lock(mutex_);

    if (corrupt_) {
        Registry::sync()->error("[PendingQueue] Refusing {}: journal is corrupt, clear it first", to_string(item.key()));
        return false;
    }

    auto next = changes_;
    if (const auto it = locate(next, item.key()); it != next.end()) {
        it->item = item;
        it->attempt_count = 0;
        it->failed = false;
        it->last_error.clear();
    } else if (next.size() >= maxSize_) {
        Registry::sync()->warn("[PendingQueue] Queue full ({} changes), refusing {}", maxSize_, to_string(item.key()));
        return false;
    } else {
        next.push_back({item, util::nowMillis(), 0, false, {}});
    }

    try {
        commit(std::move(next));
    } catch (const std::exception& e) {
        Registry::sync()->error("[PendingQueue] Refusing {}: {}", to_string(item.key()), e.what());
        return false;
    }
    return true;
}

std::vector<PendingChange> PendingQueue::nextBatch(const std::size_t max) const {
    std::scoped_lock lock(mutex_);
    std::vector<PendingChange> batch;
    for (const auto& c : changes_) {
        if (batch.size() >= max) break;
        if (!c.failed) batch.push_back(c);
    }
    return batch;
}

bool PendingQueue::acknowledge(const SyncItem& pushed) {
    std::scoped_lock lock(mutex_);
    auto next = changes_;
    const auto it = locate(next, pushed.key());
    if (it == next.end()) return false;
    if (it->item.timestamp != pushed.timestamp || it->item.checksum != pushed.checksum) return false;
    next.erase(it);
    commit(std::move(next));
    return true;
}

bool PendingQueue::markAttempt(const ItemKey& key, const std::string& error) {
    std::scoped_lock lock(mutex_);
    auto next = changes_;
    const auto it = locate(next, key);
    if (it == next.end()) return false;

    ++it->attempt_count;
    it->last_error = error;
    const bool crossed = !it->failed && it->attempt_count >= maxAttempts_;
    if (crossed) it->failed = true;
    commit(std::move(next));
    return crossed;
}

bool PendingQueue::discard(const ItemKey& key) {
    std::scoped_lock lock(mutex_);
    auto next = changes_;
    const auto it = locate(next, key);
    if (it == next.end()) return false;
    next.erase(it);
    commit(std::move(next));
    return true;
}

std::optional<PendingChange> PendingQueue::find(const ItemKey& key) const {
    std::scoped_lock lock(mutex_);
    const auto it = locate(key);
    if (it == changes_.end()) return std::nullopt;
    return *it;
}

bool PendingQueue::isDirty(const ItemKey& key) const {
    std::scoped_lock lock(mutex_);
    return locate(key) != changes_.end();
}

std::vector<PendingChange> PendingQueue::all() const {
    std::scoped_lock lock(mutex_);
    return changes_;
}

std::vector<PendingChange> PendingQueue::failed() const {
    std::scoped_lock lock(mutex_);
    std::vector<PendingChange> out;
    std::copy_if(changes_.begin(), changes_.end(), std::back_inserter(out),
                 [](const PendingChange& c) { return c.failed; });
    return out;
}

std::size_t PendingQueue::retryFailed() {
    std::scoped_lock lock(mutex_);
    auto next = changes_;
    std::size_t count = 0;
    for (auto& c : next) {
        if (!c.failed) continue;
        c.failed = false;
        c.attempt_count = 0;
        ++count;
    }
    if (count) commit(std::move(next));
    return count;
}

void PendingQueue::clear() {
    std::scoped_lock lock(mutex_);

    if (corrupt_ && std::filesystem::exists(journal_)) {
        auto aside = journal_;
        aside += ".corrupt-" + std::to_string(util::nowMillis());
        std::error_code ec;
        std::filesystem::rename(journal_, aside, ec);
        if (ec) Registry::sync()->error("[PendingQueue] Failed to set corrupt journal aside: {}", ec.message());
        else Registry::sync()->warn("[PendingQueue] Corrupt journal moved to {}", aside.string());
    }

    commit({});
    corrupt_ = false;
}

std::size_t PendingQueue::size() const {
    std::scoped_lock lock(mutex_);
    return changes_.size();
}

std::size_t PendingQueue::pendingCount() const {
    std::scoped_lock lock(mutex_);
    return static_cast<std::size_t>(std::count_if(changes_.begin(), changes_.end(),
                                                  [](const PendingChange& c) { return !c.failed; }));
}

std::size_t PendingQueue::failedCount() const {
    std::scoped_lock lock(mutex_);
    return static_cast<std::size_t>(std::count_if(changes_.begin(), changes_.end(),
                                                  [](const PendingChange& c) { return c.failed; }));
}

bool PendingQueue::corrupt() const {
    std::scoped_lock lock(mutex_);
    return corrupt_;
}

std::vector<PendingChange>::iterator PendingQueue::locate(std::vector<PendingChange>& changes, const ItemKey& key) {
    return std::find_if(changes.begin(), changes.end(), [&](const PendingChange& c) { return c.key() == key; });
}

std::vector<PendingChange>::const_iterator PendingQueue::locate(const ItemKey& key) const {
    return std::find_if(changes_.begin(), changes_.end(), [&](const PendingChange& c) { return c.key() == key; });
}

void PendingQueue::commit(std::vector<PendingChange> next) {
    persist(next);
    changes_ = std::move(next);
}

void PendingQueue::persist(const std::vector<PendingChange>& changes) const {
    if (journal_.has_parent_path()) std::filesystem::create_directories(journal_.parent_path());

    auto tmp = journal_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) throw std::runtime_error("Unable to write pending queue journal: " + tmp.string());
        for (const auto& c : changes) out << nlohmann::json(c).dump() << '\n';
        out.flush();
        if (!out) throw std::runtime_error("Short write on pending queue journal: " + tmp.string());
    }
    std::filesystem::rename(tmp, journal_);
}
