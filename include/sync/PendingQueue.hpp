#pragma once

#include "sync/model/PendingChange.hpp"

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tandem::sync {

// Durable log of local mutations the remote has not acknowledged yet.
// Backed by a JSON-lines journal that is rewritten (tmp + rename) on every mutation.
// The application only appends; acknowledgement from the sync manager is the only removal path.
class PendingQueue {
public:
    PendingQueue(std::filesystem::path journal, unsigned int maxSize, unsigned int maxAttempts);

    // Reads the journal. Throws CorruptQueueError if any line cannot be parsed; the queue then
    // refuses writes until clear() is called.
    void load();

    // Returns false when the queue is full, corrupt or the journal cannot be written. An existing change for the same
    // (id, data_type) is replaced in place: original queued_at kept, attempts reset.
    bool enqueue(const model::SyncItem& item);

    // Oldest non-failed changes first.
    [[nodiscard]] std::vector<model::PendingChange> nextBatch(std::size_t max) const;

    // Removes the change only if it still holds exactly this version of the item. A change
    // coalesced after the push went out stays queued.
    bool acknowledge(const model::SyncItem& pushed);

    // Counts one failed delivery. Returns true if the change just crossed the attempt ceiling.
    bool markAttempt(const model::ItemKey& key, const std::string& error);

    // Drops a change whose content has been superseded (conflict resolved in favour of the server).
    bool discard(const model::ItemKey& key);

    [[nodiscard]] std::optional<model::PendingChange> find(const model::ItemKey& key) const;
    [[nodiscard]] bool isDirty(const model::ItemKey& key) const;

    [[nodiscard]] std::vector<model::PendingChange> all() const;
    [[nodiscard]] std::vector<model::PendingChange> failed() const;

    // Re-arms permanently failed changes. Returns how many were re-armed.
    std::size_t retryFailed();

    // Empties the queue and, if the journal was corrupt, sets it aside for inspection.
    void clear();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t pendingCount() const;
    [[nodiscard]] std::size_t failedCount() const;
    [[nodiscard]] bool corrupt() const;

    [[nodiscard]] unsigned int maxAttempts() const { return maxAttempts_; }

private:
    mutable std::mutex mutex_;
    std::filesystem::path journal_;
    unsigned int maxSize_;
    unsigned int maxAttempts_;
    std::vector<model::PendingChange> changes_; // insertion order == queued_at order
    bool corrupt_{false};

    static std::vector<model::PendingChange>::iterator locate(std::vector<model::PendingChange>& changes,
                                                              const model::ItemKey& key);
    std::vector<model::PendingChange>::const_iterator locate(const model::ItemKey& key) const;

    // Writes `next` to the journal and only then makes it the in-memory state. Throws on write failure
    // with the queue unchanged.
    void commit(std::vector<model::PendingChange> next);
    void persist(const std::vector<model::PendingChange>& changes) const;
};

}
