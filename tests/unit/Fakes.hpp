#pragma once

#include "contribution/Task.hpp"
#include "realtime/Link.hpp"
#include "resource/Probe.hpp"
#include "sync/Errors.hpp"
#include "sync/Transport.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

namespace tandem::test {

namespace fs = std::filesystem;

inline fs::path makeTempDir(const std::string& prefix) {
    static std::mt19937_64 rng{std::random_device{}()};
    auto dir = fs::temp_directory_path() / (prefix + "_" + std::to_string(rng()));
    fs::create_directories(dir);
    return dir;
}

// In-memory remote. Pushes are idempotent by (id, timestamp, checksum); pulls return items newer than `since`.
class FakeTransport final : public sync::Transport {
public:
    sync::model::PushResponse push(const sync::model::PushRequest& req) override {
        if (pushDelay.count()) std::this_thread::sleep_for(pushDelay);
        std::scoped_lock lock(mutex_);
        ++pushCalls;
        callLog.push_back("push");
        if (offline) throw sync::NetworkError("connection refused");

        sync::model::PushResponse resp;
        for (const auto& item : req.items) {
            if (rejectIds.contains(item.id)) {
                resp.results.push_back({item.id, false, std::string("validation failed")});
                continue;
            }
            if (const auto c = conflictFor.find(item.id); c != conflictFor.end()) {
                resp.conflicts.push_back({item, c->second, sync::model::Resolution::Manual, 0});
                continue;
            }
            auto& slot = store_[item.key()];
            if (slot.checksum != item.checksum || slot.timestamp != item.timestamp) {
                slot = item;
                clock_ = std::max(clock_, item.timestamp);
                ++writes;
            }
            resp.results.push_back({item.id, true, std::nullopt});
        }
        return resp;
    }

    sync::model::PullResponse pull(const sync::model::PullRequest& req) override {
        std::scoped_lock lock(mutex_);
        ++pullCalls;
        callLog.push_back("pull");
        if (offline) throw sync::NetworkError("connection refused");
        if (failPullFor && *failPullFor == req.data_type) throw sync::ProtocolError("bad page");

        std::vector<sync::model::SyncItem> matching;
        for (const auto& [key, item] : store_)
            if (key.data_type == req.data_type && item.timestamp > req.since_timestamp) matching.push_back(item);
        std::sort(matching.begin(), matching.end(), [](const auto& a, const auto& b) { return a.timestamp < b.timestamp; });

        const std::size_t offset = req.cursor ? std::stoul(*req.cursor) : 0;
        const std::size_t pageSize = pageLimit ? pageLimit : req.limit;

        sync::model::PullResponse resp;
        for (std::size_t i = offset; i < matching.size() && resp.items.size() < pageSize; ++i)
            resp.items.push_back(matching[i]);
        const std::size_t consumed = offset + resp.items.size();
        resp.has_more = consumed < matching.size();
        if (resp.has_more) resp.next_cursor = std::to_string(consumed);
        resp.server_timestamp = resp.items.empty() ? req.since_timestamp : resp.items.back().timestamp;
        return resp;
    }

    // Server-side write, as if another device had pushed it.
    sync::model::SyncItem putRemote(sync::model::SyncItem item) {
        std::scoped_lock lock(mutex_);
        item.timestamp = std::max<int64_t>(item.timestamp, ++clock_);
        clock_ = item.timestamp;
        item.rehash();
        store_[item.key()] = item;
        return item;
    }

    std::optional<sync::model::SyncItem> remote(const sync::model::ItemKey& key) const {
        std::scoped_lock lock(mutex_);
        const auto it = store_.find(key);
        if (it == store_.end()) return std::nullopt;
        return it->second;
    }

    std::size_t remoteCount() const {
        std::scoped_lock lock(mutex_);
        return store_.size();
    }

    std::atomic<bool> offline{false};
    std::set<std::string> rejectIds;
    std::map<std::string, sync::model::SyncItem> conflictFor;
    std::optional<sync::model::DataType> failPullFor;
    std::size_t pageLimit{};
    std::chrono::milliseconds pushDelay{0};
    int pushCalls{}, pullCalls{}, writes{};
    std::vector<std::string> callLog;

private:
    struct KeyLess {
        bool operator()(const sync::model::ItemKey& a, const sync::model::ItemKey& b) const {
            return std::tie(a.data_type, a.id) < std::tie(b.data_type, b.id);
        }
    };

    mutable std::mutex mutex_;
    std::map<sync::model::ItemKey, sync::model::SyncItem, KeyLess> store_;
    int64_t clock_{1000};
};

// Scripted link: open() fails while failOpen is set, poll() hands out queued inbound frames.
class FakeLink final : public realtime::Link {
public:
    void open() override {
        std::scoped_lock lock(mutex_);
        ++openCalls;
        if (failOpen) throw realtime::LinkError("connection refused");
        open_ = true;
    }

    void send(const std::string& text) override {
        std::scoped_lock lock(mutex_);
        if (!open_) throw realtime::LinkError("not connected");
        sent.push_back(text);
    }

    std::vector<std::string> poll(const std::chrono::milliseconds timeout) override {
        {
            std::scoped_lock lock(mutex_);
            if (!open_) throw realtime::LinkError("not connected");
            if (!inbound_.empty()) {
                std::vector<std::string> out(inbound_.begin(), inbound_.end());
                inbound_.clear();
                return out;
            }
        }
        std::this_thread::sleep_for(std::min(timeout, std::chrono::milliseconds(5)));
        return {};
    }

    void close() override {
        std::scoped_lock lock(mutex_);
        open_ = false;
    }

    [[nodiscard]] bool isOpen() const override {
        std::scoped_lock lock(mutex_);
        return open_;
    }

    void deliver(const std::string& text) {
        std::scoped_lock lock(mutex_);
        inbound_.push_back(text);
    }

    std::vector<std::string> sentFrames() const {
        std::scoped_lock lock(mutex_);
        return sent;
    }

    std::atomic<bool> failOpen{false};
    std::atomic<int> openCalls{0};

private:
    mutable std::mutex mutex_;
    bool open_{false};
    std::deque<std::string> inbound_;
    std::vector<std::string> sent;
};

class FakeProbe final : public resource::Probe {
public:
    resource::Reading read() override {
        std::scoped_lock lock(mutex_);
        if (fail) throw std::runtime_error("permission denied");
        return reading;
    }

    void recordActivity() override {
        std::scoped_lock lock(mutex_);
        reading.idle_seconds = 0;
        ++activity;
    }

    void set(const resource::Reading& r) {
        std::scoped_lock lock(mutex_);
        reading = r;
    }

    bool fail{false};
    int activity{};

private:
    std::mutex mutex_;
    resource::Reading reading{};
};

// Runs until asked to abort, reporting progress as it goes.
class BlockingWorkload final : public contribution::Workload {
public:
    explicit BlockingWorkload(std::string category = "inference") : category_(std::move(category)) {}

    [[nodiscard]] std::string category() const override { return category_; }

    void run(contribution::TaskContext& ctx) override {
        started = true;
        while ((ignoreAbort || !ctx.shouldAbort()) && !release) {
            ctx.reportProgress(0.5);
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        if (throwOnRelease && release) throw std::runtime_error("workload crashed");
        sawAbort = ctx.shouldAbort();
    }

    std::atomic<bool> started{false};
    std::atomic<bool> release{false};
    std::atomic<bool> sawAbort{false};
    bool throwOnRelease{false};
    bool ignoreAbort{false}; // keeps running after abort until released

private:
    std::string category_;
};

class QueueWorkSource final : public contribution::WorkSource {
public:
    std::shared_ptr<contribution::Workload> next(const contribution::Granted& grant) override {
        std::scoped_lock lock(mutex_);
        lastGrant = grant;
        ++requests;
        if (pending.empty()) return nullptr;
        auto w = pending.front();
        pending.pop_front();
        return w;
    }

    void push(std::shared_ptr<contribution::Workload> w) {
        std::scoped_lock lock(mutex_);
        pending.push_back(std::move(w));
    }

    std::optional<contribution::Granted> lastGrant;
    int requests{};

private:
    std::mutex mutex_;
    std::deque<std::shared_ptr<contribution::Workload>> pending;
};

class RecordingReporter final : public contribution::UsageReporter {
public:
    void report(const contribution::TaskReport& r) override {
        std::scoped_lock lock(mutex_);
        reports.push_back(r);
        if (fail) throw std::runtime_error("remote unavailable");
    }

    std::vector<contribution::TaskReport> all() const {
        std::scoped_lock lock(mutex_);
        return reports;
    }

    bool fail{false};

private:
    mutable std::mutex mutex_;
    std::vector<contribution::TaskReport> reports;
};

}
