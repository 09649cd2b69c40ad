#include <gtest/gtest.h>
#include "sync/Manager.hpp"
#include "realtime/Channel.hpp"
#include "Fakes.hpp"

#include <fstream>
#include <future>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using namespace tandem;
using namespace tandem::sync;
using namespace tandem::sync::model;
using json = nlohmann::json;

class SyncManagerTest : public ::testing::Test {
protected:
    fs::path dir;
    config::SyncConfig cfg;
    std::shared_ptr<test::FakeTransport> transport;
    std::shared_ptr<PendingQueue> queue;
    std::shared_ptr<MemoryReplica> replica;
    std::shared_ptr<CheckpointStore> checkpoints;
    std::shared_ptr<ConflictStore> conflicts;

    void SetUp() override {
        dir = test::makeTempDir("tandem_sync");
        cfg.batch_size = 50;
        cfg.page_limit = 100;
        cfg.max_attempts = 3;
        cfg.state_dir = dir;
        cfg.retry = util::RetryPolicy{1, std::chrono::milliseconds(1), std::chrono::milliseconds(1), 1.0, 0.0};

        transport = std::make_shared<test::FakeTransport>();
        queue = std::make_shared<PendingQueue>(dir / "pending.jsonl", 1000, cfg.max_attempts);
        replica = std::make_shared<MemoryReplica>();
        checkpoints = std::make_shared<CheckpointStore>(dir / "checkpoints.json");
        conflicts = std::make_shared<ConflictStore>(dir / "conflicts.json");
    }

    void TearDown() override { fs::remove_all(dir); }

    std::unique_ptr<Manager> makeManager(ConflictResolver resolver = {}) {
        return std::make_unique<Manager>(transport, queue, replica, checkpoints, conflicts, std::move(resolver), cfg);
    }

    static SyncItem memory(const std::string& id, const json& payload, const int64_t ts) {
        return {id, DataType::MemoryRecord, Operation::Update, payload.dump(), ts};
    }
};

TEST_F(SyncManagerTest, PushesBeforePulling) {
    auto mgr = makeManager();
    ASSERT_TRUE(mgr->submitLocal(memory("a", {{"content", "x"}}, 5000)));

    const auto report = mgr->syncNow();
    ASSERT_TRUE(report.completed()) << report.error;
    ASSERT_FALSE(transport->callLog.empty());
    EXPECT_EQ(transport->callLog.front(), "push");
    EXPECT_EQ(transport->pullCalls, 4); // one page per data type
    EXPECT_EQ(queue->size(), 0u);
    EXPECT_EQ(mgr->state(), State::Idle);
}

TEST_F(SyncManagerTest, RepeatedPushIsIdempotent) {
    auto mgr = makeManager();
    const auto item = memory("a", {{"content", "x"}}, 5000);

    ASSERT_TRUE(mgr->submitLocal(item));
    ASSERT_TRUE(mgr->syncNow().completed());
    ASSERT_TRUE(mgr->submitLocal(item));
    ASSERT_TRUE(mgr->syncNow().completed());

    EXPECT_EQ(transport->writes, 1);
    EXPECT_EQ(transport->remoteCount(), 1u);
}

TEST_F(SyncManagerTest, PartialBatchFailureKeepsOnlyRejectedItem) {
    auto mgr = makeManager();
    for (int i = 1; i <= 50; ++i)
        ASSERT_TRUE(mgr->submitLocal(memory("m" + std::to_string(i), {{"n", i}}, 5000 + i)));
    transport->rejectIds.insert("m30");

    auto report = mgr->syncNow();
    ASSERT_TRUE(report.completed()) << report.error;
    EXPECT_EQ(report.pushed, 50u);
    EXPECT_EQ(report.acknowledged, 49u);
    EXPECT_EQ(report.rejected, 1u);
    ASSERT_EQ(report.rejections.size(), 1u);
    EXPECT_EQ(report.rejections[0].id, "m30");

    ASSERT_EQ(queue->size(), 1u);
    const auto left = queue->find({"m30", DataType::MemoryRecord});
    ASSERT_TRUE(left);
    EXPECT_EQ(left->attempt_count, 1u);
    EXPECT_FALSE(left->failed);

    EXPECT_EQ(mgr->syncNow().newly_failed, 0u);
    report = mgr->syncNow();
    EXPECT_EQ(report.newly_failed, 1u);
    EXPECT_EQ(queue->failedCount(), 1u);
    EXPECT_EQ(mgr->status().failed, 1u);

    // A permanently failed change is no longer pushed.
    EXPECT_EQ(mgr->syncNow().pushed, 0u);
}

TEST_F(SyncManagerTest, AppliesRemoteChangesAndAdvancesCheckpoint) {
    transport->pageLimit = 2;
    int64_t last = 0;
    for (int i = 0; i < 5; ++i) last = transport->putRemote(memory("r" + std::to_string(i), {{"n", i}}, 0)).timestamp;
    transport->putRemote({"k1", DataType::KnowledgeChunk, Operation::Create, "chunk", 0});

    auto mgr = makeManager();
    const auto report = mgr->syncNow();
    ASSERT_TRUE(report.completed()) << report.error;

    EXPECT_EQ(report.pulled, 6u);
    EXPECT_EQ(replica->items(DataType::MemoryRecord).size(), 5u);
    EXPECT_TRUE(replica->get({"k1", DataType::KnowledgeChunk}));
    EXPECT_EQ(checkpoints->get(DataType::MemoryRecord), last);
    EXPECT_GT(checkpoints->lastSyncAt(), 0);

    // Nothing new: the next cycle pulls nothing.
    EXPECT_EQ(mgr->syncNow().pulled, 0u);
}

TEST_F(SyncManagerTest, FailedCycleLeavesCheckpointsUntouched) {
    transport->putRemote(memory("r1", {{"n", 1}}, 0));
    auto mgr = makeManager();
    ASSERT_TRUE(mgr->syncNow().completed());
    const auto before = checkpoints->get(DataType::MemoryRecord);

    transport->putRemote(memory("r2", {{"n", 2}}, 0));
    transport->failPullFor = DataType::SessionRecord;

    const auto report = mgr->syncNow();
    EXPECT_EQ(report.outcome, CycleReport::Outcome::Failed);
    EXPECT_EQ(checkpoints->get(DataType::MemoryRecord), before);

    transport->failPullFor.reset();
    ASSERT_TRUE(mgr->syncNow().completed());
    EXPECT_GT(checkpoints->get(DataType::MemoryRecord), before);
    EXPECT_TRUE(replica->get({"r2", DataType::MemoryRecord}));
}

TEST_F(SyncManagerTest, NetworkFailureGoesOfflineAndKeepsQueue) {
    auto mgr = makeManager();
    ASSERT_TRUE(mgr->submitLocal(memory("a", {{"content", "x"}}, 5000)));
    transport->offline = true;

    const auto report = mgr->syncNow();
    EXPECT_EQ(report.outcome, CycleReport::Outcome::Offline);
    EXPECT_EQ(mgr->state(), State::Offline);
    EXPECT_EQ(queue->size(), 1u);
    EXPECT_EQ(queue->find({"a", DataType::MemoryRecord})->attempt_count, 0u);

    transport->offline = false;
    EXPECT_TRUE(mgr->syncNow().completed());
    EXPECT_EQ(queue->size(), 0u);
}

TEST_F(SyncManagerTest, HostReportedOfflineSkipsTheRemote) {
    auto mgr = makeManager();
    mgr->setConnectivity(false);
    EXPECT_EQ(mgr->state(), State::Offline);

    EXPECT_EQ(mgr->syncNow().outcome, CycleReport::Outcome::Offline);
    EXPECT_EQ(transport->pushCalls + transport->pullCalls, 0);

    mgr->setConnectivity(true);
    EXPECT_EQ(mgr->state(), State::Idle);
    EXPECT_TRUE(mgr->syncNow().completed());
}

TEST_F(SyncManagerTest, CorruptQueueSuspendsUntilCleared) {
    {
        std::ofstream out(dir / "pending.jsonl");
        out << "garbage\n";
    }
    EXPECT_THROW(queue->load(), CorruptQueueError);

    auto mgr = makeManager();
    EXPECT_EQ(mgr->syncNow().outcome, CycleReport::Outcome::Suspended);
    EXPECT_EQ(mgr->state(), State::Suspended);
    EXPECT_FALSE(mgr->submitLocal(memory("a", {{"content", "x"}}, 5000)));

    mgr->clearCorruptQueue();
    EXPECT_TRUE(mgr->syncNow().completed());
    EXPECT_TRUE(mgr->submitLocal(memory("a", {{"content", "x"}}, 5000)));
}

TEST_F(SyncManagerTest, ConcurrentSyncRequestsJoinOneCycle) {
    auto mgr = makeManager();
    ASSERT_TRUE(mgr->submitLocal(memory("a", {{"content", "x"}}, 5000)));
    transport->pushDelay = std::chrono::milliseconds(200);

    auto first = std::async(std::launch::async, [&] { return mgr->syncNow(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    auto second = std::async(std::launch::async, [&] { return mgr->syncNow(); });

    const auto a = first.get();
    const auto b = second.get();
    EXPECT_EQ(a.started_at, b.started_at);
    EXPECT_EQ(transport->pushCalls, 1);
}

TEST_F(SyncManagerTest, MemoryConflictIsMergedAndRequeued) {
    const auto local = memory("r1", {{"content", "Met Dana at the climbing gym"}, {"tags", {"people"}}}, 2000);
    const auto server = transport->putRemote(memory("r1", {{"content", "Met Dana"}, {"tags", {"gym"}}}, 3000));
    transport->conflictFor["r1"] = server;

    auto mgr = makeManager();
    ASSERT_TRUE(mgr->submitLocal(local));

    const auto report = mgr->syncNow();
    ASSERT_TRUE(report.completed()) << report.error;
    EXPECT_EQ(report.conflicts, 1u);
    EXPECT_EQ(report.auto_resolved, 1u);

    const auto applied = replica->get({"r1", DataType::MemoryRecord});
    ASSERT_TRUE(applied);
    const auto merged = json::parse(applied->payload);
    EXPECT_EQ(merged["content"], "Met Dana at the climbing gym");
    EXPECT_EQ(merged["tags"], json({"people", "gym"}));
    EXPECT_EQ(applied->timestamp, server.timestamp);

    const auto queued = queue->find({"r1", DataType::MemoryRecord});
    ASSERT_TRUE(queued);
    EXPECT_EQ(queued->item, *applied);
}

TEST_F(SyncManagerTest, ServerWinsConflictDropsLocalChange) {
    const SyncItem local{"s1", DataType::SessionRecord, Operation::Update, "mine", 2000};
    const auto server = transport->putRemote({"s1", DataType::SessionRecord, Operation::Update, "theirs", 3000});
    transport->conflictFor["s1"] = server;

    auto mgr = makeManager();
    ASSERT_TRUE(mgr->submitLocal(local));
    ASSERT_TRUE(mgr->syncNow().completed());

    EXPECT_EQ(replica->get({"s1", DataType::SessionRecord})->payload, "theirs");
    EXPECT_EQ(queue->size(), 0u);
}

TEST_F(SyncManagerTest, ManualConflictWaitsForUserDecision) {
    const auto local = memory("r1", {{"content", "mine"}}, 2000);
    const auto server = transport->putRemote(memory("r1", {{"content", "theirs"}}, 3000));
    transport->conflictFor["r1"] = server;

    auto mgr = makeManager(ConflictResolver({DataType::MemoryRecord}));
    ASSERT_TRUE(mgr->submitLocal(local));

    const auto report = mgr->syncNow();
    ASSERT_TRUE(report.completed()) << report.error;
    EXPECT_EQ(report.manual, 1u);
    EXPECT_EQ(conflicts->size(), 1u);
    EXPECT_EQ(queue->size(), 0u);
    EXPECT_EQ(mgr->status().unresolved_conflicts, 1u);

    const ItemKey key{"r1", DataType::MemoryRecord};
    EXPECT_THROW(mgr->resolveManually(key, Resolution::Manual), std::invalid_argument);
    EXPECT_FALSE(mgr->resolveManually({"nope", DataType::MemoryRecord}, Resolution::UseLocal));

    ASSERT_TRUE(mgr->resolveManually(key, Resolution::UseLocal));
    EXPECT_EQ(conflicts->size(), 0u);

    const auto queued = queue->find(key);
    ASSERT_TRUE(queued);
    EXPECT_EQ(queued->item.payload, local.payload);
    EXPECT_GT(queued->item.timestamp, server.timestamp);
    EXPECT_TRUE(queued->item.checksumMatches());

    transport->conflictFor.clear();
    ASSERT_TRUE(mgr->syncNow().completed());
    EXPECT_EQ(json::parse(transport->remote(key)->payload)["content"], "mine");
}

TEST_F(SyncManagerTest, ConflictStoreSurvivesRestart) {
    const auto server = transport->putRemote(memory("r1", {{"content", "theirs"}}, 3000));
    transport->conflictFor["r1"] = server;
    {
        auto mgr = makeManager(ConflictResolver({DataType::MemoryRecord}));
        ASSERT_TRUE(mgr->submitLocal(memory("r1", {{"content", "mine"}}, 2000)));
        ASSERT_TRUE(mgr->syncNow().completed());
    }

    ConflictStore reloaded(dir / "conflicts.json");
    reloaded.load();
    const auto c = reloaded.find({"r1", DataType::MemoryRecord});
    ASSERT_TRUE(c);
    EXPECT_EQ(json::parse(c->local_version.payload)["content"], "mine");
    EXPECT_EQ(c->server_version, server);
}

TEST_F(SyncManagerTest, RemoteItemForCleanRecordIsApplied) {
    auto mgr = makeManager();
    const SyncItem pushed{"k1", DataType::KnowledgeChunk, Operation::Create, "chunk", 10};
    mgr->applyRemote(pushed);
    EXPECT_EQ(*replica->get(pushed.key()), pushed);

    mgr->applyRemote({"k1", DataType::KnowledgeChunk, Operation::Delete, "", 20});
    EXPECT_FALSE(replica->get(pushed.key()));
}

TEST_F(SyncManagerTest, ItemsStayQueuedWhenRealtimeIsNotConnected) {
    cfg.realtime_enabled = true;
    auto mgr = makeManager();
    auto link = std::make_shared<test::FakeLink>();
    auto channel = std::make_shared<realtime::Channel>(link, config::RealtimeConfig{});
    mgr->attachRealtime(channel);

    ASSERT_TRUE(mgr->submitLocal(memory("a", {{"content", "x"}}, 5000)));
    EXPECT_EQ(queue->size(), 1u);
    EXPECT_FALSE(mgr->status().realtime_usable);

    ASSERT_TRUE(mgr->syncNow().completed());
    EXPECT_EQ(queue->size(), 0u);
}
