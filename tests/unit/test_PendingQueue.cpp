#include <gtest/gtest.h>
#include "sync/PendingQueue.hpp"
#include "sync/Errors.hpp"
#include "Fakes.hpp"

#include <fstream>

namespace fs = std::filesystem;
using namespace tandem::sync;
using namespace tandem::sync::model;

class PendingQueueTest : public ::testing::Test {
protected:
    fs::path dir;
    fs::path journal;

    void SetUp() override {
        dir = tandem::test::makeTempDir("tandem_queue");
        journal = dir / "pending.jsonl";
    }

    void TearDown() override { fs::remove_all(dir); }

    static SyncItem memory(const std::string& id, const std::string& payload, const int64_t ts) {
        return {id, DataType::MemoryRecord, Operation::Update, payload, ts};
    }
};

TEST_F(PendingQueueTest, EnqueueAndBatchInOrder) {
    PendingQueue q(journal, 100, 3);
    ASSERT_TRUE(q.enqueue(memory("a", "1", 10)));
    ASSERT_TRUE(q.enqueue(memory("b", "2", 11)));
    ASSERT_TRUE(q.enqueue(memory("c", "3", 12)));

    const auto batch = q.nextBatch(2);
    ASSERT_EQ(batch.size(), 2u);
    EXPECT_EQ(batch[0].item.id, "a");
    EXPECT_EQ(batch[1].item.id, "b");
    EXPECT_EQ(q.size(), 3u);
}

TEST_F(PendingQueueTest, SameKeyCoalescesKeepingQueuedAt) {
    PendingQueue q(journal, 100, 3);
    ASSERT_TRUE(q.enqueue(memory("a", "first", 10)));
    const auto queuedAt = q.find({"a", DataType::MemoryRecord})->queued_at;
    q.markAttempt({"a", DataType::MemoryRecord}, "timeout");

    ASSERT_TRUE(q.enqueue(memory("a", "second", 20)));

    EXPECT_EQ(q.size(), 1u);
    const auto change = q.find({"a", DataType::MemoryRecord});
    ASSERT_TRUE(change);
    EXPECT_EQ(change->item.payload, "second");
    EXPECT_EQ(change->queued_at, queuedAt);
    EXPECT_EQ(change->attempt_count, 0u);
}

TEST_F(PendingQueueTest, SameIdDifferentTypeIsSeparate) {
    PendingQueue q(journal, 100, 3);
    ASSERT_TRUE(q.enqueue(memory("a", "1", 10)));
    ASSERT_TRUE(q.enqueue({"a", DataType::Setting, Operation::Create, "x", 11}));
    EXPECT_EQ(q.size(), 2u);
}

TEST_F(PendingQueueTest, FullQueueRefusesNewKeysButAcceptsCoalesce) {
    PendingQueue q(journal, 2, 3);
    ASSERT_TRUE(q.enqueue(memory("a", "1", 10)));
    ASSERT_TRUE(q.enqueue(memory("b", "2", 11)));
    EXPECT_FALSE(q.enqueue(memory("c", "3", 12)));
    EXPECT_TRUE(q.enqueue(memory("a", "1b", 13)));
    EXPECT_EQ(q.size(), 2u);
}

TEST_F(PendingQueueTest, AcknowledgeOnlyRemovesMatchingVersion) {
    PendingQueue q(journal, 100, 3);
    const auto v1 = memory("a", "v1", 10);
    ASSERT_TRUE(q.enqueue(v1));
    ASSERT_TRUE(q.enqueue(memory("a", "v2", 20)));

    EXPECT_FALSE(q.acknowledge(v1));
    EXPECT_EQ(q.size(), 1u);

    EXPECT_TRUE(q.acknowledge(memory("a", "v2", 20)));
    EXPECT_EQ(q.size(), 0u);
}

TEST_F(PendingQueueTest, AttemptCeilingMarksChangeFailed) {
    PendingQueue q(journal, 100, 3);
    const ItemKey key{"a", DataType::MemoryRecord};
    ASSERT_TRUE(q.enqueue(memory("a", "1", 10)));

    EXPECT_FALSE(q.markAttempt(key, "e1"));
    EXPECT_FALSE(q.markAttempt(key, "e2"));
    EXPECT_TRUE(q.markAttempt(key, "e3"));

    EXPECT_EQ(q.failedCount(), 1u);
    EXPECT_EQ(q.pendingCount(), 0u);
    EXPECT_TRUE(q.nextBatch(10).empty());
    EXPECT_EQ(q.failed().front().last_error, "e3");

    EXPECT_EQ(q.retryFailed(), 1u);
    EXPECT_EQ(q.nextBatch(10).size(), 1u);
}

TEST_F(PendingQueueTest, SurvivesRestart) {
    {
        PendingQueue q(journal, 100, 3);
        ASSERT_TRUE(q.enqueue(memory("a", R"({"text":"hello"})", 10)));
        ASSERT_TRUE(q.enqueue({"s", DataType::Setting, Operation::Delete, "", 11}));
        q.markAttempt({"a", DataType::MemoryRecord}, "timeout");
    }

    PendingQueue reloaded(journal, 100, 3);
    reloaded.load();
    ASSERT_EQ(reloaded.size(), 2u);
    const auto a = reloaded.find({"a", DataType::MemoryRecord});
    ASSERT_TRUE(a);
    EXPECT_EQ(a->item.payload, R"({"text":"hello"})");
    EXPECT_EQ(a->attempt_count, 1u);
    EXPECT_TRUE(a->item.checksumMatches());
    EXPECT_EQ(reloaded.find({"s", DataType::Setting})->item.operation, Operation::Delete);
}

TEST_F(PendingQueueTest, CorruptJournalIsDetectedAndBlocksWrites) {
    {
        PendingQueue q(journal, 100, 3);
        ASSERT_TRUE(q.enqueue(memory("a", "1", 10)));
    }
    {
        std::ofstream out(journal, std::ios::app);
        out << "{not json\n";
    }

    PendingQueue q(journal, 100, 3);
    EXPECT_THROW(q.load(), CorruptQueueError);
    EXPECT_TRUE(q.corrupt());
    EXPECT_FALSE(q.enqueue(memory("b", "2", 11)));

    q.clear();
    EXPECT_FALSE(q.corrupt());
    EXPECT_EQ(q.size(), 0u);
    EXPECT_TRUE(q.enqueue(memory("b", "2", 11)));

    bool setAside = false;
    for (const auto& entry : fs::directory_iterator(dir))
        if (entry.path().filename().string().find(".corrupt-") != std::string::npos) setAside = true;
    EXPECT_TRUE(setAside);
}

TEST_F(PendingQueueTest, DiscardRemovesRegardlessOfVersion) {
    PendingQueue q(journal, 100, 3);
    ASSERT_TRUE(q.enqueue(memory("a", "1", 10)));
    EXPECT_TRUE(q.discard({"a", DataType::MemoryRecord}));
    EXPECT_FALSE(q.discard({"a", DataType::MemoryRecord}));
    EXPECT_FALSE(q.isDirty({"a", DataType::MemoryRecord}));
}

TEST_F(PendingQueueTest, FailedJournalWriteLeavesQueueUnchanged) {
    PendingQueue q(journal, 100, 3);
    const auto a = memory("a", "1", 10);
    ASSERT_TRUE(q.enqueue(a));

    // A directory in place of the temp file makes every journal write fail.
    auto tmp = journal;
    tmp += ".tmp";
    fs::create_directories(tmp);

    EXPECT_FALSE(q.enqueue(memory("b", "2", 11)));
    EXPECT_FALSE(q.enqueue(memory("a", "changed", 12)));
    EXPECT_THROW(q.acknowledge(a), std::exception);
    EXPECT_THROW(q.markAttempt(a.key(), "timeout"), std::exception);

    ASSERT_EQ(q.size(), 1u);
    const auto kept = q.find(a.key());
    ASSERT_TRUE(kept);
    EXPECT_EQ(kept->item.payload, "1");
    EXPECT_EQ(kept->attempt_count, 0u);

    // Memory still matches what is on disk.
    PendingQueue reloaded(journal, 100, 3);
    reloaded.load();
    ASSERT_EQ(reloaded.size(), 1u);
    EXPECT_EQ(reloaded.find(a.key())->item.payload, "1");

    fs::remove_all(tmp);
    EXPECT_TRUE(q.enqueue(memory("b", "2", 11)));
    EXPECT_TRUE(q.acknowledge(a));
    EXPECT_EQ(q.size(), 1u);
}
