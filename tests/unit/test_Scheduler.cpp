#include <gtest/gtest.h>
#include "contribution/Scheduler.hpp"
#include "Fakes.hpp"

namespace fs = std::filesystem;
using namespace tandem;
using namespace tandem::contribution;
using namespace std::chrono;

namespace {

template <typename Pred>
bool waitFor(Pred&& pred, const milliseconds timeout = seconds(3)) {
    const auto deadline = steady_clock::now() + timeout;
    while (steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(milliseconds(2));
    }
    return pred();
}

}

class SchedulerTest : public ::testing::Test {
protected:
    fs::path dir;
    std::shared_ptr<test::FakeProbe> probe = std::make_shared<test::FakeProbe>();
    std::shared_ptr<resource::Analyzer> analyzer;
    std::shared_ptr<SettingsStore> settings;
    std::shared_ptr<test::QueueWorkSource> source = std::make_shared<test::QueueWorkSource>();
    std::shared_ptr<test::RecordingReporter> reporter = std::make_shared<test::RecordingReporter>();
    config::ContributionConfig cfg;
    std::unique_ptr<Scheduler> scheduler;

    void SetUp() override {
        dir = test::makeTempDir("tandem_scheduler");

        config::ResourcesConfig rcfg;
        rcfg.idle_threshold_seconds = 120;
        analyzer = std::make_shared<resource::Analyzer>(probe, rcfg);
        setReading(5.0, 600);

        settings = std::make_shared<SettingsStore>(dir / "contribution.yaml");
        settings->acknowledgeAndEnable();
        settings->update(settings->get()->toBuilder().allowCategory("inference").build());

        cfg.tick_interval = milliseconds(10);
        scheduler = std::make_unique<Scheduler>(settings, analyzer, source, reporter, cfg,
                                                [] { return LocalTime{2, 14 * 60, 0}; });
    }

    void TearDown() override {
        scheduler.reset();
        fs::remove_all(dir);
    }

    void setReading(const double cpu, const uint64_t idleSeconds) const {
        resource::Reading r;
        r.cpu_percent = cpu;
        r.ram_total_mb = 16000;
        r.ram_used_mb = 4000;
        r.idle_seconds = idleSeconds;
        probe->set(r);
        analyzer->sample();
    }
};

TEST_F(SchedulerTest, AdmitsWorkWhenPermitted) {
    auto work = std::make_shared<test::BlockingWorkload>();
    source->push(work);

    scheduler->tick();
    const auto task = scheduler->current();
    ASSERT_TRUE(task);
    EXPECT_EQ(task->category(), "inference");
    EXPECT_EQ(task->state(), TaskState::Running);
    EXPECT_TRUE(waitFor([&] { return work->started.load(); }));
    ASSERT_TRUE(source->lastGrant);
    EXPECT_DOUBLE_EQ(source->lastGrant->max_cpu_percent, 30.0);
}

TEST_F(SchedulerTest, UserReturnAbortsTaskWithinOneTick) {
    auto work = std::make_shared<test::BlockingWorkload>();
    source->push(work);
    scheduler->tick();
    ASSERT_TRUE(scheduler->current());
    ASSERT_TRUE(waitFor([&] { return work->started.load(); }));

    setReading(45.0, 0);
    scheduler->tick();

    EXPECT_FALSE(scheduler->current());
    const auto report = scheduler->lastReport();
    ASSERT_TRUE(report);
    EXPECT_EQ(report->state, TaskState::Aborted);
    EXPECT_EQ(report->reason, "device active");
    ASSERT_TRUE(scheduler->lastDenial());
    EXPECT_EQ(scheduler->lastDenial()->reason, DenialReason::UserActivity);

    EXPECT_TRUE(waitFor([&] { return work->sawAbort.load(); }));
    ASSERT_EQ(reporter->all().size(), 1u);
    EXPECT_EQ(reporter->all()[0].task_id, report->task_id);
}

TEST_F(SchedulerTest, FinishedWorkloadCompletes) {
    auto work = std::make_shared<test::BlockingWorkload>();
    source->push(work);
    scheduler->tick();
    work->release = true;

    ASSERT_TRUE(waitFor([&] {
        scheduler->tick();
        return scheduler->lastReport().has_value();
    }));
    EXPECT_EQ(scheduler->lastReport()->state, TaskState::Completed);
    EXPECT_DOUBLE_EQ(scheduler->lastReport()->progress, 1.0);
}

TEST_F(SchedulerTest, CrashingWorkloadFails) {
    auto work = std::make_shared<test::BlockingWorkload>();
    work->throwOnRelease = true;
    source->push(work);
    scheduler->tick();
    work->release = true;

    ASSERT_TRUE(waitFor([&] {
        scheduler->tick();
        return scheduler->lastReport().has_value();
    }));
    EXPECT_EQ(scheduler->lastReport()->state, TaskState::Failed);
    EXPECT_EQ(scheduler->lastReport()->reason, "workload crashed");
}

TEST_F(SchedulerTest, PauseStopsRunningWork) {
    source->push(std::make_shared<test::BlockingWorkload>());
    scheduler->tick();
    ASSERT_TRUE(scheduler->current());

    settings->pause();
    scheduler->tick();
    EXPECT_FALSE(scheduler->current());
    EXPECT_EQ(scheduler->lastDenial()->reason, DenialReason::Disabled);

    settings->resume();
    source->push(std::make_shared<test::BlockingWorkload>());
    EXPECT_TRUE(waitFor([&] {
        scheduler->tick();
        return scheduler->current() != nullptr;
    }));
}

TEST_F(SchedulerTest, DeniedAdmissionDoesNotAskForWork) {
    setReading(5.0, 10);
    scheduler->tick();
    EXPECT_EQ(source->requests, 0);
    EXPECT_EQ(scheduler->lastDenial()->reason, DenialReason::UserActivity);
}

TEST_F(SchedulerTest, DisallowedCategoryIsNotStarted) {
    source->push(std::make_shared<test::BlockingWorkload>("mining"));
    scheduler->tick();
    EXPECT_FALSE(scheduler->current());
    EXPECT_EQ(scheduler->lastDenial()->reason, DenialReason::CategoryNotAllowed);
}

TEST_F(SchedulerTest, ReporterFailureDoesNotBreakScheduler) {
    reporter->fail = true;
    source->push(std::make_shared<test::BlockingWorkload>());
    scheduler->tick();
    scheduler->abortCurrent("operator request");
    ASSERT_TRUE(scheduler->lastReport());
    EXPECT_EQ(scheduler->lastReport()->reason, "operator request");

    EXPECT_EQ(reporter->all().size(), 1u);

    source->push(std::make_shared<test::BlockingWorkload>());
    EXPECT_TRUE(waitFor([&] {
        scheduler->tick();
        return scheduler->current() != nullptr;
    }));
}

TEST_F(SchedulerTest, SlowAbortBlocksNextAdmission) {
    auto stubborn = std::make_shared<test::BlockingWorkload>();
    stubborn->ignoreAbort = true;
    source->push(stubborn);
    scheduler->tick();
    ASSERT_TRUE(waitFor([&] { return stubborn->started.load(); }));

    setReading(45.0, 0);
    scheduler->tick();
    ASSERT_FALSE(scheduler->current());
    EXPECT_EQ(scheduler->drainingCount(), 1u);

    // Device goes idle again while the aborted workload is still unwinding.
    auto next = std::make_shared<test::BlockingWorkload>();
    source->push(next);
    setReading(5.0, 600);
    const auto requestsBefore = source->requests;
    for (int i = 0; i < 5; ++i) scheduler->tick();
    std::this_thread::sleep_for(milliseconds(20));

    EXPECT_FALSE(scheduler->current());
    EXPECT_FALSE(next->started.load());
    EXPECT_EQ(source->requests, requestsBefore);

    stubborn->release = true;
    EXPECT_TRUE(waitFor([&] {
        scheduler->tick();
        return scheduler->current() != nullptr;
    }));
    EXPECT_EQ(scheduler->drainingCount(), 0u);
    EXPECT_TRUE(waitFor([&] { return next->started.load(); }));
}

TEST_F(SchedulerTest, UsageIsReportedWithoutHoldingSchedulerLock) {
    class InspectingReporter final : public UsageReporter {
    public:
        explicit InspectingReporter(Scheduler*& s) : scheduler_(s) {}
        void report(const TaskReport&) override {
            // current() would deadlock if the scheduler still held its lock here.
            sawNoTask = scheduler_->current() == nullptr;
            ++calls;
        }
        std::atomic<int> calls{0};
        std::atomic<bool> sawNoTask{false};

    private:
        Scheduler*& scheduler_;
    };

    Scheduler* self = nullptr;
    auto inspecting = std::make_shared<InspectingReporter>(self);
    Scheduler local(settings, analyzer, source, inspecting, cfg, [] { return LocalTime{2, 14 * 60, 0}; });
    self = &local;

    source->push(std::make_shared<test::BlockingWorkload>());
    local.tick();
    ASSERT_TRUE(local.current());

    setReading(45.0, 0);
    local.tick();
    EXPECT_EQ(inspecting->calls.load(), 1);
    EXPECT_TRUE(inspecting->sawNoTask.load());
}

TEST_F(SchedulerTest, RunsAsService) {
    auto work = std::make_shared<test::BlockingWorkload>();
    source->push(work);
    scheduler->start();
    ASSERT_TRUE(waitFor([&] { return work->started.load(); }));

    setReading(50.0, 0);
    EXPECT_TRUE(waitFor([&] { return scheduler->lastReport().has_value(); }));
    scheduler->stop();
    EXPECT_EQ(scheduler->lastReport()->state, TaskState::Aborted);
}
