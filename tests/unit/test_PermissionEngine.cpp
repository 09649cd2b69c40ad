#include <gtest/gtest.h>
#include "contribution/PermissionEngine.hpp"

using namespace tandem;
using namespace tandem::contribution;

class PermissionEngineTest : public ::testing::Test {
protected:
    config::ContributionConfig cfg;
    std::unique_ptr<PermissionEngine> engine;
    Settings settings;
    resource::Snapshot snap;
    LocalTime now{2, 14 * 60, 0};

    void SetUp() override {
        cfg.max_session_seconds = 1800;
        cfg.no_headroom_cooldown_seconds = 30;
        cfg.activity_grace_seconds = 60;
        engine = std::make_unique<PermissionEngine>(cfg);

        settings = Settings::Builder()
            .acknowledgeAndEnable(1)
            .allowCategory("inference")
            .allowCategory("embedding")
            .idleBeforeContributionSeconds(120)
            .maxCpuPercent(30)
            .maxRamMb(1024)
            .build();

        snap.cpu_usage_percent = 5;
        snap.ram_total_mb = 16000;
        snap.ram_used_mb = 4000;
        snap.idle_seconds = 600;
        snap.is_idle = true;
        snap.on_battery = false;
    }

    Decision evaluate(const std::optional<std::string>& category = std::nullopt,
                      const std::optional<resource::Forecast>& forecast = std::nullopt) const {
        return engine->evaluate(settings, snap, now, category, forecast);
    }

    Denied denied(const Decision& d) const {
        EXPECT_FALSE(isGranted(d));
        return std::holds_alternative<Denied>(d) ? std::get<Denied>(d) : Denied{};
    }
};

TEST_F(PermissionEngineTest, GrantsWhenEverythingPasses) {
    const auto d = evaluate();
    ASSERT_TRUE(isGranted(d));
    const auto& g = std::get<Granted>(d);
    EXPECT_DOUBLE_EQ(g.max_cpu_percent, 30.0);
    EXPECT_EQ(g.max_ram_mb, 1024u);
    EXPECT_EQ(g.max_duration_seconds, 1800u);
    EXPECT_EQ(g.allowed_categories.size(), 2u);
}

TEST_F(PermissionEngineTest, DisabledOrPaused) {
    settings = settings.toBuilder().disable().build();
    EXPECT_EQ(denied(evaluate()).reason, DenialReason::Disabled);

    settings = settings.toBuilder().acknowledgeAndEnable(1).paused(true).build();
    EXPECT_EQ(denied(evaluate()).reason, DenialReason::Disabled);
}

TEST_F(PermissionEngineTest, UserActivityWins) {
    snap.is_idle = false;
    const auto d = denied(evaluate());
    EXPECT_EQ(d.reason, DenialReason::UserActivity);
    EXPECT_EQ(d.retry_after_seconds.value_or(0), 60u);
    EXPECT_EQ(d.message(), "device active");
}

TEST_F(PermissionEngineTest, InsufficientIdleTimeReportsDeficit) {
    settings = settings.toBuilder().idleBeforeContributionSeconds(300).build();
    snap.idle_seconds = 120;

    const auto d = denied(evaluate());
    EXPECT_EQ(d.reason, DenialReason::InsufficientIdleTime);
    EXPECT_DOUBLE_EQ(d.current.value_or(0), 120.0);
    EXPECT_DOUBLE_EQ(d.required.value_or(0), 300.0);
    EXPECT_EQ(d.retry_after_seconds.value_or(0), 180u);
}

TEST_F(PermissionEngineTest, BatteryChecks) {
    snap.on_battery = true;
    snap.battery_percent = 15;
    EXPECT_EQ(denied(evaluate()).reason, DenialReason::OnBattery);

    settings = settings.toBuilder().requireExternalPower(false).build();
    const auto d = denied(evaluate());
    EXPECT_EQ(d.reason, DenialReason::BatteryLow);
    EXPECT_EQ(d.message(), "battery below threshold (15% < 20%)");

    snap.battery_percent = 50;
    EXPECT_TRUE(isGranted(evaluate()));
}

TEST_F(PermissionEngineTest, OutsideScheduleSaysWhenToRetry) {
    Schedule nights;
    nights.windows = {TimeWindow::parse("22:00-06:00")};
    settings = settings.toBuilder().schedule(nights).build();

    const auto d = denied(evaluate());
    EXPECT_EQ(d.reason, DenialReason::OutsideSchedule);
    EXPECT_EQ(d.retry_after_seconds.value_or(0), 8u * 3600u);

    now = {2, 23 * 60, 0};
    EXPECT_TRUE(isGranted(evaluate()));
}

TEST_F(PermissionEngineTest, ChecksRunInOrder) {
    snap.is_idle = false;
    snap.on_battery = true;
    settings = settings.toBuilder().paused(true).build();
    EXPECT_EQ(denied(evaluate()).reason, DenialReason::Disabled);

    settings = settings.toBuilder().paused(false).build();
    EXPECT_EQ(denied(evaluate()).reason, DenialReason::UserActivity);
}

TEST_F(PermissionEngineTest, HeadroomCapsTheGrant) {
    snap.cpu_usage_percent = 85;
    snap.ram_used_mb = 15500;
    const auto d = evaluate();
    ASSERT_TRUE(isGranted(d));
    EXPECT_DOUBLE_EQ(std::get<Granted>(d).max_cpu_percent, 15.0);
    EXPECT_EQ(std::get<Granted>(d).max_ram_mb, 500u);
}

TEST_F(PermissionEngineTest, NoHeadroomDeniesWithCooldown) {
    snap.cpu_usage_percent = 100;
    const auto d = denied(evaluate());
    EXPECT_EQ(d.reason, DenialReason::NoHeadroom);
    EXPECT_EQ(d.retry_after_seconds.value_or(0), 30u);
}

TEST_F(PermissionEngineTest, ForecastOnlyTightens) {
    resource::Forecast tight{10.0, 256, 2.0, 12};
    auto d = evaluate(std::nullopt, tight);
    ASSERT_TRUE(isGranted(d));
    EXPECT_DOUBLE_EQ(std::get<Granted>(d).max_cpu_percent, 10.0);
    EXPECT_EQ(std::get<Granted>(d).max_ram_mb, 256u);

    resource::Forecast empty{0.0, 0, 5.0, 12};
    d = evaluate(std::nullopt, empty);
    ASSERT_TRUE(isGranted(d));
    EXPECT_DOUBLE_EQ(std::get<Granted>(d).max_cpu_percent, 30.0);
}

TEST_F(PermissionEngineTest, CategoryNarrowing) {
    const auto d = evaluate(std::string("inference"));
    ASSERT_TRUE(isGranted(d));
    EXPECT_EQ(std::get<Granted>(d).allowed_categories, std::set<std::string>{"inference"});

    EXPECT_EQ(denied(evaluate(std::string("mining"))).reason, DenialReason::CategoryNotAllowed);

    settings = settings.toBuilder().allowedCategories({}).build();
    EXPECT_EQ(denied(evaluate()).reason, DenialReason::CategoryNotAllowed);
}

TEST_F(PermissionEngineTest, SessionLengthIsCappedByConfig) {
    settings = settings.toBuilder().maxSessionSeconds(7200).build();
    EXPECT_EQ(std::get<Granted>(evaluate()).max_duration_seconds, 1800u);

    settings = settings.toBuilder().maxSessionSeconds(600).build();
    EXPECT_EQ(std::get<Granted>(evaluate()).max_duration_seconds, 600u);
}

TEST_F(PermissionEngineTest, StaleSnapshotIsTreatedAsActive) {
    snap.stale = true;
    snap.is_idle = false;
    snap.idle_seconds = 0;
    EXPECT_EQ(denied(evaluate()).reason, DenialReason::UserActivity);
}
