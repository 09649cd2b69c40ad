#include "contribution/PermissionEngine.hpp"

#include <algorithm>

using namespace tandem::contribution;

PermissionEngine::PermissionEngine(const config::ContributionConfig& cfg)
    : maxSessionSeconds_(cfg.max_session_seconds),
      noHeadroomCooldownSeconds_(cfg.no_headroom_cooldown_seconds),
      activityGraceSeconds_(cfg.activity_grace_seconds) {}

Decision PermissionEngine::evaluate(const Settings& settings,
                                    const resource::Snapshot& snapshot,
                                    const LocalTime& now,
                                    const std::optional<std::string>& category,
                                    const std::optional<resource::Forecast>& forecast) const {
    // 1. master switch (a paused store counts as off)
    if (!settings.enabled || settings.paused) return Denied{DenialReason::Disabled, std::nullopt, std::nullopt, std::nullopt};

    // 2. acknowledgement
    if (!settings.terms_accepted) return Denied{DenialReason::TermsNotAccepted, std::nullopt, std::nullopt, std::nullopt};

    // 3. user activity
    if (settings.stop_on_user_activity && !snapshot.is_idle)
        return Denied{DenialReason::UserActivity, activityGraceSeconds_, std::nullopt, std::nullopt};

    // 4. idle duration
    if (settings.require_system_idle && snapshot.idle_seconds < settings.idle_before_contribution_seconds) {
        return Denied{DenialReason::InsufficientIdleTime,
                      settings.idle_before_contribution_seconds - snapshot.idle_seconds,
                      static_cast<double>(snapshot.idle_seconds),
                      static_cast<double>(settings.idle_before_contribution_seconds)};
    }

    // 5. external power
    if (settings.require_external_power && snapshot.on_battery)
        return Denied{DenialReason::OnBattery, std::nullopt, std::nullopt, std::nullopt};

    // 6. battery floor
    if (snapshot.on_battery && snapshot.battery_percent && *snapshot.battery_percent < settings.min_battery_percent)
        return Denied{DenialReason::BatteryLow, std::nullopt, *snapshot.battery_percent, settings.min_battery_percent};

    // 7. time window / weekday
    if (!settings.schedule.allows(now))
        return Denied{DenialReason::OutsideSchedule, settings.schedule.secondsUntilAllowed(now), std::nullopt, std::nullopt};

    // 8. headroom
    double cpu = std::min(settings.max_cpu_percent, std::max(0.0, 100.0 - snapshot.cpu_usage_percent));
    uint64_t ram = std::min(settings.max_ram_mb, snapshot.ramAvailableMb());
    if (forecast) {
        if (forecast->available_cpu_percent > 0.0) cpu = std::min(cpu, forecast->available_cpu_percent);
        if (forecast->available_ram_mb > 0) ram = std::min(ram, forecast->available_ram_mb);
    }
    if (cpu <= 0.0 || ram == 0)
        return Denied{DenialReason::NoHeadroom, noHeadroomCooldownSeconds_, std::nullopt, std::nullopt};

    // categories
    std::set<std::string> categories;
    if (category) {
        if (settings.allowed_categories.contains(*category)) categories.insert(*category);
    } else {
        categories = settings.allowed_categories;
    }
    if (categories.empty())
        return Denied{DenialReason::CategoryNotAllowed, std::nullopt, std::nullopt, std::nullopt};

    return Granted{cpu,
                   ram,
                   settings.max_bandwidth_mbps,
                   std::min<uint64_t>(settings.max_session_seconds, maxSessionSeconds_),
                   std::move(categories)};
}
