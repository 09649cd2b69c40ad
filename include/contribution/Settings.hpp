#pragma once

#include "contribution/Schedule.hpp"

#include <cstdint>
#include <set>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace tandem::contribution {

// User-owned contribution preferences. Shared as shared_ptr<const Settings> and replaced
// whole; built only through Settings::Builder so every instance has passed validate().
struct Settings {
    static constexpr double MAX_CPU_CEILING = 80.0;
    static constexpr unsigned int MIN_IDLE_SECONDS = 30;

    bool enabled = false;
    bool terms_accepted = false;
    int64_t terms_accepted_at = 0;
    bool paused = false;

    double max_cpu_percent = 30.0;
    uint64_t max_ram_mb = 512;
    double max_bandwidth_mbps = 1.0;

    bool require_system_idle = true;
    bool stop_on_user_activity = true;
    unsigned int idle_before_contribution_seconds = 120;

    bool require_external_power = true;
    double min_battery_percent = 20.0;

    Schedule schedule{};
    std::set<std::string> allowed_categories{};

    unsigned int max_session_seconds = 1800;

    // Throws std::invalid_argument naming the first offending field.
    void validate() const;

    class Builder;

    [[nodiscard]] Builder toBuilder() const;
};

class Settings::Builder {
public:
    Builder() = default;
    explicit Builder(Settings base) : s_(std::move(base)) {}

    Builder& maxCpuPercent(const double v) { s_.max_cpu_percent = v; return *this; }
    Builder& maxRamMb(const uint64_t v) { s_.max_ram_mb = v; return *this; }
    Builder& maxBandwidthMbps(const double v) { s_.max_bandwidth_mbps = v; return *this; }
    Builder& requireSystemIdle(const bool v) { s_.require_system_idle = v; return *this; }
    Builder& stopOnUserActivity(const bool v) { s_.stop_on_user_activity = v; return *this; }
    Builder& idleBeforeContributionSeconds(const unsigned int v) { s_.idle_before_contribution_seconds = v; return *this; }
    Builder& requireExternalPower(const bool v) { s_.require_external_power = v; return *this; }
    Builder& minBatteryPercent(const double v) { s_.min_battery_percent = v; return *this; }
    Builder& schedule(Schedule v) { s_.schedule = std::move(v); return *this; }
    Builder& allowCategory(const std::string& c) { s_.allowed_categories.insert(c); return *this; }
    Builder& allowedCategories(std::set<std::string> v) { s_.allowed_categories = std::move(v); return *this; }
    Builder& maxSessionSeconds(const unsigned int v) { s_.max_session_seconds = v; return *this; }
    Builder& paused(const bool v) { s_.paused = v; return *this; }

    // The only way to turn the master switch on: records the user's acknowledgement.
    Builder& acknowledgeAndEnable(int64_t acknowledgedAt);

    Builder& disable() { s_.enabled = false; return *this; }

    [[nodiscard]] Settings build() const;

private:
    Settings s_;
};

void to_json(nlohmann::json& j, const Settings& s);

}
