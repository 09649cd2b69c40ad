#include "contribution/Settings.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace tandem::contribution {

void Settings::validate() const {
    if (max_cpu_percent < 0.0 || max_cpu_percent > MAX_CPU_CEILING)
        throw std::invalid_argument(fmt::format("max_cpu_percent must be within 0-{}, got {}", MAX_CPU_CEILING, max_cpu_percent));

    if (idle_before_contribution_seconds < MIN_IDLE_SECONDS)
        throw std::invalid_argument(fmt::format("idle_before_contribution_seconds must be at least {}, got {}",
                                                MIN_IDLE_SECONDS, idle_before_contribution_seconds));

    if (min_battery_percent < 0.0 || min_battery_percent > 100.0)
        throw std::invalid_argument(fmt::format("min_battery_percent must be within 0-100, got {}", min_battery_percent));

    if (max_bandwidth_mbps < 0.0)
        throw std::invalid_argument("max_bandwidth_mbps must not be negative");

    if (max_session_seconds == 0)
        throw std::invalid_argument("max_session_seconds must be positive");

    if (enabled && !terms_accepted)
        throw std::invalid_argument("Contribution cannot be enabled before the terms are acknowledged");
}

Settings::Builder Settings::toBuilder() const { return Builder(*this); }

Settings::Builder& Settings::Builder::acknowledgeAndEnable(const int64_t acknowledgedAt) {
    s_.terms_accepted = true;
    s_.terms_accepted_at = acknowledgedAt;
    s_.enabled = true;
    s_.paused = false;
    return *this;
}

Settings Settings::Builder::build() const {
    s_.validate();
    return s_;
}

void to_json(nlohmann::json& j, const Settings& s) {
    std::vector<std::string> windows;
    for (const auto& w : s.schedule.windows) windows.push_back(w.str());

    j = {
        {"enabled", s.enabled},
        {"terms_accepted", s.terms_accepted},
        {"terms_accepted_at", s.terms_accepted_at},
        {"paused", s.paused},
        {"max_cpu_percent", s.max_cpu_percent},
        {"max_ram_mb", s.max_ram_mb},
        {"max_bandwidth_mbps", s.max_bandwidth_mbps},
        {"require_system_idle", s.require_system_idle},
        {"stop_on_user_activity", s.stop_on_user_activity},
        {"idle_before_contribution_seconds", s.idle_before_contribution_seconds},
        {"require_external_power", s.require_external_power},
        {"min_battery_percent", s.min_battery_percent},
        {"weekdays", s.schedule.weekdays},
        {"windows", windows},
        {"allowed_categories", s.allowed_categories},
        {"max_session_seconds", s.max_session_seconds}
    };
}

}
