#include "contribution/Decision.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace tandem::contribution {

std::string to_string(const DenialReason r) {
    switch (r) {
        case DenialReason::Disabled: return "disabled";
        case DenialReason::TermsNotAccepted: return "terms_not_accepted";
        case DenialReason::UserActivity: return "user_activity";
        case DenialReason::InsufficientIdleTime: return "insufficient_idle_time";
        case DenialReason::OnBattery: return "on_battery";
        case DenialReason::BatteryLow: return "battery_low";
        case DenialReason::OutsideSchedule: return "outside_schedule";
        case DenialReason::NoHeadroom: return "no_headroom";
        case DenialReason::CategoryNotAllowed: return "category_not_allowed";
    }
    return "unknown";
}

std::string Denied::message() const {
    switch (reason) {
        case DenialReason::Disabled: return "contribution is switched off";
        case DenialReason::TermsNotAccepted: return "contribution terms have not been acknowledged";
        case DenialReason::UserActivity: return "device active";
        case DenialReason::InsufficientIdleTime:
            return fmt::format("device idle for {:.0f}s, needs {:.0f}s", current.value_or(0), required.value_or(0));
        case DenialReason::OnBattery: return "running on battery, external power required";
        case DenialReason::BatteryLow:
            return fmt::format("battery below threshold ({:.0f}% < {:.0f}%)", current.value_or(0), required.value_or(0));
        case DenialReason::OutsideSchedule: return "outside the allowed contribution hours";
        case DenialReason::NoHeadroom: return "no spare CPU or memory right now";
        case DenialReason::CategoryNotAllowed: return "task category not allowed";
    }
    return "denied";
}

void to_json(nlohmann::json& j, const Granted& g) {
    j = {
        {"max_cpu_percent", g.max_cpu_percent},
        {"max_ram_mb", g.max_ram_mb},
        {"max_bandwidth_mbps", g.max_bandwidth_mbps},
        {"max_duration_seconds", g.max_duration_seconds},
        {"allowed_categories", g.allowed_categories}
    };
}

void to_json(nlohmann::json& j, const Denied& d) {
    j = {{"reason", to_string(d.reason)}, {"message", d.message()}};
    j["retry_after_seconds"] = d.retry_after_seconds ? nlohmann::json(*d.retry_after_seconds) : nlohmann::json(nullptr);
    if (d.current) j["current"] = *d.current;
    if (d.required) j["required"] = *d.required;
}

void to_json(nlohmann::json& j, const Decision& d) {
    if (const auto* g = std::get_if<Granted>(&d)) j = {{"granted", *g}};
    else j = {{"denied", std::get<Denied>(d)}};
}

}
