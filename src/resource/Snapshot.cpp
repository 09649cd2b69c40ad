#include "resource/Snapshot.hpp"

#include <nlohmann/json.hpp>

namespace tandem::resource {

std::string to_string(const IdleDepth d) {
    switch (d) {
        case IdleDepth::Active: return "active";
        case IdleDepth::Light: return "light";
        case IdleDepth::Medium: return "medium";
        case IdleDepth::Deep: return "deep";
        case IdleDepth::SleepReady: return "sleep_ready";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, const Snapshot& s) {
    j = {
        {"cpu_usage_percent", s.cpu_usage_percent},
        {"trailing_cpu_percent", s.trailing_cpu_percent},
        {"ram_usage_percent", s.ram_usage_percent},
        {"on_battery", s.on_battery},
        {"idle_seconds", s.idle_seconds},
        {"is_idle", s.is_idle},
        {"idle_depth", to_string(s.idle_depth)},
        {"stale", s.stale}
    };
    j["battery_percent"] = s.battery_percent ? nlohmann::json(*s.battery_percent) : nlohmann::json(nullptr);
    if (s.gpu_usage_percent) j["gpu_usage_percent"] = *s.gpu_usage_percent;
}

void to_json(nlohmann::json& j, const Forecast& f) {
    j = {
        {"available_cpu_percent", f.available_cpu_percent},
        {"available_ram_mb", f.available_ram_mb},
        {"cpu_trend_per_sample", f.cpu_trend_per_sample},
        {"horizon_samples", f.horizon_samples}
    };
}

}
