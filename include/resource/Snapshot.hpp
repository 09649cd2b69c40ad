#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace tandem::resource {

// Ordered: a larger value means a quieter device.
enum class IdleDepth { Active = 0, Light, Medium, Deep, SleepReady };

std::string to_string(IdleDepth d);

// One point-in-time measurement. Never mutated after the analyzer publishes it.
struct Snapshot {
    double cpu_usage_percent{};
    double trailing_cpu_percent{};
    double ram_usage_percent{};
    uint64_t ram_total_mb{};
    uint64_t ram_used_mb{};
    std::optional<double> gpu_usage_percent;
    std::optional<double> battery_percent;
    bool on_battery{};
    uint64_t idle_seconds{};
    bool is_idle{};
    IdleDepth idle_depth{IdleDepth::Active};
    bool stale{};
    int64_t taken_at{};

    [[nodiscard]] uint64_t ramAvailableMb() const { return ram_total_mb > ram_used_mb ? ram_total_mb - ram_used_mb : 0; }
};

using SnapshotPtr = std::shared_ptr<const Snapshot>;

// Advisory only. Never used as a hard admission gate.
struct Forecast {
    double available_cpu_percent{};
    uint64_t available_ram_mb{};
    double cpu_trend_per_sample{};
    unsigned int horizon_samples{};
};

void to_json(nlohmann::json& j, const Snapshot& s);
void to_json(nlohmann::json& j, const Forecast& f);

}
