#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <nlohmann/json_fwd.hpp>

namespace tandem::contribution {

// Declared in checkpoint order.
enum class DenialReason {
    Disabled,
    TermsNotAccepted,
    UserActivity,
    InsufficientIdleTime,
    OnBattery,
    BatteryLow,
    OutsideSchedule,
    NoHeadroom,
    CategoryNotAllowed
};

std::string to_string(DenialReason r);

struct Granted {
    double max_cpu_percent{};
    uint64_t max_ram_mb{};
    double max_bandwidth_mbps{};
    uint64_t max_duration_seconds{};
    std::set<std::string> allowed_categories;
};

struct Denied {
    DenialReason reason{DenialReason::Disabled};
    std::optional<uint64_t> retry_after_seconds;
    std::optional<double> current;  // measured value that failed the check, when there is one
    std::optional<double> required; // threshold it was held against

    // Short, user-facing explanation, e.g. "battery below threshold (15% < 20%)".
    [[nodiscard]] std::string message() const;
};

using Decision = std::variant<Granted, Denied>;

inline bool isGranted(const Decision& d) { return std::holds_alternative<Granted>(d); }

void to_json(nlohmann::json& j, const Granted& g);
void to_json(nlohmann::json& j, const Denied& d);
void to_json(nlohmann::json& j, const Decision& d);

}
