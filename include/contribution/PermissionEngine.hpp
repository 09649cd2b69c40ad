#pragma once

#include "config/Config.hpp"
#include "contribution/Decision.hpp"
#include "contribution/Schedule.hpp"
#include "contribution/Settings.hpp"
#include "resource/Snapshot.hpp"

#include <optional>
#include <string>

namespace tandem::contribution {

// Stateless admission check. Every call derives its answer from the arguments alone;
// nothing is cached between calls.
class PermissionEngine {
public:
    explicit PermissionEngine(const config::ContributionConfig& cfg);

    // `category` narrows the grant to one task kind; without it the grant carries every
    // allowed category. A forecast may tighten the ceiling but never causes a denial.
    [[nodiscard]] Decision evaluate(const Settings& settings,
                                    const resource::Snapshot& snapshot,
                                    const LocalTime& now,
                                    const std::optional<std::string>& category = std::nullopt,
                                    const std::optional<resource::Forecast>& forecast = std::nullopt) const;

private:
    unsigned int maxSessionSeconds_;
    unsigned int noHeadroomCooldownSeconds_;
    unsigned int activityGraceSeconds_;
};

}
