#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tandem::contribution {

struct LocalTime {
    unsigned int weekday{};        // 0 = Sunday
    unsigned int minute_of_day{};  // 0..1439
    unsigned int second{};         // 0..59

    static LocalTime now();
};

// [start, end) in minutes since local midnight. end <= start wraps past midnight;
// start == end covers the whole day.
struct TimeWindow {
    unsigned int start_minute{};
    unsigned int end_minute{};

    [[nodiscard]] bool contains(unsigned int minuteOfDay) const;

    static TimeWindow parse(const std::string& text); // "HH:MM-HH:MM"
    [[nodiscard]] std::string str() const;

    friend bool operator==(const TimeWindow&, const TimeWindow&) = default;
};

class Schedule {
public:
    static constexpr uint8_t ALL_DAYS = 0x7F;

    uint8_t weekdays = ALL_DAYS;     // bit n = weekday n allowed
    std::vector<TimeWindow> windows; // empty = any time of day

    [[nodiscard]] bool allowsDay(unsigned int weekday) const { return (weekdays >> (weekday % 7)) & 1U; }

    [[nodiscard]] bool allows(const LocalTime& t) const;

    // Seconds until the next allowed minute; 0 if allowed now, nullopt if never.
    [[nodiscard]] std::optional<uint64_t> secondsUntilAllowed(const LocalTime& t) const;

    static uint8_t weekdayBit(const std::string& name);

    friend bool operator==(const Schedule&, const Schedule&) = default;
};

}
