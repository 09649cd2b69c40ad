#include "contribution/Schedule.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <fmt/format.h>
#include <stdexcept>

namespace tandem::contribution {

LocalTime LocalTime::now() {
    const std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    return {static_cast<unsigned int>(tm.tm_wday),
            static_cast<unsigned int>(tm.tm_hour * 60 + tm.tm_min),
            static_cast<unsigned int>(std::min(tm.tm_sec, 59))};
}

bool TimeWindow::contains(const unsigned int minuteOfDay) const {
    if (start_minute == end_minute) return true;
    if (start_minute < end_minute) return minuteOfDay >= start_minute && minuteOfDay < end_minute;
    return minuteOfDay >= start_minute || minuteOfDay < end_minute;
}

TimeWindow TimeWindow::parse(const std::string& text) {
    unsigned int h1, m1, h2, m2;
    char sep1, dash, sep2;
    const auto bad = [&] { return std::invalid_argument("Invalid time window '" + text + "', expected HH:MM-HH:MM"); };

    if (std::sscanf(text.c_str(), "%u%c%u%c%u%c%u", &h1, &sep1, &m1, &dash, &h2, &sep2, &m2) != 7) throw bad();
    if (sep1 != ':' || dash != '-' || sep2 != ':') throw bad();
    if (h1 > 24 || h2 > 24 || m1 > 59 || m2 > 59) throw bad();

    const auto start = h1 * 60 + m1, end = h2 * 60 + m2;
    if (start > 1440 || end > 1440) throw bad();
    return {start % 1440, end % 1440};
}

std::string TimeWindow::str() const {
    return fmt::format("{:02}:{:02}-{:02}:{:02}", start_minute / 60, start_minute % 60, end_minute / 60, end_minute % 60);
}

bool Schedule::allows(const LocalTime& t) const {
    if (windows.empty()) return allowsDay(t.weekday);
    return std::any_of(windows.begin(), windows.end(), [&](const TimeWindow& w) {
        if (!w.contains(t.minute_of_day)) return false;
        // The part of a wrapping window after midnight belongs to the day it started on.
        const bool afterMidnight = w.end_minute < w.start_minute && t.minute_of_day < w.end_minute;
        return allowsDay(afterMidnight ? (t.weekday + 6) % 7 : t.weekday);
    });
}

std::optional<uint64_t> Schedule::secondsUntilAllowed(const LocalTime& t) const {
    if (allows(t)) return 0;
    if ((weekdays & ALL_DAYS) == 0) return std::nullopt;

    // A week plus a day covers every window of every allowed weekday.
    for (unsigned int step = 1; step <= 8 * 1440; ++step) {
        const auto absolute = t.minute_of_day + step;
        const LocalTime probe{(t.weekday + absolute / 1440) % 7, absolute % 1440, 0};
        if (allows(probe)) return static_cast<uint64_t>(step) * 60 - t.second;
    }
    return std::nullopt;
}

uint8_t Schedule::weekdayBit(const std::string& name) {
    static constexpr const char* NAMES[] = {"sun", "mon", "tue", "wed", "thu", "fri", "sat"};
    std::string lower;
    for (const char c : name.substr(0, 3)) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    for (uint8_t i = 0; i < 7; ++i)
        if (lower == NAMES[i]) return static_cast<uint8_t>(1U << i);
    throw std::invalid_argument("Unknown weekday: " + name);
}

}
