#pragma once

#include "contribution/Settings.hpp"

#include <yaml-cpp/yaml.h>

namespace YAML {

template <>
struct convert<tandem::contribution::Schedule> {
    static Node encode(const tandem::contribution::Schedule& rhs) {
        static constexpr const char* NAMES[] = {"sun", "mon", "tue", "wed", "thu", "fri", "sat"};
        Node days(NodeType::Sequence), windows(NodeType::Sequence);
        for (unsigned int d = 0; d < 7; ++d)
            if (rhs.allowsDay(d)) days.push_back(NAMES[d]);
        for (const auto& w : rhs.windows) windows.push_back(w.str());

        Node node;
        node["weekdays"] = days;
        node["windows"] = windows;
        return node;
    }

    static bool decode(const Node& node, tandem::contribution::Schedule& rhs) {
        if (node["weekdays"]) {
            rhs.weekdays = 0;
            for (const auto& d : node["weekdays"]) rhs.weekdays |= tandem::contribution::Schedule::weekdayBit(d.as<std::string>());
        }
        rhs.windows.clear();
        if (node["windows"])
            for (const auto& w : node["windows"]) rhs.windows.push_back(tandem::contribution::TimeWindow::parse(w.as<std::string>()));
        return true;
    }
};

template <>
struct convert<tandem::contribution::Settings> {
    static Node encode(const tandem::contribution::Settings& rhs) {
        Node node;
        node["enabled"] = rhs.enabled;
        node["terms_accepted"] = rhs.terms_accepted;
        node["terms_accepted_at"] = rhs.terms_accepted_at;
        node["paused"] = rhs.paused;
        node["max_cpu_percent"] = rhs.max_cpu_percent;
        node["max_ram_mb"] = rhs.max_ram_mb;
        node["max_bandwidth_mbps"] = rhs.max_bandwidth_mbps;
        node["require_system_idle"] = rhs.require_system_idle;
        node["stop_on_user_activity"] = rhs.stop_on_user_activity;
        node["idle_before_contribution_seconds"] = rhs.idle_before_contribution_seconds;
        node["require_external_power"] = rhs.require_external_power;
        node["min_battery_percent"] = rhs.min_battery_percent;
        node["schedule"] = rhs.schedule;
        Node categories(NodeType::Sequence);
        for (const auto& c : rhs.allowed_categories) categories.push_back(c);
        node["allowed_categories"] = categories;
        node["max_session_seconds"] = rhs.max_session_seconds;
        return node;
    }

    static bool decode(const Node& node, tandem::contribution::Settings& rhs) {
        if (!node.IsMap()) return false;

        rhs.terms_accepted = node["terms_accepted"].as<bool>(false);
        rhs.terms_accepted_at = node["terms_accepted_at"].as<int64_t>(0);
        // A hand-edited file cannot switch contribution on without the acknowledgement.
        rhs.enabled = rhs.terms_accepted && node["enabled"].as<bool>(false);
        rhs.paused = node["paused"].as<bool>(false);

        rhs.max_cpu_percent = node["max_cpu_percent"].as<double>(rhs.max_cpu_percent);
        rhs.max_ram_mb = node["max_ram_mb"].as<uint64_t>(rhs.max_ram_mb);
        rhs.max_bandwidth_mbps = node["max_bandwidth_mbps"].as<double>(rhs.max_bandwidth_mbps);
        rhs.require_system_idle = node["require_system_idle"].as<bool>(rhs.require_system_idle);
        rhs.stop_on_user_activity = node["stop_on_user_activity"].as<bool>(rhs.stop_on_user_activity);
        rhs.idle_before_contribution_seconds =
            node["idle_before_contribution_seconds"].as<unsigned int>(rhs.idle_before_contribution_seconds);
        rhs.require_external_power = node["require_external_power"].as<bool>(rhs.require_external_power);
        rhs.min_battery_percent = node["min_battery_percent"].as<double>(rhs.min_battery_percent);
        if (node["schedule"]) rhs.schedule = node["schedule"].as<tandem::contribution::Schedule>();
        if (node["allowed_categories"]) {
            rhs.allowed_categories.clear();
            for (const auto& c : node["allowed_categories"]) rhs.allowed_categories.insert(c.as<std::string>());
        }
        rhs.max_session_seconds = node["max_session_seconds"].as<unsigned int>(rhs.max_session_seconds);
        return true;
    }
};

}
