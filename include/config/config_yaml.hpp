#pragma once

#include "config/Config.hpp"
#include <algorithm>
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace tandem::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

static std::chrono::milliseconds msOr(const Node& node, const std::string& msKey, const std::string& secKey,
                                      const std::chrono::milliseconds def) {
    if (node[msKey]) return std::chrono::milliseconds(node[msKey].as<long long>());
    if (node[secKey]) return std::chrono::milliseconds(node[secKey].as<long long>() * 1000);
    return def;
}

template<>
struct convert<tandem::util::RetryPolicy> {
    static Node encode(const tandem::util::RetryPolicy& rhs) {
        Node node;
        node["max_attempts"] = rhs.max_attempts;
        node["initial_delay_ms"] = rhs.initial_delay.count();
        node["max_delay_ms"] = rhs.max_delay.count();
        node["multiplier"] = rhs.multiplier;
        node["jitter"] = rhs.jitter;
        return node;
    }

    static bool decode(const Node& node, tandem::util::RetryPolicy& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_attempts = node["max_attempts"].as<unsigned int>(rhs.max_attempts);
        rhs.initial_delay = std::chrono::milliseconds(node["initial_delay_ms"].as<long long>(rhs.initial_delay.count()));
        rhs.max_delay = std::chrono::milliseconds(node["max_delay_ms"].as<long long>(rhs.max_delay.count()));
        rhs.multiplier = node["multiplier"].as<double>(rhs.multiplier);
        rhs.jitter = node["jitter"].as<double>(rhs.jitter);
        if (rhs.max_attempts == 0) rhs.max_attempts = 1;
        return true;
    }
};

template<>
struct convert<DeviceConfig> {
    static Node encode(const DeviceConfig& rhs) {
        Node node;
        node["id"] = rhs.id;
        node["credential_file"] = rhs.credential_file.string();
        return node;
    }

    static bool decode(const Node& node, DeviceConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.id = node["id"].as<std::string>(rhs.id);
        rhs.credential_file = node["credential_file"].as<std::string>(rhs.credential_file.string());
        return true;
    }
};

template<>
struct convert<RemoteConfig> {
    static Node encode(const RemoteConfig& rhs) {
        Node node;
        node["base_url"] = rhs.base_url;
        node["realtime_url"] = rhs.realtime_url;
        node["request_timeout_seconds"] = rhs.request_timeout_seconds;
        return node;
    }

    static bool decode(const Node& node, RemoteConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.base_url = node["base_url"].as<std::string>(rhs.base_url);
        rhs.realtime_url = node["realtime_url"].as<std::string>(rhs.realtime_url);
        rhs.request_timeout_seconds = node["request_timeout_seconds"].as<unsigned int>(rhs.request_timeout_seconds);
        return true;
    }
};

template<>
struct convert<SyncConfig> {
    static Node encode(const SyncConfig& rhs) {
        Node node;
        node["interval_seconds"] = rhs.interval_seconds;
        node["batch_size"] = rhs.batch_size;
        node["page_limit"] = rhs.page_limit;
        node["max_attempts"] = rhs.max_attempts;
        node["offline_queue_max"] = rhs.offline_queue_max;
        node["realtime_enabled"] = rhs.realtime_enabled;
        node["state_dir"] = rhs.state_dir.string();
        node["retry"] = rhs.retry;
        return node;
    }

    static bool decode(const Node& node, SyncConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.interval_seconds = node["interval_seconds"].as<unsigned int>(rhs.interval_seconds);
        rhs.batch_size = std::max(1u, node["batch_size"].as<unsigned int>(rhs.batch_size));
        rhs.page_limit = std::max(1u, node["page_limit"].as<unsigned int>(rhs.page_limit));
        rhs.max_attempts = std::max(1u, node["max_attempts"].as<unsigned int>(rhs.max_attempts));
        rhs.offline_queue_max = node["offline_queue_max"].as<unsigned int>(rhs.offline_queue_max);
        rhs.realtime_enabled = node["realtime_enabled"].as<bool>(rhs.realtime_enabled);
        rhs.state_dir = node["state_dir"].as<std::string>(rhs.state_dir.string());
        if (node["retry"]) convert<tandem::util::RetryPolicy>::decode(node["retry"], rhs.retry);
        return true;
    }
};

template<>
struct convert<RealtimeConfig> {
    static Node encode(const RealtimeConfig& rhs) {
        Node node;
        node["heartbeat_interval_ms"] = rhs.heartbeat_interval.count();
        node["missed_heartbeats"] = rhs.missed_heartbeats;
        node["ack_timeout_ms"] = rhs.ack_timeout.count();
        node["poll_interval_ms"] = rhs.poll_interval.count();
        node["reconnect"] = rhs.reconnect;
        return node;
    }

    static bool decode(const Node& node, RealtimeConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.heartbeat_interval = msOr(node, "heartbeat_interval_ms", "heartbeat_interval_seconds", rhs.heartbeat_interval);
        rhs.missed_heartbeats = std::max(1u, node["missed_heartbeats"].as<unsigned int>(rhs.missed_heartbeats));
        rhs.ack_timeout = msOr(node, "ack_timeout_ms", "ack_timeout_seconds", rhs.ack_timeout);
        rhs.poll_interval = msOr(node, "poll_interval_ms", "poll_interval_seconds", rhs.poll_interval);
        if (node["reconnect"]) convert<tandem::util::RetryPolicy>::decode(node["reconnect"], rhs.reconnect);
        return true;
    }
};

template<>
struct convert<ResourcesConfig> {
    static Node encode(const ResourcesConfig& rhs) {
        Node node;
        node["sample_interval_ms"] = rhs.sample_interval.count();
        node["window_size"] = rhs.window_size;
        node["idle_threshold_seconds"] = rhs.idle_threshold_seconds;
        node["forecast_horizon_samples"] = rhs.forecast_horizon_samples;
        node["cpu_ceiling_percent"] = rhs.cpu_ceiling_percent;
        return node;
    }

    static bool decode(const Node& node, ResourcesConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.sample_interval = msOr(node, "sample_interval_ms", "sample_interval_seconds", rhs.sample_interval);
        rhs.window_size = std::max(1u, node["window_size"].as<unsigned int>(rhs.window_size));
        rhs.idle_threshold_seconds = node["idle_threshold_seconds"].as<unsigned int>(rhs.idle_threshold_seconds);
        rhs.forecast_horizon_samples = node["forecast_horizon_samples"].as<unsigned int>(rhs.forecast_horizon_samples);
        rhs.cpu_ceiling_percent = node["cpu_ceiling_percent"].as<double>(rhs.cpu_ceiling_percent);
        return true;
    }
};

template<>
struct convert<ContributionConfig> {
    static Node encode(const ContributionConfig& rhs) {
        Node node;
        node["tick_interval_ms"] = rhs.tick_interval.count();
        node["settings_file"] = rhs.settings_file.string();
        node["max_session_seconds"] = rhs.max_session_seconds;
        node["no_headroom_cooldown_seconds"] = rhs.no_headroom_cooldown_seconds;
        node["activity_grace_seconds"] = rhs.activity_grace_seconds;
        return node;
    }

    static bool decode(const Node& node, ContributionConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.tick_interval = msOr(node, "tick_interval_ms", "tick_interval_seconds", rhs.tick_interval);
        rhs.settings_file = node["settings_file"].as<std::string>(rhs.settings_file.string());
        rhs.max_session_seconds = std::min(1800u, node["max_session_seconds"].as<unsigned int>(rhs.max_session_seconds));
        rhs.no_headroom_cooldown_seconds = node["no_headroom_cooldown_seconds"].as<unsigned int>(rhs.no_headroom_cooldown_seconds);
        rhs.activity_grace_seconds = node["activity_grace_seconds"].as<unsigned int>(rhs.activity_grace_seconds);
        return true;
    }
};

template<>
struct convert<ConflictsConfig> {
    static Node encode(const ConflictsConfig& rhs) {
        Node node;
        node["manual_types"] = rhs.manual_types;
        return node;
    }

    static bool decode(const Node& node, ConflictsConfig& rhs) {
        if (!node.IsMap()) return false;
        if (node["manual_types"]) rhs.manual_types = node["manual_types"].as<std::vector<std::string>>();
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["tandem"]       = to_std_string(spdlog::level::to_string_view(rhs.tandem));
        node["sync"]         = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["realtime"]     = to_std_string(spdlog::level::to_string_view(rhs.realtime));
        node["resource"]     = to_std_string(spdlog::level::to_string_view(rhs.resource));
        node["contribution"] = to_std_string(spdlog::level::to_string_view(rhs.contribution));
        node["config"]       = to_std_string(spdlog::level::to_string_view(rhs.config));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.tandem = spdlog::level::from_str(node["tandem"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.realtime = spdlog::level::from_str(node["realtime"].as<std::string>("warn"));
        rhs.resource = spdlog::level::from_str(node["resource"].as<std::string>("warn"));
        rhs.contribution = spdlog::level::from_str(node["contribution"].as<std::string>("info"));
        rhs.config = spdlog::level::from_str(node["config"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("info"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>(rhs.log_dir.string());
        if (node["levels"]) rhs.levels = node["levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
