#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace tandem::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config file '" + path.string() + "': " + e.what());
    }

    if (auto node = root["device"]) YAML::convert<DeviceConfig>::decode(node, cfg.device);
    if (auto node = root["remote"]) YAML::convert<RemoteConfig>::decode(node, cfg.remote);
    if (auto node = root["sync"]) YAML::convert<SyncConfig>::decode(node, cfg.sync);
    if (auto node = root["realtime"]) YAML::convert<RealtimeConfig>::decode(node, cfg.realtime);
    if (auto node = root["resources"]) YAML::convert<ResourcesConfig>::decode(node, cfg.resources);
    if (auto node = root["contribution"]) YAML::convert<ContributionConfig>::decode(node, cfg.contribution);
    if (auto node = root["conflicts"]) YAML::convert<ConflictsConfig>::decode(node, cfg.conflicts);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"device", c.device},
        {"remote", c.remote},
        {"sync", c.sync},
        {"realtime", c.realtime},
        {"resources", c.resources},
        {"contribution", c.contribution},
        {"conflicts", c.conflicts}
    };
}

void to_json(nlohmann::json& j, const DeviceConfig& c) {
    j = {
        {"id", c.id},
        {"credential_file", c.credential_file.string()}
    };
}

void to_json(nlohmann::json& j, const RemoteConfig& c) {
    j = {
        {"base_url", c.base_url},
        {"realtime_url", c.realtime_url},
        {"request_timeout_seconds", c.request_timeout_seconds}
    };
}

void to_json(nlohmann::json& j, const SyncConfig& c) {
    j = {
        {"interval_seconds", c.interval_seconds},
        {"batch_size", c.batch_size},
        {"page_limit", c.page_limit},
        {"max_attempts", c.max_attempts},
        {"offline_queue_max", c.offline_queue_max},
        {"realtime_enabled", c.realtime_enabled},
        {"state_dir", c.state_dir.string()},
        {"retry", c.retry}
    };
}

void to_json(nlohmann::json& j, const RealtimeConfig& c) {
    j = {
        {"heartbeat_interval_ms", c.heartbeat_interval.count()},
        {"missed_heartbeats", c.missed_heartbeats},
        {"ack_timeout_ms", c.ack_timeout.count()},
        {"poll_interval_ms", c.poll_interval.count()},
        {"reconnect", c.reconnect}
    };
}

void to_json(nlohmann::json& j, const ResourcesConfig& c) {
    j = {
        {"sample_interval_ms", c.sample_interval.count()},
        {"window_size", c.window_size},
        {"idle_threshold_seconds", c.idle_threshold_seconds},
        {"forecast_horizon_samples", c.forecast_horizon_samples},
        {"cpu_ceiling_percent", c.cpu_ceiling_percent}
    };
}

void to_json(nlohmann::json& j, const ContributionConfig& c) {
    j = {
        {"tick_interval_ms", c.tick_interval.count()},
        {"settings_file", c.settings_file.string()},
        {"max_session_seconds", c.max_session_seconds},
        {"no_headroom_cooldown_seconds", c.no_headroom_cooldown_seconds},
        {"activity_grace_seconds", c.activity_grace_seconds}
    };
}

void to_json(nlohmann::json& j, const ConflictsConfig& c) {
    j = {{"manual_types", c.manual_types}};
}

}

void tandem::util::to_json(nlohmann::json& j, const RetryPolicy& p) {
    j = {
        {"max_attempts", p.max_attempts},
        {"initial_delay_ms", p.initial_delay.count()},
        {"max_delay_ms", p.max_delay.count()},
        {"multiplier", p.multiplier},
        {"jitter", p.jitter}
    };
}
