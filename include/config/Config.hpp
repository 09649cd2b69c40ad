#pragma once

#include "util/RetryPolicy.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace tandem::config {

struct DeviceConfig {
    std::string id = "unregistered-device";
    std::filesystem::path credential_file = "/etc/tandem/credential";
};

struct RemoteConfig {
    std::string base_url = "https://sync.example.invalid/api/v1";
    std::string realtime_url = "wss://sync.example.invalid/api/v1/realtime";
    unsigned int request_timeout_seconds = 30;
};

struct SyncConfig {
    unsigned int interval_seconds = 900; // 15 minutes
    unsigned int batch_size = 50;
    unsigned int page_limit = 200;
    unsigned int max_attempts = 5;
    unsigned int offline_queue_max = 1000;
    bool realtime_enabled = false;
    std::filesystem::path state_dir = "/var/lib/tandem";
    util::RetryPolicy retry{};
};

struct RealtimeConfig {
    std::chrono::milliseconds heartbeat_interval{std::chrono::seconds(30)};
    unsigned int missed_heartbeats = 2;
    std::chrono::milliseconds ack_timeout{std::chrono::seconds(5)};
    std::chrono::milliseconds poll_interval{200};
    util::RetryPolicy reconnect{5, std::chrono::milliseconds(1000), std::chrono::milliseconds(60000), 2.0, 0.1};
};

struct ResourcesConfig {
    std::chrono::milliseconds sample_interval{std::chrono::seconds(5)};
    unsigned int window_size = 60;
    unsigned int idle_threshold_seconds = 120;
    unsigned int forecast_horizon_samples = 12;
    double cpu_ceiling_percent = 100.0;
};

struct ContributionConfig {
    std::chrono::milliseconds tick_interval{std::chrono::seconds(2)};
    std::filesystem::path settings_file = "/var/lib/tandem/contribution.yaml";
    unsigned int max_session_seconds = 1800; // 30 minutes, hard ceiling on any grant
    unsigned int no_headroom_cooldown_seconds = 30;
    unsigned int activity_grace_seconds = 60;
};

struct ConflictsConfig {
    std::vector<std::string> manual_types{};
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum tandem       = spdlog::level::info;   // startup/shutdown, service restarts
    spdlog::level::level_enum sync         = spdlog::level::info;   // cycle outcomes, conflicts, rejections
    spdlog::level::level_enum realtime     = spdlog::level::warn;   // reconnects, give-ups, undelivered items
    spdlog::level::level_enum resource     = spdlog::level::warn;   // stale OS reads
    spdlog::level::level_enum contribution = spdlog::level::info;   // denial reasons, task aborts
    spdlog::level::level_enum config       = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/tandem";
    LogLevelsConfig levels;
};

struct Config {
    DeviceConfig device;
    RemoteConfig remote;
    SyncConfig sync;
    RealtimeConfig realtime;
    ResourcesConfig resources;
    ContributionConfig contribution;
    ConflictsConfig conflicts;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const DeviceConfig& c);
void to_json(nlohmann::json& j, const RemoteConfig& c);
void to_json(nlohmann::json& j, const SyncConfig& c);
void to_json(nlohmann::json& j, const RealtimeConfig& c);
void to_json(nlohmann::json& j, const ResourcesConfig& c);
void to_json(nlohmann::json& j, const ContributionConfig& c);
void to_json(nlohmann::json& j, const ConflictsConfig& c);

}

namespace tandem::util {
void to_json(nlohmann::json& j, const RetryPolicy& p);
}
