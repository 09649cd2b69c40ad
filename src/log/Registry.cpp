#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace tandem::log {

void Registry::makeLogger(const std::string& name, const spdlog::level::level_enum lvl,
                          const std::vector<spdlog::sink_ptr>& sinks) {
    spdlog::drop(name);
    const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(lvl);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
}

void Registry::init(const std::filesystem::path& logDir) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    spdlog::info("[LogRegistry] Initializing... LogDir: {}", logDir.string());

    namespace fs = std::filesystem;
    if (!fs::exists(logDir)) fs::create_directories(logDir);

    const auto& cnf = config::ConfigRegistry::get().logging;

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        (logDir / "tandem.log").string(), main_max_bytes_, main_max_files_);
    main_file_sink_->set_level(cnf.levels.file_log_level);
    main_file_sink_->set_pattern(LOG_FORMAT);

    const std::vector<spdlog::sink_ptr> sinks{console_sink_, main_file_sink_};
    const auto& sub = cnf.levels.subsystem_levels;

    makeLogger("tandem", sub.tandem, sinks);
    makeLogger("sync", sub.sync, sinks);
    makeLogger("realtime", sub.realtime, sinks);
    makeLogger("resource", sub.resource, sinks);
    makeLogger("contribution", sub.contribution, sinks);
    makeLogger("config", sub.config, sinks);

    // Audit logger (append-only file sink, no rotation)
    audit_file_sink_ = std::make_shared<spdlog::sinks::basic_file_sink_mt>((logDir / "audit.log").string(), true);
    {
        const auto logger = std::make_shared<spdlog::logger>("audit", audit_file_sink_);
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        spdlog::drop("audit");
        spdlog::register_logger(logger);
    }

    initialized_ = true;
    spdlog::info("[LogRegistry] Initialized");
}

void Registry::initForTesting() {
    if (initialized_) return;

    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(spdlog::level::warn);
    console_sink_->set_pattern(LOG_FORMAT);

    const std::vector<spdlog::sink_ptr> sinks{console_sink_};
    for (const auto* name : {"tandem", "sync", "realtime", "resource", "contribution", "config", "audit"})
        makeLogger(name, spdlog::level::debug, sinks);

    initialized_ = true;
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

void Registry::shutdown() {
    spdlog::shutdown();
    initialized_ = false;
}

}
