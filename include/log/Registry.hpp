#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <filesystem>
#include <vector>

namespace tandem::log {

class Registry {
public:
    // Initialize all loggers with sinks/levels taken from ConfigRegistry.
    static void init(const std::filesystem::path& logDir);

    // Console-only loggers at debug level, no config required.
    static void initForTesting();

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> tandem()       { return get("tandem"); }
    static std::shared_ptr<spdlog::logger> sync()         { return get("sync"); }
    static std::shared_ptr<spdlog::logger> realtime()     { return get("realtime"); }
    static std::shared_ptr<spdlog::logger> resource()     { return get("resource"); }
    static std::shared_ptr<spdlog::logger> contribution() { return get("contribution"); }
    static std::shared_ptr<spdlog::logger> config()       { return get("config"); }
    static std::shared_ptr<spdlog::logger> audit()        { return get("audit"); }

    [[nodiscard]] static bool isInitialized();

    static void shutdown();

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;
    static inline std::shared_ptr<spdlog::sinks::basic_file_sink_mt>    audit_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;

    static void makeLogger(const std::string& name, spdlog::level::level_enum lvl,
                           const std::vector<spdlog::sink_ptr>& sinks);
};

}
