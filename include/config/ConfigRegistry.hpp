#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>

namespace tandem::config {

class ConfigRegistry {
public:
    static constexpr const auto* DEFAULT_PATH = "/etc/tandem/config.yaml";

    static void init(const std::filesystem::path& path = DEFAULT_PATH);
    static void initWith(Config cfg);
    static const Config& get();

    [[nodiscard]] static bool isInitialized();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::mutex init_mutex_;
};

}
