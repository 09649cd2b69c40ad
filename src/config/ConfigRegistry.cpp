#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace tandem::config {

void ConfigRegistry::init(const std::filesystem::path& path) {
    std::scoped_lock lock(init_mutex_);
    if (initialized_) return;
    config_ = loadConfig(path);
    initialized_ = true;
}

void ConfigRegistry::initWith(Config cfg) {
    std::scoped_lock lock(init_mutex_);
    config_ = std::move(cfg);
    initialized_ = true;
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

bool ConfigRegistry::isInitialized() { return initialized_; }

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

}
