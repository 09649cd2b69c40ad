#include "contribution/SettingsStore.hpp"
#include "contribution/settings_yaml.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"

#include <fstream>

using namespace tandem::contribution;
using namespace tandem::log;

SettingsStore::SettingsStore(std::filesystem::path file)
    : file_(std::move(file)), current_(std::make_shared<const Settings>()) {}

void SettingsStore::load() {
    std::scoped_lock lock(mutex_);

    if (!std::filesystem::exists(file_)) {
        current_ = std::make_shared<const Settings>();
        Registry::contribution()->info("[SettingsStore] No settings at {}, contribution stays disabled", file_.string());
        return;
    }

    Settings loaded;
    try {
        loaded = YAML::LoadFile(file_.string()).as<Settings>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse contribution settings " + file_.string() + ": " + e.what());
    }
    loaded.validate();

    current_ = std::make_shared<const Settings>(std::move(loaded));
    Registry::contribution()->info("[SettingsStore] Loaded settings (enabled={}, paused={})",
                                   current_->enabled, current_->paused);
}

std::shared_ptr<const Settings> SettingsStore::get() const {
    std::scoped_lock lock(mutex_);
    return current_;
}

void SettingsStore::update(const Settings& next) {
    std::scoped_lock lock(mutex_);

    auto s = next;
    if (s.terms_accepted && !current_->terms_accepted)
        throw std::invalid_argument("Terms can only be acknowledged through acknowledgeAndEnable()");
    if (s.enabled && !current_->enabled)
        throw std::invalid_argument("Contribution can only be enabled through acknowledgeAndEnable()");

    s.validate();
    commit(std::move(s));
}

void SettingsStore::acknowledgeAndEnable() {
    std::scoped_lock lock(mutex_);
    commit(current_->toBuilder().acknowledgeAndEnable(util::nowMillis()).build());
    Registry::contribution()->info("[SettingsStore] Contribution enabled by user acknowledgement");
}

void SettingsStore::disable() {
    std::scoped_lock lock(mutex_);
    commit(current_->toBuilder().disable().build());
    Registry::contribution()->info("[SettingsStore] Contribution disabled");
}

void SettingsStore::pause() {
    std::scoped_lock lock(mutex_);
    commit(current_->toBuilder().paused(true).build());
    Registry::contribution()->info("[SettingsStore] Contribution paused");
}

void SettingsStore::resume() {
    std::scoped_lock lock(mutex_);
    commit(current_->toBuilder().paused(false).build());
    Registry::contribution()->info("[SettingsStore] Contribution resumed");
}

void SettingsStore::commit(Settings next) {
    persist(next);
    current_ = std::make_shared<const Settings>(std::move(next));
}

void SettingsStore::persist(const Settings& s) const {
    if (file_.has_parent_path()) std::filesystem::create_directories(file_.parent_path());

    YAML::Emitter out;
    out << YAML::convert<Settings>::encode(s);

    auto tmp = file_;
    tmp += ".tmp";
    {
        std::ofstream f(tmp, std::ios::trunc);
        if (!f) throw std::runtime_error("Unable to write contribution settings: " + tmp.string());
        f << out.c_str() << '\n';
    }
    std::filesystem::rename(tmp, file_);
}
