#pragma once

#include "contribution/Settings.hpp"

#include <filesystem>
#include <memory>
#include <mutex>

namespace tandem::contribution {

// Single write path for the user's contribution settings. Readers get an immutable
// snapshot; every write validates, persists, then swaps the whole value.
class SettingsStore {
public:
    explicit SettingsStore(std::filesystem::path file);

    // Missing file keeps the conservative defaults. Unparseable or invalid files throw.
    void load();

    [[nodiscard]] std::shared_ptr<const Settings> get() const;

    // Replaces the settings wholesale. Throws std::invalid_argument if they fail validation.
    // The acknowledgement cannot be granted through here, only kept or revoked.
    void update(const Settings& next);

    void acknowledgeAndEnable();

    void disable();

    void pause();

    void resume();

private:
    mutable std::mutex mutex_;
    std::filesystem::path file_;
    std::shared_ptr<const Settings> current_;

    void commit(Settings next); // caller holds mutex_
    void persist(const Settings& s) const;
};

}
