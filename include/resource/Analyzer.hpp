#pragma once

#include "config/Config.hpp"
#include "resource/Probe.hpp"
#include "resource/Snapshot.hpp"

#include <deque>
#include <memory>
#include <mutex>
#include <vector>

namespace tandem::resource {

// Rolling window of probe readings. Publishes immutable snapshots; a failed read produces a
// stale snapshot and leaves the window untouched.
class Analyzer {
public:
    Analyzer(std::shared_ptr<Probe> probe, const config::ResourcesConfig& cfg);

    SnapshotPtr sample();

    // Most recent snapshot. Before the first sample this is a stale, active, non-idle placeholder.
    [[nodiscard]] SnapshotPtr latest() const;

    [[nodiscard]] Forecast forecast() const;

    void recordActivity();

    [[nodiscard]] std::vector<double> cpuWindow() const;

    static IdleDepth idleDepth(double currentCpu, double trailingAverage);
    static IdleDepth idleDepth(double currentCpu, const std::vector<double>& recentWindow);

private:
    struct Sample {
        double cpu{};
        uint64_t ram_used_mb{};
    };

    std::shared_ptr<Probe> probe_;
    config::ResourcesConfig cfg_;

    mutable std::mutex mutex_;
    std::deque<Sample> window_;
    uint64_t ramTotalMb_{};
    SnapshotPtr latest_;
};

}
