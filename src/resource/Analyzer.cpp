#include "resource/Analyzer.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"

#include <algorithm>
#include <numeric>

using namespace tandem::resource;
using namespace tandem::log;

namespace {

// Least-squares slope over equally spaced samples.
double slope(const std::vector<double>& ys) {
    const auto n = static_cast<double>(ys.size());
    if (ys.size() < 2) return 0.0;
    const double meanX = (n - 1) / 2.0;
    const double meanY = std::accumulate(ys.begin(), ys.end(), 0.0) / n;
    double num = 0.0, den = 0.0;
    for (std::size_t i = 0; i < ys.size(); ++i) {
        const double dx = static_cast<double>(i) - meanX;
        num += dx * (ys[i] - meanY);
        den += dx * dx;
    }
    return den == 0.0 ? 0.0 : num / den;
}

}

Analyzer::Analyzer(std::shared_ptr<Probe> probe, const config::ResourcesConfig& cfg)
    : probe_(std::move(probe)), cfg_(cfg) {
    if (cfg_.window_size == 0) cfg_.window_size = 1;

    auto placeholder = std::make_shared<Snapshot>();
    placeholder->stale = true;
    placeholder->taken_at = util::nowMillis();
    latest_ = std::move(placeholder);
}

// Classified on the trailing average only, so a single spike never flips the depth.
IdleDepth Analyzer::idleDepth(double /*currentCpu*/, const double trailingAverage) {
    if (trailingAverage > 30.0) return IdleDepth::Active;
    if (trailingAverage > 20.0) return IdleDepth::Light;
    if (trailingAverage > 10.0) return IdleDepth::Medium;
    if (trailingAverage > 5.0) return IdleDepth::Deep;
    return IdleDepth::SleepReady;
}

IdleDepth Analyzer::idleDepth(const double currentCpu, const std::vector<double>& recentWindow) {
    const double avg = recentWindow.empty()
        ? currentCpu
        : std::accumulate(recentWindow.begin(), recentWindow.end(), 0.0) / static_cast<double>(recentWindow.size());
    return idleDepth(currentCpu, avg);
}

SnapshotPtr Analyzer::sample() {
    Reading reading;
    try {
        reading = probe_->read();
    } catch (const std::exception& e) {
        std::scoped_lock lock(mutex_);
        if (!latest_->stale) Registry::resource()->warn("[Analyzer] Resource read failed, publishing stale snapshot: {}", e.what());

        auto stale = std::make_shared<Snapshot>(*latest_);
        stale->stale = true;
        stale->is_idle = false;
        stale->idle_seconds = 0;
        stale->taken_at = util::nowMillis();
        latest_ = std::move(stale);
        return latest_;
    }

    std::scoped_lock lock(mutex_);

    window_.push_back({reading.cpu_percent, reading.ram_used_mb});
    while (window_.size() > cfg_.window_size) window_.pop_front();
    ramTotalMb_ = reading.ram_total_mb;

    const double trailing = std::accumulate(window_.begin(), window_.end(), 0.0,
                                            [](const double acc, const Sample& s) { return acc + s.cpu; }) /
                            static_cast<double>(window_.size());

    auto snap = std::make_shared<Snapshot>();
    snap->cpu_usage_percent = reading.cpu_percent;
    snap->trailing_cpu_percent = trailing;
    snap->ram_total_mb = reading.ram_total_mb;
    snap->ram_used_mb = reading.ram_used_mb;
    snap->ram_usage_percent = reading.ram_total_mb
        ? 100.0 * static_cast<double>(reading.ram_used_mb) / static_cast<double>(reading.ram_total_mb)
        : 0.0;
    snap->gpu_usage_percent = reading.gpu_percent;
    snap->battery_percent = reading.battery_percent;
    snap->on_battery = reading.on_battery;
    snap->idle_seconds = reading.idle_seconds;
    snap->is_idle = reading.idle_seconds >= cfg_.idle_threshold_seconds;
    snap->idle_depth = idleDepth(reading.cpu_percent, trailing);
    snap->taken_at = util::nowMillis();

    if (latest_->stale && latest_->ram_total_mb) Registry::resource()->info("[Analyzer] Resource reads recovered");

    latest_ = std::move(snap);
    return latest_;
}

SnapshotPtr Analyzer::latest() const {
    std::scoped_lock lock(mutex_);
    return latest_;
}

Forecast Analyzer::forecast() const {
    std::scoped_lock lock(mutex_);

    Forecast f;
    f.horizon_samples = cfg_.forecast_horizon_samples;
    if (window_.empty()) return f;

    std::vector<double> cpu, ram;
    cpu.reserve(window_.size());
    ram.reserve(window_.size());
    for (const auto& s : window_) {
        cpu.push_back(s.cpu);
        ram.push_back(static_cast<double>(s.ram_used_mb));
    }

    const auto n = static_cast<double>(window_.size());
    const double cpuAvg = std::accumulate(cpu.begin(), cpu.end(), 0.0) / n;
    const double ramAvg = std::accumulate(ram.begin(), ram.end(), 0.0) / n;
    const double horizon = static_cast<double>(cfg_.forecast_horizon_samples);

    f.cpu_trend_per_sample = slope(cpu);
    const double predictedCpu = std::clamp(cpuAvg + f.cpu_trend_per_sample * horizon, 0.0, cfg_.cpu_ceiling_percent);
    f.available_cpu_percent = cfg_.cpu_ceiling_percent - predictedCpu;

    const double total = static_cast<double>(ramTotalMb_);
    const double predictedRam = std::clamp(ramAvg + slope(ram) * horizon, 0.0, total);
    f.available_ram_mb = static_cast<uint64_t>(total - predictedRam);

    return f;
}

void Analyzer::recordActivity() { probe_->recordActivity(); }

std::vector<double> Analyzer::cpuWindow() const {
    std::scoped_lock lock(mutex_);
    std::vector<double> out;
    out.reserve(window_.size());
    for (const auto& s : window_) out.push_back(s.cpu);
    return out;
}
