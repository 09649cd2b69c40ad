#include "resource/Sampler.hpp"
#include "log/Registry.hpp"

using namespace tandem::resource;

Sampler::Sampler(std::shared_ptr<Analyzer> analyzer, const std::chrono::milliseconds interval)
    : AsyncService("ResourceSampler"), analyzer_(std::move(analyzer)), interval_(interval) {}

Sampler::~Sampler() { stop(); }

std::shared_ptr<spdlog::logger> Sampler::logger() const { return log::Registry::resource(); }

void Sampler::runLoop() {
    while (!shouldStop()) {
        const auto snap = analyzer_->sample();
        log::Registry::resource()->trace("[Sampler] cpu={:.1f}% avg={:.1f}% idle={}s depth={}",
                                         snap->cpu_usage_percent, snap->trailing_cpu_percent,
                                         snap->idle_seconds, to_string(snap->idle_depth));
        lazySleep(interval_);
    }
}
