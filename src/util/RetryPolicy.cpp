#include "util/RetryPolicy.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace tandem::util {

std::chrono::milliseconds RetryPolicy::delayFor(const unsigned int attempt) const {
    const double base = static_cast<double>(initial_delay.count()) * std::pow(multiplier, static_cast<double>(attempt));
    const double capped = std::min(base, static_cast<double>(max_delay.count()));

    double jittered = capped;
    if (jitter > 0.0) {
        thread_local std::mt19937 rng{std::random_device{}()};
        std::uniform_real_distribution<double> dist(-1.0, 1.0);
        jittered = capped + dist(rng) * capped * jitter;
    }

    return std::chrono::milliseconds(static_cast<long long>(std::max(0.0, jittered)));
}

bool interruptibleSleep(const std::chrono::milliseconds duration, const std::atomic<bool>& stopFlag) {
    constexpr auto slice = std::chrono::milliseconds(50);
    const auto deadline = std::chrono::steady_clock::now() + duration;

    while (std::chrono::steady_clock::now() < deadline) {
        if (stopFlag.load(std::memory_order_acquire)) return false;
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(std::min(slice, std::max(left, std::chrono::milliseconds(1))));
    }

    return !stopFlag.load(std::memory_order_acquire);
}

}
