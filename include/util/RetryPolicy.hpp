#pragma once

#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <string>
#include <thread>

namespace tandem::util {

// One backoff policy shared by push, pull and realtime reconnect.
struct RetryPolicy {
    unsigned int max_attempts = 3;
    std::chrono::milliseconds initial_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    double multiplier = 2.0;
    double jitter = 0.1; // fraction of the capped delay, applied symmetrically

    // attempt is zero-based: delayFor(0) is the wait after the first failure.
    [[nodiscard]] std::chrono::milliseconds delayFor(unsigned int attempt) const;

    [[nodiscard]] bool exhausted(const unsigned int attemptsMade) const { return attemptsMade >= max_attempts; }

    using Sleeper = std::function<bool(std::chrono::milliseconds)>;

    // Runs fn until it succeeds, throws something retryable() rejects, or attempts run out.
    // The sleeper returns false to abandon the loop early (service shutting down), in which
    // case the last error is rethrown.
    template <typename Fn>
    auto run(Fn&& fn,
             const std::function<bool(const std::exception&)>& retryable,
             const Sleeper& sleeper,
             const std::function<void(unsigned int, const std::exception&)>& onFailure = {}) const -> decltype(fn()) {
        for (unsigned int attempt = 0;; ++attempt) {
            try {
                return fn();
            } catch (const std::exception& e) {
                if (!retryable(e) || exhausted(attempt + 1)) throw;
                if (onFailure) onFailure(attempt + 1, e);
                if (!sleeper(delayFor(attempt))) throw;
            }
        }
    }
};

// Sleeps in short slices so a stop flag can cut the wait short.
bool interruptibleSleep(std::chrono::milliseconds duration, const std::atomic<bool>& stopFlag);

}
