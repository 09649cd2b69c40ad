#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace spdlog { class logger; }

namespace tandem::concurrency {

class AsyncService {
public:
    explicit AsyncService(std::string serviceName);

    virtual ~AsyncService();

    AsyncService(const AsyncService&) = delete;
    AsyncService& operator=(const AsyncService&) = delete;

    virtual void start();

    virtual void stop();

    virtual void restart();

    [[nodiscard]] bool isRunning() const { return running_.load(std::memory_order_acquire); }

    [[nodiscard]] const std::string& name() const { return serviceName_; }

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::thread worker_;

    virtual void runLoop() = 0;

    [[nodiscard]] bool shouldStop() const { return interruptFlag_.load(std::memory_order_acquire); }

    // Sleeps up to `duration`, returning early when stop() or wake() is called.
    void lazySleep(std::chrono::milliseconds duration);

    // Cuts the current lazySleep() short without stopping the service.
    void wake();

    [[nodiscard]] virtual std::shared_ptr<spdlog::logger> logger() const;

private:
    std::mutex sleepMutex_;
    std::condition_variable sleepCv_;
    bool wakeRequested_{false};

    void interrupt();
};

}
