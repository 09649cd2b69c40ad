#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace tandem::concurrency;

AsyncService::AsyncService(std::string serviceName)
    : serviceName_(std::move(serviceName)) {}

AsyncService::~AsyncService() {
    // Derived loops are already gone by now; subclasses stop() in their own destructors.
    interrupt();
    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) worker_.join();
    else if (worker_.joinable()) worker_.detach();
}

std::shared_ptr<spdlog::logger> AsyncService::logger() const {
    return log::Registry::tandem();
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join();

    interruptFlag_.store(false, std::memory_order_release);
    {
        std::scoped_lock lock(sleepMutex_);
        wakeRequested_ = false;
    }
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            logger()->error("[{}] Service error: {}", serviceName_, e.what());
        }

        running_.store(false, std::memory_order_release);
    });

    logger()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!isRunning() && !worker_.joinable()) return;

    logger()->info("[{}] Stopping service...", serviceName_);
    interrupt();

    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) {
        worker_.join();
    }

    running_.store(false, std::memory_order_release);
    // Leave interruptFlag_ true until next start() resets it
    logger()->info("[{}] Service stopped.", serviceName_);
}

void AsyncService::restart() {
    logger()->info("[{}] Restarting service...", serviceName_);
    stop();
    start();
}

void AsyncService::lazySleep(const std::chrono::milliseconds duration) {
    std::unique_lock lock(sleepMutex_);
    sleepCv_.wait_for(lock, duration, [this] { return shouldStop() || wakeRequested_; });
    wakeRequested_ = false;
}

void AsyncService::wake() {
    {
        std::scoped_lock lock(sleepMutex_);
        wakeRequested_ = true;
    }
    sleepCv_.notify_all();
}

// Set under the sleep mutex so a loop between its predicate check and wait cannot miss it.
void AsyncService::interrupt() {
    {
        std::scoped_lock lock(sleepMutex_);
        interruptFlag_.store(true, std::memory_order_release);
    }
    sleepCv_.notify_all();
}
