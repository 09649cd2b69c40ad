#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>

namespace tandem::resource {

struct Reading {
    double cpu_percent{};
    uint64_t ram_total_mb{};
    uint64_t ram_used_mb{};
    std::optional<double> gpu_percent;
    std::optional<double> battery_percent;
    bool on_battery{};
    uint64_t idle_seconds{};
};

// Raw OS measurements. read() throws std::runtime_error when the OS cannot be read.
class Probe {
public:
    virtual ~Probe() = default;

    virtual Reading read() = 0;

    // The host saw user input (keyboard, pointer, foreground request).
    virtual void recordActivity() = 0;
};

// Idle time counts from the last input interrupt seen in /proc/interrupts (keyboard, pointer,
// touchpad) or the last recordActivity() call. Hosts without any input interrupt line fall back
// to treating busy CPU above fallbackActivityCpu as activity.
class LinuxProbe final : public Probe {
public:
    explicit LinuxProbe(std::filesystem::path procRoot = "/proc", std::filesystem::path sysRoot = "/sys",
                        double fallbackActivityCpu = 30.0);

    Reading read() override;

    void recordActivity() override;

private:
    struct CpuTimes {
        uint64_t total{};
        uint64_t idle{};
    };

    std::filesystem::path procRoot_, sysRoot_;
    double fallbackActivityCpu_;

    std::mutex mutex_;
    std::optional<CpuTimes> prevCpu_;
    std::optional<uint64_t> prevInputIrqs_;
    std::chrono::steady_clock::time_point lastActivity_;

    CpuTimes readCpuTimes() const;
    std::optional<uint64_t> readInputInterrupts() const;
    void readMemory(Reading& r) const;
    void readPower(Reading& r) const;
    std::optional<double> readGpu() const;
};

}
