#include "resource/Probe.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace tandem::resource;

namespace {

std::optional<std::string> readFirstLine(const std::filesystem::path& p) {
    std::ifstream in(p);
    if (!in) return std::nullopt;
    std::string line;
    std::getline(in, line);
    while (!line.empty() && (line.back() == '\n' || line.back() == ' ')) line.pop_back();
    return line;
}

bool isInputDevice(std::string description) {
    std::ranges::transform(description, description.begin(), [](const unsigned char c) { return std::tolower(c); });
    static constexpr const char* MARKERS[] = {"i8042", "keyboard", "mouse", "touchpad", "i2c-hid", "hid-multitouch"};
    return std::ranges::any_of(MARKERS, [&](const char* m) { return description.find(m) != std::string::npos; });
}

}

LinuxProbe::LinuxProbe(std::filesystem::path procRoot, std::filesystem::path sysRoot, const double fallbackActivityCpu)
    : procRoot_(std::move(procRoot)),
      sysRoot_(std::move(sysRoot)),
      fallbackActivityCpu_(fallbackActivityCpu),
      lastActivity_(std::chrono::steady_clock::now()) {}

void LinuxProbe::recordActivity() {
    std::scoped_lock lock(mutex_);
    lastActivity_ = std::chrono::steady_clock::now();
}

Reading LinuxProbe::read() {
    Reading r;

    const auto cpu = readCpuTimes();
    const auto inputIrqs = readInputInterrupts();
    {
        std::scoped_lock lock(mutex_);
        const bool haveCpuBaseline = prevCpu_.has_value();
        const auto base = prevCpu_.value_or(CpuTimes{});
        const auto dTotal = cpu.total > base.total ? cpu.total - base.total : 0;
        const auto dIdle = cpu.idle > base.idle ? cpu.idle - base.idle : 0;
        r.cpu_percent = dTotal ? 100.0 * static_cast<double>(dTotal - std::min(dIdle, dTotal)) / static_cast<double>(dTotal) : 0.0;
        prevCpu_ = cpu;

        if (inputIrqs) {
            if (prevInputIrqs_ && *inputIrqs != *prevInputIrqs_) lastActivity_ = std::chrono::steady_clock::now();
            prevInputIrqs_ = inputIrqs;
        } else if (haveCpuBaseline && r.cpu_percent > fallbackActivityCpu_) {
            lastActivity_ = std::chrono::steady_clock::now();
        }

        r.idle_seconds = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - lastActivity_).count());
    }

    readMemory(r);
    readPower(r);
    r.gpu_percent = readGpu();
    return r;
}

LinuxProbe::CpuTimes LinuxProbe::readCpuTimes() const {
    const auto line = readFirstLine(procRoot_ / "stat");
    if (!line || line->rfind("cpu ", 0) != 0) throw std::runtime_error("Unable to read " + (procRoot_ / "stat").string());

    std::istringstream iss(line->substr(4));
    CpuTimes t;
    uint64_t v;
    for (int field = 0; iss >> v; ++field) {
        // user nice system idle iowait irq softirq steal; guest time is already folded into user
        if (field >= 8) break;
        t.total += v;
        if (field == 3 || field == 4) t.idle += v;
    }
    if (t.total == 0) throw std::runtime_error("Malformed cpu line in " + (procRoot_ / "stat").string());
    return t;
}

// Sum of per-CPU counts over every input-device line, nullopt when there is none.
std::optional<uint64_t> LinuxProbe::readInputInterrupts() const {
    std::ifstream in(procRoot_ / "interrupts");
    if (!in) return std::nullopt;

    std::string line;
    std::getline(in, line); // CPU0 CPU1 ... header

    std::optional<uint64_t> total;
    while (std::getline(in, line)) {
        std::istringstream iss(line);
        std::string label;
        if (!(iss >> label) || label.empty() || label.back() != ':') continue;

        uint64_t sum = 0;
        std::string token;
        std::streampos rest = iss.tellg();
        while (iss >> token && !token.empty() && std::ranges::all_of(token, [](const unsigned char c) { return std::isdigit(c); })) {
            sum += std::stoull(token);
            rest = iss.tellg();
        }

        const auto description = rest == std::streampos(-1) ? std::string{} : line.substr(static_cast<std::size_t>(rest));
        if (isInputDevice(description)) total = total.value_or(0) + sum;
    }
    return total;
}

void LinuxProbe::readMemory(Reading& r) const {
    std::ifstream in(procRoot_ / "meminfo");
    if (!in) throw std::runtime_error("Unable to read " + (procRoot_ / "meminfo").string());

    uint64_t totalKb = 0, availableKb = 0;
    bool haveAvailable = false;
    std::string key;
    uint64_t value;
    std::string unit;
    while (in >> key >> value) {
        std::getline(in, unit);
        if (key == "MemTotal:") totalKb = value;
        else if (key == "MemAvailable:") {
            availableKb = value;
            haveAvailable = true;
        }
    }
    if (!totalKb || !haveAvailable) throw std::runtime_error("meminfo lacks MemTotal/MemAvailable");

    r.ram_total_mb = totalKb / 1024;
    r.ram_used_mb = (totalKb - std::min(availableKb, totalKb)) / 1024;
}

void LinuxProbe::readPower(Reading& r) const {
    const auto root = sysRoot_ / "class" / "power_supply";
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) return;

    bool mainsOnline = false, discharging = false;
    for (const auto& entry : std::filesystem::directory_iterator(root, ec)) {
        const auto type = readFirstLine(entry.path() / "type");
        if (!type) continue;

        if (*type == "Mains") {
            if (readFirstLine(entry.path() / "online").value_or("0") == "1") mainsOnline = true;
        } else if (*type == "Battery") {
            if (const auto cap = readFirstLine(entry.path() / "capacity")) {
                try {
                    r.battery_percent = std::stod(*cap);
                } catch (const std::exception&) {
                    r.battery_percent.reset();
                }
            }
            if (readFirstLine(entry.path() / "status").value_or("") == "Discharging") discharging = true;
        }
    }

    r.on_battery = r.battery_percent.has_value() && discharging && !mainsOnline;
}

std::optional<double> LinuxProbe::readGpu() const {
    const auto busy = readFirstLine(sysRoot_ / "class" / "drm" / "card0" / "device" / "gpu_busy_percent");
    if (!busy) return std::nullopt;
    try {
        return std::stod(*busy);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}
