#pragma once

#include "config/Credentials.hpp"
#include "contribution/Task.hpp"

#include <chrono>
#include <string>

namespace tandem::contribution {

// Sends finished-task usage to the remote service for transparency reporting.
class HttpUsageReporter final : public UsageReporter {
public:
    HttpUsageReporter(std::string baseUrl, config::Credentials creds, std::chrono::seconds timeout);

    void report(const TaskReport& r) override;

private:
    std::string url_;
    config::Credentials creds_;
    std::chrono::seconds timeout_;
};

// Used when no workload provider is registered on this device.
class NoWorkSource final : public WorkSource {
public:
    std::shared_ptr<Workload> next(const Granted&) override { return nullptr; }
};

}
