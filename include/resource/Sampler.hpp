#pragma once

#include "concurrency/AsyncService.hpp"
#include "resource/Analyzer.hpp"

#include <chrono>
#include <memory>

namespace tandem::resource {

class Sampler final : public concurrency::AsyncService {
public:
    Sampler(std::shared_ptr<Analyzer> analyzer, std::chrono::milliseconds interval);

    ~Sampler() override;

protected:
    void runLoop() override;

    [[nodiscard]] std::shared_ptr<spdlog::logger> logger() const override;

private:
    std::shared_ptr<Analyzer> analyzer_;
    std::chrono::milliseconds interval_;
};

}
