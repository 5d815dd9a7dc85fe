#include "concurrency/PeriodicService.hpp"

#include <stdexcept>

using namespace sw::concurrency;

PeriodicService::PeriodicService(const std::string& serviceName, const util::Duration interval)
    : AsyncService(serviceName), interval_(interval) {
    if (interval_ <= util::Duration::zero())
        throw std::invalid_argument("[" + serviceName + "] interval must be positive");
}

void PeriodicService::runLoop() {
    using clock = std::chrono::steady_clock;

    auto next = clock::now() + interval_;
    while (!shouldStop()) {
        lazySleepUntil(next);
        if (shouldStop()) break;

        tick();

        const auto now = clock::now();
        next += interval_;
        while (next <= now) next += interval_;
    }
}
