#pragma once

#include "concurrency/AsyncService.hpp"
#include "util/duration.hpp"

namespace sw::concurrency {

// Runs tick() at a fixed rate, first one interval after start(). Ticks that a slow tick() overruns are dropped.
class PeriodicService : public AsyncService {
public:
    PeriodicService(const std::string& serviceName, util::Duration interval);

    [[nodiscard]] util::Duration interval() const { return interval_; }

protected:
    void runLoop() override;

    virtual void tick() = 0;

private:
    util::Duration interval_;
};

}
