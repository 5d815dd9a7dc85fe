#pragma once

#include "concurrency/PeriodicService.hpp"

#include <memory>

namespace sw::monitor {

class Reporter;

class ReporterService final : public concurrency::PeriodicService {
public:
    ReporterService(std::shared_ptr<Reporter> reporter, util::Duration reportInterval);
    ~ReporterService() override;

protected:
    void tick() override;

private:
    std::shared_ptr<Reporter> reporter_;
};

}
