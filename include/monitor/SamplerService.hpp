#pragma once

#include "concurrency/PeriodicService.hpp"

#include <memory>

namespace sw::monitor {

class Sampler;

class SamplerService final : public concurrency::PeriodicService {
public:
    SamplerService(std::shared_ptr<Sampler> sampler, util::Duration checkInterval);
    ~SamplerService() override;

protected:
    void tick() override;

private:
    std::shared_ptr<Sampler> sampler_;
};

}
