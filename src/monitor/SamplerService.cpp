#include "monitor/SamplerService.hpp"
#include "monitor/Sampler.hpp"

#include <utility>

using namespace sw::monitor;

SamplerService::SamplerService(std::shared_ptr<Sampler> sampler, const util::Duration checkInterval)
    : PeriodicService("SamplerService", checkInterval), sampler_(std::move(sampler)) {}

SamplerService::~SamplerService() { stop(); }

void SamplerService::tick() { sampler_->sample(); }
