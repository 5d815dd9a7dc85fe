#include "monitor/ReporterService.hpp"
#include "monitor/Reporter.hpp"

#include <utility>

using namespace sw::monitor;

ReporterService::ReporterService(std::shared_ptr<Reporter> reporter, const util::Duration reportInterval)
    : PeriodicService("ReporterService", reportInterval), reporter_(std::move(reporter)) {}

ReporterService::~ReporterService() { stop(); }

void ReporterService::tick() { reporter_->tick(); }
