#include "runtime/Manager.hpp"
#include "concurrency/AsyncService.hpp"
#include "monitor/SyncState.hpp"
#include "monitor/Sampler.hpp"
#include "monitor/Reporter.hpp"
#include "monitor/SamplerService.hpp"
#include "monitor/ReporterService.hpp"
#include "log/Registry.hpp"

#include <cstdlib>
#include <utility>

namespace sw::runtime {

Manager::Manager(std::shared_ptr<rpc::NodeClient> nodeClient,
                 std::shared_ptr<notify::Notifier> notifier,
                 const config::Config& cfg)
    : syncState_(std::make_shared<monitor::SyncState>()),
      sampler_(std::make_shared<monitor::Sampler>(std::move(nodeClient), syncState_)),
      reporter_(std::make_shared<monitor::Reporter>(syncState_, std::move(notifier),
                                                    cfg.telegram.alert_group.value(), cfg.monitor.report_interval)),
      samplerService_(std::make_shared<monitor::SamplerService>(sampler_, cfg.monitor.check_interval)),
      reporterService_(std::make_shared<monitor::ReporterService>(reporter_, cfg.monitor.report_interval))
{
    services_["SamplerService"] = samplerService_;
    services_["ReporterService"] = reporterService_;
}

Manager::~Manager() { stopAll(); }

void Manager::startAll() {
    log::Registry::syncwatch()->debug("[ServiceManager] Starting all services...");
    {
        std::lock_guard lock(mutex_);
        tryStart("SamplerService", samplerService_);
        tryStart("ReporterService", reporterService_);
    }
    log::Registry::syncwatch()->debug("[ServiceManager] All services started.");

    startWatchdog();
}

void Manager::stopAll() {
    stopWatchdog();

    log::Registry::syncwatch()->debug("[ServiceManager] Stopping all services...");
    {
        std::lock_guard lock(mutex_);
        stopService("ReporterService", reporterService_);
        stopService("SamplerService", samplerService_);
    }

    log::Registry::syncwatch()->debug("[ServiceManager] All services stopped.");
}

bool Manager::allRunning() const {
    return samplerService_->isRunning() && reporterService_->isRunning();
}

void Manager::tryStart(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc) {
    if (!svc) return;
    log::Registry::syncwatch()->debug("[ServiceManager] Starting service: {}", name);
    try {
        svc->start();
    } catch (const std::exception& e) {
        log::Registry::syncwatch()->error("[ServiceManager] Failed to start {}: {}", name, e.what());
        hardFail();
    }
}

void Manager::stopService(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc) {
    if (!svc) return;

    log::Registry::syncwatch()->debug("[ServiceManager] Stopping service: {}", name);
    svc->stop();
}

void Manager::restartLocked(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc) {
    log::Registry::syncwatch()->warn("[ServiceManager] Restarting service: {}", name);
    stopService(name, svc);
    tryStart(name, svc);
}

void Manager::startWatchdog() {
    if (watchdogRunning_.exchange(true)) return; // already running
    watchdogThread_ = std::thread([this]() {
        log::Registry::syncwatch()->info("[ServiceManager] Watchdog started.");
        while (watchdogRunning_) {
            {
                std::lock_guard lock(mutex_);
                for (const auto& [name, svc] : services_) {
                    if (svc && !svc->isRunning()) {
                        log::Registry::syncwatch()->warn("[Watchdog] {} is down, restarting...", name);
                        restartLocked(name, svc);
                    }
                }
            }
            std::unique_lock lock(watchdogMutex_);
            watchdogCv_.wait_for(lock, WATCHDOG_INTERVAL, [this] { return !watchdogRunning_; });
        }
        log::Registry::syncwatch()->info("[ServiceManager] Watchdog stopped.");
    });
}

void Manager::stopWatchdog() {
    {
        std::lock_guard lock(watchdogMutex_);
        if (!watchdogRunning_.exchange(false)) return;
    }
    watchdogCv_.notify_all();
    if (watchdogThread_.joinable())
        watchdogThread_.join();
}

[[noreturn]] void Manager::hardFail() {
    log::Registry::syncwatch()->error("[ServiceManager] Critical failure, cannot continue.");
    log::Registry::syncwatch()->error("[ServiceManager] Exiting with failure status.");
    std::_Exit(EXIT_FAILURE);
}

}
