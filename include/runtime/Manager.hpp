#pragma once

#include "config/Config.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace sw::concurrency { class AsyncService; }
namespace sw::rpc { class NodeClient; }
namespace sw::notify { class Notifier; }

namespace sw::monitor {
class SyncState;
class Sampler;
class Reporter;
class SamplerService;
class ReporterService;
}

namespace sw::runtime {

// Wires the sampler and reporter around one shared SyncState and keeps their services alive.
class Manager {
public:
    Manager(std::shared_ptr<rpc::NodeClient> nodeClient,
            std::shared_ptr<notify::Notifier> notifier,
            const config::Config& cfg);
    ~Manager();

    // prevent accidental copies
    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    void startAll();
    void stopAll();

    [[nodiscard]] bool allRunning() const;

    std::shared_ptr<monitor::SyncState> getSyncState() const { return syncState_; }
    std::shared_ptr<monitor::Reporter> getReporter() const { return reporter_; }
    std::shared_ptr<monitor::SamplerService> getSamplerService() const { return samplerService_; }
    std::shared_ptr<monitor::ReporterService> getReporterService() const { return reporterService_; }

private:
    void tryStart(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc);
    static void stopService(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc);
    void restartLocked(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc);

    void startWatchdog();
    void stopWatchdog();
    [[noreturn]] void hardFail();

    static constexpr auto WATCHDOG_INTERVAL = std::chrono::seconds(2);

    std::shared_ptr<monitor::SyncState> syncState_;
    std::shared_ptr<monitor::Sampler> sampler_;
    std::shared_ptr<monitor::Reporter> reporter_;
    std::shared_ptr<monitor::SamplerService> samplerService_;
    std::shared_ptr<monitor::ReporterService> reporterService_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<concurrency::AsyncService>> services_;

    // Watchdog state
    std::thread watchdogThread_;
    std::atomic<bool> watchdogRunning_{false};
    std::mutex watchdogMutex_;
    std::condition_variable watchdogCv_;
};

}
