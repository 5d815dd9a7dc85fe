// Services
#include "runtime/Manager.hpp"

// Collaborators
#include "rpc/EthClient.hpp"
#include "notify/TelegramBot.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "util/curlWrappers.hpp"
#include "util/duration.hpp"

// Libraries
#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <memory>
#include <cstdlib>
#include <optional>
#include <thread>
#include <spdlog/spdlog.h>

using namespace sw::config;

namespace {
std::atomic<int> receivedSignal{0};

void signalHandler(const int signum) {
    receivedSignal = signum;
}

std::optional<std::filesystem::path> configPathFromArgs(const int argc, char** argv) {
    if (argc > 1) return std::filesystem::path(argv[1]);
    if (const auto env = processEnv("SYNCWATCH_CONFIG")) return std::filesystem::path(*env);
    return std::nullopt;
}
}

int main(int argc, char** argv) {
    try {
        ConfigRegistry::init(configPathFromArgs(argc, argv));
    } catch (const std::exception& e) {
        spdlog::critical("[-] Invalid configuration: {}", e.what());
        return EXIT_FAILURE;
    }

    try {
        const auto& cfg = ConfigRegistry::get();
        sw::log::Registry::init(cfg.logging);

        sw::log::Registry::syncwatch()->info("[*] Initializing syncwatch (check every {}, report every {})...",
                                             sw::util::durationToString(cfg.monitor.check_interval),
                                             sw::util::durationToString(cfg.monitor.report_interval));

        sw::util::ensureCurlGlobalInit();

        const auto nodeClient = std::make_shared<sw::rpc::EthClient>(cfg.node);
        sw::log::Registry::syncwatch()->info("[✓] Node client ready ({}).", nodeClient->host());

        const auto bot = std::make_shared<sw::notify::TelegramBot>(cfg.telegram);
        sw::log::Registry::syncwatch()->info("[✓] Telegram bot @{} ready, alerting chat {}.", bot->username(), *cfg.telegram.alert_group);

        sw::runtime::Manager manager(nodeClient, bot, cfg);

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        manager.startAll();
        if (!manager.allRunning()) sw::log::Registry::syncwatch()->warn("[!] Not all services came up, watchdog will retry.");
        else sw::log::Registry::syncwatch()->info("[*] syncwatch services started successfully.");

        while (receivedSignal == 0) std::this_thread::sleep_for(std::chrono::milliseconds(250));

        sw::log::Registry::syncwatch()->info("[!] Signal {} received. Shutting down gracefully...", receivedSignal.load());
        manager.stopAll();

        sw::log::Registry::syncwatch()->info("[✓] syncwatch shut down cleanly.");
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        if (sw::log::Registry::isInitialized())
            sw::log::Registry::syncwatch()->critical("[-] Failed to initialize syncwatch: {}", e.what());
        else
            spdlog::critical("[-] Failed to initialize syncwatch: {}", e.what());
        return EXIT_FAILURE;
    }
}
