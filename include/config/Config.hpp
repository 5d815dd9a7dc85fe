#pragma once

#include "util/duration.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>

namespace YAML { class Node; }

namespace sw::config {

inline const std::filesystem::path DEFAULT_CONFIG_PATH = "/etc/syncwatch/config.yaml";
inline constexpr auto DEFAULT_TELEGRAM_API_URL = "https://api.telegram.org";

// Raised for any malformed, missing or inconsistent setting; option() names the offending key.
class ConfigError : public std::runtime_error {
public:
    ConfigError(std::string option, const std::string& message);

    [[nodiscard]] const std::string& option() const { return option_; }

private:
    std::string option_;
};

struct NodeConfig {
    std::string url;
    util::Duration request_timeout = std::chrono::seconds(30);
};

struct TelegramConfig {
    std::string bot_token;
    std::optional<int64_t> alert_group;  // chat id, required
    std::string api_url = DEFAULT_TELEGRAM_API_URL;
    util::Duration get_timeout = std::chrono::seconds(10);
    util::Duration post_timeout = std::chrono::seconds(10);
};

struct MonitorConfig {
    util::Duration check_interval = std::chrono::minutes(1);
    util::Duration report_interval = std::chrono::minutes(10);
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum syncwatch = spdlog::level::info;   // startup, shutdown, service lifecycle
    spdlog::level::level_enum rpc       = spdlog::level::warn;   // node transport and decode failures
    spdlog::level::level_enum notify    = spdlog::level::warn;   // failed deliveries
    spdlog::level::level_enum monitor   = spdlog::level::info;   // sync transitions
};

struct LoggingConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    std::string log_file;  // empty: console only
    SubsystemLogLevelsConfig subsystem_levels;
};

struct Config {
    NodeConfig node;
    TelegramConfig telegram;
    MonitorConfig monitor;
    LoggingConfig logging;

    // Throws ConfigError for missing required settings (node URL, bot token, alert group) or a report interval not above the check interval.
    void validate() const;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads the process environment; unset and empty variables both yield nullopt.
std::optional<std::string> processEnv(const std::string& name);

Config parseConfig(const YAML::Node& root);
Config loadConfig(const std::filesystem::path& path);

// Applies GETH_URL, BOT_TOKEN, CHECK_INTERVAL, REPORT_INTERVAL, ALERT_GROUP and LOG_LEVEL.
void applyEnvOverrides(Config& cfg, const EnvLookup& env);

// File (if any) -> environment overrides -> validate(). A missing file is only an error when explicitly requested.
Config resolveConfig(const std::optional<std::filesystem::path>& explicitPath, const EnvLookup& env = processEnv);

} // namespace sw::config
