#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "config/util.hpp"

#include <cstdlib>
#include <utility>
#include <yaml-cpp/yaml.h>

namespace sw::config {

ConfigError::ConfigError(std::string option, const std::string& message)
    : std::runtime_error(fmt::format("{}: {}", option, message)), option_(std::move(option)) {}

template <typename T>
static void decodeSection(const YAML::Node& root, const std::string& key, T& out) {
    const auto node = root[key];
    if (!node || node.IsNull()) return;
    if (!YAML::convert<T>::decode(node, out)) throw ConfigError(key, "expected a mapping");
}

Config parseConfig(const YAML::Node& root) {
    Config cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw ConfigError("<root>", "expected a mapping");

    decodeSection(root, "node", cfg.node);
    decodeSection(root, "telegram", cfg.telegram);
    decodeSection(root, "monitor", cfg.monitor);
    decodeSection(root, "logging", cfg.logging);

    return cfg;
}

Config loadConfig(const std::filesystem::path& path) {
    try {
        return parseConfig(YAML::LoadFile(path.string()));
    } catch (const YAML::Exception& e) {
        throw ConfigError(path.string(), e.what());
    }
}

std::optional<std::string> processEnv(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (!value || !*value) return std::nullopt;
    return std::string(value);
}

void applyEnvOverrides(Config& cfg, const EnvLookup& env) {
    if (const auto v = env("GETH_URL")) cfg.node.url = *v;
    if (const auto v = env("BOT_TOKEN")) cfg.telegram.bot_token = *v;
    if (const auto v = env("CHECK_INTERVAL")) cfg.monitor.check_interval = parseDurationOption("CHECK_INTERVAL", *v);
    if (const auto v = env("REPORT_INTERVAL")) cfg.monitor.report_interval = parseDurationOption("REPORT_INTERVAL", *v);
    if (const auto v = env("ALERT_GROUP")) cfg.telegram.alert_group = parseIntOption("ALERT_GROUP", *v);
    if (const auto v = env("LOG_LEVEL")) cfg.logging.console_log_level = parseLevelOption("LOG_LEVEL", *v);
}

void Config::validate() const {
    if (node.url.empty()) throw ConfigError("node.url", "node endpoint URL is required (GETH_URL)");
    if (telegram.bot_token.empty()) throw ConfigError("telegram.bot_token", "bot token is required (BOT_TOKEN)");
    if (!telegram.alert_group) throw ConfigError("telegram.alert_group", "alert destination is required (ALERT_GROUP)");
    if (telegram.api_url.empty()) throw ConfigError("telegram.api_url", "must not be empty");

    if (monitor.check_interval <= util::Duration::zero())
        throw ConfigError("monitor.check_interval", fmt::format("must be positive, got {}",
                          util::durationToString(monitor.check_interval)));

    if (monitor.report_interval <= monitor.check_interval)
        throw ConfigError("monitor.report_interval", fmt::format(
            "report interval must be greater than check interval ({} <= {})",
            util::durationToString(monitor.report_interval), util::durationToString(monitor.check_interval)));

    if (node.request_timeout <= util::Duration::zero())
        throw ConfigError("node.request_timeout", "must be positive");
    if (telegram.get_timeout <= util::Duration::zero())
        throw ConfigError("telegram.get_timeout", "must be positive");
    if (telegram.post_timeout <= util::Duration::zero())
        throw ConfigError("telegram.post_timeout", "must be positive");
}

Config resolveConfig(const std::optional<std::filesystem::path>& explicitPath, const EnvLookup& env) {
    Config cfg;

    if (explicitPath) {
        if (!std::filesystem::exists(*explicitPath))
            throw ConfigError(explicitPath->string(), "config file not found");
        cfg = loadConfig(*explicitPath);
    } else if (std::filesystem::exists(DEFAULT_CONFIG_PATH)) {
        cfg = loadConfig(DEFAULT_CONFIG_PATH);
    }

    applyEnvOverrides(cfg, env);
    cfg.validate();
    return cfg;
}

} // namespace sw::config
