#pragma once

#include "config/Config.hpp"
#include "config/util.hpp"

#include <yaml-cpp/yaml.h>

namespace sw::config {

inline std::string readString(const YAML::Node& node, const std::string& key, const std::string& option, const std::string& def) {
    if (!node[key]) return def;
    try {
        return node[key].as<std::string>();
    } catch (const YAML::Exception& e) {
        throw ConfigError(option, e.what());
    }
}

inline util::Duration readDuration(const YAML::Node& node, const std::string& key, const std::string& option, const util::Duration def) {
    if (!node[key]) return def;
    return parseDurationOption(option, readString(node, key, option, ""));
}

inline spdlog::level::level_enum readLevel(const YAML::Node& node, const std::string& key, const std::string& option,
                                           const spdlog::level::level_enum def) {
    if (!node[key]) return def;
    return parseLevelOption(option, readString(node, key, option, ""));
}

}

namespace YAML {

using namespace sw::config;

template<>
struct convert<NodeConfig> {
    static bool decode(const Node& node, NodeConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.url = readString(node, "url", "node.url", rhs.url);
        rhs.request_timeout = readDuration(node, "request_timeout", "node.request_timeout", rhs.request_timeout);
        return true;
    }
};

template<>
struct convert<TelegramConfig> {
    static bool decode(const Node& node, TelegramConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.bot_token = readString(node, "bot_token", "telegram.bot_token", rhs.bot_token);
        if (node["alert_group"])
            rhs.alert_group = parseIntOption("telegram.alert_group", readString(node, "alert_group", "telegram.alert_group", ""));
        rhs.api_url = readString(node, "api_url", "telegram.api_url", rhs.api_url);
        rhs.get_timeout = readDuration(node, "get_timeout", "telegram.get_timeout", rhs.get_timeout);
        rhs.post_timeout = readDuration(node, "post_timeout", "telegram.post_timeout", rhs.post_timeout);
        return true;
    }
};

template<>
struct convert<MonitorConfig> {
    static bool decode(const Node& node, MonitorConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.check_interval = readDuration(node, "check_interval", "monitor.check_interval", rhs.check_interval);
        rhs.report_interval = readDuration(node, "report_interval", "monitor.report_interval", rhs.report_interval);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.syncwatch = readLevel(node, "syncwatch", "logging.subsystem_levels.syncwatch", rhs.syncwatch);
        rhs.rpc       = readLevel(node, "rpc", "logging.subsystem_levels.rpc", rhs.rpc);
        rhs.notify    = readLevel(node, "notify", "logging.subsystem_levels.notify", rhs.notify);
        rhs.monitor   = readLevel(node, "monitor", "logging.subsystem_levels.monitor", rhs.monitor);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = readLevel(node, "console_log_level", "logging.console_log_level", rhs.console_log_level);
        rhs.file_log_level = readLevel(node, "file_log_level", "logging.file_log_level", rhs.file_log_level);
        rhs.log_file = readString(node, "log_file", "logging.log_file", rhs.log_file);
        if (const auto sub = node["subsystem_levels"]; sub && !sub.IsNull())
            if (!convert<SubsystemLogLevelsConfig>::decode(sub, rhs.subsystem_levels))
                throw ConfigError("logging.subsystem_levels", "expected a mapping");
        return true;
    }
};

}
