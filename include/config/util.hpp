#pragma once

#include "config/Config.hpp"
#include "util/duration.hpp"

#include <charconv>
#include <cstdint>
#include <string>
#include <string_view>
#include <fmt/format.h>

namespace sw::config {

inline util::Duration parseDurationOption(const std::string& option, const std::string& str) {
    try {
        return util::parseDuration(str);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(option, e.what());
    }
}

// Whole-string signed decimal, an optional leading '+' or '-' allowed.
inline int64_t parseIntOption(const std::string& option, const std::string& str) {
    std::string_view digits = str;
    if (!digits.empty() && digits.front() == '+') digits.remove_prefix(1);

    int64_t value = 0;
    const auto* end = digits.data() + digits.size();
    const auto [ptr, ec] = std::from_chars(digits.data(), end, value);

    if (digits.empty() || ec != std::errc() || ptr != end)
        throw ConfigError(option, fmt::format("invalid integer \"{}\"", str));

    return value;
}

inline spdlog::level::level_enum parseLevelOption(const std::string& option, const std::string& str) {
    const auto lvl = spdlog::level::from_str(str);
    if (lvl == spdlog::level::off && str != "off")
        throw ConfigError(option, fmt::format("unknown log level \"{}\"", str));
    return lvl;
}

}
