#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>
#include <optional>

namespace sw::config {

class ConfigRegistry {
public:
    // Resolves file + environment on the first call; later calls return that same Config.
    // A failed resolve leaves the registry empty, so init() may be retried.
    static const Config& init(const std::optional<std::filesystem::path>& path, const EnvLookup& env = processEnv);

    static const Config& get();

private:
    static inline std::optional<Config> config_;
    static inline std::mutex mutex_;
};

} // namespace sw::config
