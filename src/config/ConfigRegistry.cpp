#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace sw::config {

const Config& ConfigRegistry::init(const std::optional<std::filesystem::path>& path, const EnvLookup& env) {
    std::lock_guard lock(mutex_);
    if (!config_) config_ = resolveConfig(path, env);
    return *config_;
}

const Config& ConfigRegistry::get() {
    std::lock_guard lock(mutex_);
    if (!config_) throw std::logic_error("[ConfigRegistry] config requested before ConfigRegistry::init()");
    return *config_;
}

} // namespace sw::config
