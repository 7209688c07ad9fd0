#include "config/ConfigRegistry.hpp"

#include <stdexcept>

using namespace sdbx::config;

void ConfigRegistry::init(const std::filesystem::path& path) {
    std::call_once(init_flag_, [&] {
        config_ = loadConfig(path);
        source_ = path;
        initialized_ = true;
    });
}

const Config& ConfigRegistry::get() {
    if (!initialized_)
        throw std::logic_error("Settings read before ConfigRegistry::init(), cannot continue");
    return config_;
}
