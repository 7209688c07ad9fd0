#pragma once

#include "config/Config.hpp"

#include <mutex>
#include <paths.hpp>

namespace sdbx::config {

// Process-wide application settings. The first init() wins.
class ConfigRegistry {
public:
    static void init(const std::filesystem::path& path = paths::getConfigPath());

    static const Config& get();

    [[nodiscard]] static bool isInitialized() { return initialized_; }

    // File the settings were read from; it need not exist.
    [[nodiscard]] static const std::filesystem::path& source() { return source_; }

private:
    static inline Config config_;
    static inline std::filesystem::path source_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

}
