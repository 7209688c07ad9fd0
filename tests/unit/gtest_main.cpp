#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>
#include <paths.hpp>

#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        sdbx::paths::setLogPathForTesting();
        // No config file: every test runs against the built-in defaults
        sdbx::config::ConfigRegistry::init(fs::temp_directory_path() / "sisyphosdbx_test_no_config.yaml");
        sdbx::log::Registry::init(sdbx::paths::getLogPath());
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize SisyphosDBX test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
