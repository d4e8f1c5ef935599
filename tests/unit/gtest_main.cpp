#include <gtest/gtest.h>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "util/paths.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        fdrop::paths::setLogPathForTesting();
        fdrop::config::ConfigRegistry::init(fdrop::config::Config{});
        fdrop::logging::LogRegistry::init(fdrop::paths::getLogDir());
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize FastDrop test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
