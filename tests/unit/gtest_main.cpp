#include <gtest/gtest.h>
#include <iostream>

#include "log/Registry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        lc::log::Registry::initForTesting();
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize labcourier test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
