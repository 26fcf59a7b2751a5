#include <gtest/gtest.h>
#include <iostream>

#include "log/Registry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        dp::log::Registry::initForTesting();
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize dendrite test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
