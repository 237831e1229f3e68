#include <gtest/gtest.h>

#include "sde.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Enable fail-fast
    GTEST_FLAG_SET(fail_fast, true);

    // apply the library configuration to the main thread
    auto lifecycle = sde::initialize();

    return RUN_ALL_TESTS();
}
