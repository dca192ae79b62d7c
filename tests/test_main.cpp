/**
 * @file test_main.cpp
 * @brief GoogleTest main entry point
 *
 * This file provides the main() function for running all GoogleTest tests.
 * Each test file registers its tests automatically via the TEST() macro.
 *
 * Build: cmake --build . --target composer_tests
 * Run:   ./composer_tests
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>

#include "composer/Logging.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    // Skipped-entry warnings are expected in several tests
    composer::set_log_level("error");
    return RUN_ALL_TESTS();
}
