#include "avcparse/common/logger.hpp"

#include <gtest/gtest.h>

int main(int argc, char* argv[]) {
    testing::InitGoogleTest(&argc, argv);
    // Suites disabled with ENABLE_UNIT_TESTS 0 are prefixed with FILTERED_.
    if (testing::GTEST_FLAG(filter) == "*") {
        testing::GTEST_FLAG(filter) = "-FILTERED_*";
    }
    avcparse::logging::InitLogger(avcparse::logging::Level::WARNING);
    return RUN_ALL_TESTS();
}
