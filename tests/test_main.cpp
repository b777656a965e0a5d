#include <gtest/gtest.h>

#include "utils.hpp"

int main(int argc, char** argv) {
    ENABLE_FILE_LOGGING = false;
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
