#include <gtest/gtest.h>
#include "logger.hpp"

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    Logger::instance().setLevel(LOG_QUIET);
    return RUN_ALL_TESTS();
}
