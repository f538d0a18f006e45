#include "test_directory_entry.hpp"
#include "test_error.hpp"
#include "test_transfer_result.hpp"

#include <gtest/gtest.h>

int main(int argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
