//----------------------------------------------------------------------------------------------------------------------
#include "Utilities/Logger.hpp"
//----------------------------------------------------------------------------------------------------------------------
#include <gtest/gtest.h>
//----------------------------------------------------------------------------------------------------------------------
#include <cstdint>
//----------------------------------------------------------------------------------------------------------------------

GTEST_API_ std::int32_t main(std::int32_t argc, char** argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    Logger::Initialize(spdlog::level::off, true);
    return RUN_ALL_TESTS();
}

//----------------------------------------------------------------------------------------------------------------------
