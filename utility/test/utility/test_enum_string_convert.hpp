#pragma once

#include <utility/enum_string_convert.hpp>

#include <gtest/gtest.h>

#include <stdexcept>

namespace Utility::Test
{
    BOOST_DEFINE_ENUM_CLASS(TestMode, Passive, Active);

    class EnumStringConvertTests : public ::testing::Test
    {};

    TEST_F(EnumStringConvertTests, EnumToStringYieldsName)
    {
        EXPECT_EQ(enumToString(TestMode::Passive), "Passive");
        EXPECT_EQ(enumToString(TestMode::Active), "Active");
    }

    TEST_F(EnumStringConvertTests, InvalidValueThrowsOrFallsBack)
    {
        const auto invalid = static_cast<TestMode>(42);
        EXPECT_THROW(enumToString(invalid), std::invalid_argument);
        EXPECT_EQ(enumToString(invalid, "Unknown"), "Unknown");
    }

    TEST_F(EnumStringConvertTests, EnumFromStringParsesNames)
    {
        EXPECT_EQ(enumFromString<TestMode>("Active"), TestMode::Active);
        EXPECT_THROW(enumFromString<TestMode>("active"), std::invalid_argument);
    }
}
