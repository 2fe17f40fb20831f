#pragma once

#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <fstream>

namespace Utility::Test
{
    class TemporaryDirectoryTests : public ::testing::Test
    {};

    TEST_F(TemporaryDirectoryTests, DirectoryExistsWhileAlive)
    {
        TemporaryDirectory directory{};
        EXPECT_TRUE(std::filesystem::is_directory(directory.path()));
    }

    TEST_F(TemporaryDirectoryTests, ContentIsRemovedOnDestruction)
    {
        std::filesystem::path path{};
        {
            TemporaryDirectory directory{};
            path = directory.path();
            std::filesystem::create_directories(path / "sub");
            std::ofstream{path / "sub" / "file.txt"} << "content";
        }
        EXPECT_FALSE(std::filesystem::exists(path));
    }

    TEST_F(TemporaryDirectoryTests, TwoDirectoriesAreDistinct)
    {
        TemporaryDirectory first{};
        TemporaryDirectory second{};
        EXPECT_NE(first.path().generic_string(), second.path().generic_string());
    }
}
