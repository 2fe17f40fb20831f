#pragma once

#include "fake_ftp_server.hpp"

#include <backend/transfer_engine_options.hpp>
#include <ftp/server_endpoint.hpp>
#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <string>
#include <vector>

namespace Test
{
    class CommonFixture : public ::testing::Test
    {
      protected:
        /**
         * @brief Engine options that record retry delays instead of sleeping.
         */
        TransferEngineOptions makeOptions()
        {
            TransferEngineOptions options{};
            options.sleeper = [this](std::chrono::milliseconds delay) {
                std::scoped_lock lock{sleepMutex_};
                sleeps_.push_back(delay);
            };
            return options;
        }

        std::vector<std::chrono::milliseconds> sleeps()
        {
            std::scoped_lock lock{sleepMutex_};
            return sleeps_;
        }

        static std::string makeContent(std::size_t size)
        {
            std::string content(size, '\0');
            for (std::size_t i = 0; i != size; ++i)
                content[i] = static_cast<char>((i * 131 + i / 257) % 251);
            return content;
        }

        static std::string readFile(std::filesystem::path const& path)
        {
            std::ifstream file{path, std::ios::binary};
            return std::string{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
        }

        static void writeFile(std::filesystem::path const& path, std::string const& content)
        {
            std::ofstream file{path, std::ios::binary | std::ios::trunc};
            file.write(content.data(), static_cast<std::streamsize>(content.size()));
        }

        std::filesystem::path localPath(std::string const& name) const
        {
            return tempDir_.path() / name;
        }

      protected:
        Utility::TemporaryDirectory tempDir_{};
        FakeFtpServer server_{};
        Ftp::ServerEndpoint endpoint_{.host = "ftp.test.invalid"};

      private:
        std::mutex sleepMutex_{};
        std::vector<std::chrono::milliseconds> sleeps_{};
    };
}
