#pragma once

#include <filesystem>

namespace Utility
{
    /**
     * @brief Creates a unique directory below a base directory and removes it with all content on destruction.
     */
    class TemporaryDirectory
    {
      public:
        TemporaryDirectory();
        TemporaryDirectory(std::filesystem::path basePath, bool removeBaseOnDestruction);
        ~TemporaryDirectory();

        TemporaryDirectory(TemporaryDirectory const&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory const&) = delete;

        TemporaryDirectory(TemporaryDirectory&&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory&&) = delete;

        std::filesystem::path const& path() const;

      private:
        std::filesystem::path m_basePath;
        std::filesystem::path m_path;
        bool m_removeBase;
    };
}
