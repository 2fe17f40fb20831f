#include <utility/temporary_directory.hpp>

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace Utility
{
    TemporaryDirectory::TemporaryDirectory()
        : TemporaryDirectory{std::filesystem::temp_directory_path() / "turboftp_tmpdir", true}
    {}

    TemporaryDirectory::TemporaryDirectory(std::filesystem::path basePath, bool removeBaseOnDestruction)
        : m_basePath{std::move(basePath)}
        , m_path{}
        , m_removeBase{removeBaseOnDestruction}
    {
        std::error_code ec;
        std::filesystem::create_directories(m_basePath, ec);
        if (ec)
            throw std::runtime_error("Could not create base directory: " + m_basePath.string() + ": " + ec.message());

        std::string dirNameAsString{(m_basePath / "dirXXXXXX").string()};
        const bool valid = mkdtemp(dirNameAsString.data()) && std::filesystem::is_directory(dirNameAsString);
        if (!valid)
            throw std::runtime_error(std::string{"Could not setup temporary directory in: "} + m_basePath.string());
        m_path = dirNameAsString;
    }

    TemporaryDirectory::~TemporaryDirectory()
    {
        std::error_code error;
        std::filesystem::remove_all(m_path, error);
        if (m_removeBase)
            std::filesystem::remove(m_basePath, error);
    }

    std::filesystem::path const& TemporaryDirectory::path() const
    {
        return m_path;
    }
}
