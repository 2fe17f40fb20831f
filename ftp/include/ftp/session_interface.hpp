#pragma once

#include <ftp/ftp_error.hpp>

#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace Ftp
{
    struct RetrieveResult
    {
        // Bytes handed to the data callback.
        std::uint64_t bytesDelivered{0};
        // True if the data callback asked to stop before the server finished sending.
        bool stoppedByReader{false};
    };

    /**
     * @brief An authenticated FTP control connection. All calls block. A session is used by one thread at a time.
     */
    class ISession
    {
      public:
        ISession() = default;
        virtual ~ISession() = default;
        ISession(ISession const&) = default;
        ISession& operator=(ISession const&) = default;
        ISession(ISession&&) = default;
        ISession& operator=(ISession&&) = default;

        /**
         * @brief Asks the server for its working directory (PWD).
         *
         * @return std::expected<std::string, FtpError> The absolute directory or an error.
         */
        virtual std::expected<std::string, FtpError> printWorkingDirectory() = 0;

        /**
         * @brief Enters a directory (CWD). Relative paths are relative to the current directory.
         */
        virtual std::expected<void, FtpError> changeDirectory(std::string const& path) = 0;

        /**
         * @brief Queries the size of a file (SIZE).
         */
        virtual std::expected<std::uint64_t, FtpError> size(std::string const& path) = 0;

        /**
         * @brief Capability check for structured listings (OPTS MLST type;size;modify;). An error means the server
         * does not support MLSD.
         */
        virtual std::expected<void, FtpError> enableStructuredListing() = 0;

        /**
         * @brief Lists the current directory with MLSD.
         *
         * @return std::expected<std::vector<std::string>, FtpError> One raw "facts; name" line per entry.
         */
        virtual std::expected<std::vector<std::string>, FtpError> listStructured() = 0;

        /**
         * @brief Lists the names in the current directory with NLST.
         */
        virtual std::expected<std::vector<std::string>, FtpError> listNames() = 0;

        /**
         * @brief Binary retrieval of a file starting at a byte offset (TYPE I, REST, RETR).
         *
         * @param remotePath The file to retrieve.
         * @param offset Where to start. 0 issues no REST.
         * @param onData Called for every received block. Return false to stop the transfer early, in that case the
         * data connection is torn down and the result reports stoppedByReader.
         * @return std::expected<RetrieveResult, FtpError>
         */
        virtual std::expected<RetrieveResult, FtpError> retrieve(
            std::string const& remotePath,
            std::uint64_t offset,
            std::function<bool(std::string_view data)> onData) = 0;

        /**
         * @brief Closes the control connection. The session is unusable afterwards. Closing twice is harmless.
         */
        virtual void close() = 0;

        virtual bool isOpen() const = 0;
    };
}
