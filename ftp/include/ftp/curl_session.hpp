#pragma once

#include <ftp/server_endpoint.hpp>
#include <ftp/session_interface.hpp>

#include <curl/curl.h>

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace Ftp
{
    /**
     * @brief Turns the result of curl_easy_perform into success or an FtpError. A write error caused by the data
     * callback asking to stop counts as success.
     *
     * @param errorText Contents of the libcurl error buffer, may be empty.
     * @param responseCode Last reply code from the control connection.
     */
    std::expected<void, FtpError>
    transferOutcome(CURLcode code, bool stoppedByReader, std::string_view errorText, long responseCode);

    /**
     * @brief ISession implemented on a libcurl easy handle. libcurl keeps the control connection alive between
     * performs, so each call reuses the same login.
     */
    class CurlSession : public ISession
    {
      public:
        struct Options
        {
            std::chrono::seconds timeout{15};
            // Receive buffer size hint, clamped by libcurl limits.
            std::uint64_t blockSize{64 * 1024};
            bool verifyPeer{true};
        };

        /**
         * @brief Connects and logs in.
         *
         * @return std::expected<std::unique_ptr<CurlSession>, FtpError> An open session or why it could not be opened.
         */
        static std::expected<std::unique_ptr<CurlSession>, FtpError> open(ServerEndpoint const& endpoint, Options options);

        ~CurlSession() override;
        CurlSession(CurlSession const&) = delete;
        CurlSession& operator=(CurlSession const&) = delete;
        CurlSession(CurlSession&&) = delete;
        CurlSession& operator=(CurlSession&&) = delete;

        std::expected<std::string, FtpError> printWorkingDirectory() override;
        std::expected<void, FtpError> changeDirectory(std::string const& path) override;
        std::expected<std::uint64_t, FtpError> size(std::string const& path) override;
        std::expected<void, FtpError> enableStructuredListing() override;
        std::expected<std::vector<std::string>, FtpError> listStructured() override;
        std::expected<std::vector<std::string>, FtpError> listNames() override;
        std::expected<RetrieveResult, FtpError> retrieve(
            std::string const& remotePath,
            std::uint64_t offset,
            std::function<bool(std::string_view data)> onData) override;
        void close() override;
        bool isOpen() const override;

      private:
        CurlSession(ServerEndpoint endpoint, Options options);

        struct PerformOptions
        {
            // Path the URL points at, always absolute.
            std::string path{"/"};
            bool pathIsDirectory{true};
            // Let libcurl enter the directory of the path before the request.
            bool enterDirectory{false};
            std::vector<std::string> quoteCommands{};
            std::string customRequest{};
            bool namesOnly{false};
            bool noBody{false};
            std::uint64_t resumeFrom{0};
            std::function<bool(std::string_view data)> onData{};
        };

        struct PerformResult
        {
            std::vector<std::string> replyLines{};
            std::string body{};
            std::uint64_t bytesDelivered{0};
            bool stoppedByReader{false};
        };

        std::expected<PerformResult, FtpError> perform(PerformOptions const& performOptions);
        std::expected<PerformResult, FtpError> runCommand(std::string const& command);

      private:
        ServerEndpoint endpoint_;
        Options options_;
        std::unique_ptr<CURL, void (*)(CURL*)> handle_;
        std::string currentDirectory_;
    };
}
