#include <ftp/curl_session.hpp>
#include <ftp/reply_parser.hpp>
#include <log/log.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <mutex>

namespace Ftp
{
    namespace
    {
        constexpr std::uint64_t minimumBufferSize = 1024;
        constexpr std::uint64_t maximumBufferSize = 512 * 1024;

        std::expected<void, FtpError> ensureCurlInitialized()
        {
            static std::once_flag onceFlag;
            static CURLcode initResult = CURLE_OK;
            std::call_once(onceFlag, []() {
                initResult = curl_global_init(CURL_GLOBAL_DEFAULT);
            });
            if (initResult != CURLE_OK)
            {
                return std::unexpected(FtpError{
                    .message = fmt::format("curl_global_init failed: {}", curl_easy_strerror(initResult)),
                    .curlCode = static_cast<int>(initResult),
                });
            }
            return {};
        }

        struct CallbackContext
        {
            std::vector<std::string>* replyLines;
            std::string* body;
            std::function<bool(std::string_view)> const* onData;
            std::uint64_t bytesDelivered;
            bool stoppedByReader;
        };

        std::size_t onHeaderData(char* buffer, std::size_t size, std::size_t nitems, void* userdata)
        {
            auto* context = static_cast<CallbackContext*>(userdata);
            const auto length = size * nitems;
            for (auto&& line : splitLines(std::string_view{buffer, length}))
                context->replyLines->push_back(std::move(line));
            return length;
        }

        std::size_t onBodyData(char* buffer, std::size_t size, std::size_t nitems, void* userdata)
        {
            auto* context = static_cast<CallbackContext*>(userdata);
            const auto length = size * nitems;
            if (context->onData != nullptr && *context->onData)
            {
                if (!(*context->onData)(std::string_view{buffer, length}))
                {
                    // A short count makes libcurl abort with CURLE_WRITE_ERROR.
                    context->stoppedByReader = true;
                    return 0;
                }
            }
            else
            {
                context->body->append(buffer, length);
            }
            context->bytesDelivered += length;
            return length;
        }
    }

    CurlSession::CurlSession(ServerEndpoint endpoint, Options options)
        : endpoint_{std::move(endpoint)}
        , options_{std::move(options)}
        , handle_{curl_easy_init(), curl_easy_cleanup}
        , currentDirectory_{"/"}
    {}

    CurlSession::~CurlSession()
    {
        close();
    }

    std::expected<std::unique_ptr<CurlSession>, FtpError>
    CurlSession::open(ServerEndpoint const& endpoint, Options options)
    {
        if (auto result = ensureCurlInitialized(); !result)
            return std::unexpected(result.error());

        if (endpoint.host.empty())
            return std::unexpected(FtpError{.message = "No host given"});

        auto session = std::unique_ptr<CurlSession>{new CurlSession(endpoint, std::move(options))};
        if (!session->handle_)
            return std::unexpected(FtpError{.message = "curl_easy_init failed"});

        Log::debug("Connecting to ftp://{}:{} as '{}'.", endpoint.host, endpoint.port, endpoint.username);

        // Login only. libcurl asks for PWD after login and remembers the answer as the entry path.
        auto login = session->perform(PerformOptions{
            .path = "",
            .pathIsDirectory = true,
            .enterDirectory = false,
            .noBody = true,
        });
        if (!login)
        {
            Log::warn("Login to {}:{} failed: {}", endpoint.host, endpoint.port, login.error().toString());
            return std::unexpected(login.error());
        }

        char* entryPath = nullptr;
        if (curl_easy_getinfo(session->handle_.get(), CURLINFO_FTP_ENTRY_PATH, &entryPath) == CURLE_OK &&
            entryPath != nullptr)
        {
            session->currentDirectory_ = resolvePath("/", entryPath);
        }

        Log::debug("Connected to {}:{}, entry directory is '{}'.", endpoint.host, endpoint.port, session->currentDirectory_);
        return session;
    }

    std::expected<void, FtpError>
    transferOutcome(CURLcode code, bool stoppedByReader, std::string_view errorText, long responseCode)
    {
        if (code == CURLE_OK || (code == CURLE_WRITE_ERROR && stoppedByReader))
            return {};

        return std::unexpected(FtpError{
            .message = errorText.empty() ? std::string{curl_easy_strerror(code)} : std::string{errorText},
            .curlCode = static_cast<int>(code),
            .responseCode = responseCode,
        });
    }

    std::expected<CurlSession::PerformResult, FtpError> CurlSession::perform(PerformOptions const& performOptions)
    {
        if (!handle_)
            return std::unexpected(FtpError{.message = "Session is closed"});

        CURL* curl = handle_.get();
        // Keeps the live connection, forgets all options.
        curl_easy_reset(curl);

        PerformResult result{};
        CallbackContext context{
            .replyLines = &result.replyLines,
            .body = &result.body,
            .onData = performOptions.onData ? &performOptions.onData : nullptr,
            .bytesDelivered = 0,
            .stoppedByReader = false,
        };

        std::string errorBuffer(CURL_ERROR_SIZE, '\0');
        const auto url = makeUrl(endpoint_.host, endpoint_.port, performOptions.path, performOptions.pathIsDirectory);
        const auto timeoutSeconds = static_cast<long>(options_.timeout.count());

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errorBuffer.data());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_USERNAME, endpoint_.username.c_str());
        curl_easy_setopt(curl, CURLOPT_PASSWORD, endpoint_.password.c_str());
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, timeoutSeconds);
        curl_easy_setopt(curl, CURLOPT_SERVER_RESPONSE_TIMEOUT, timeoutSeconds);
        // Stalled transfers: less than 1 byte per second for the timeout duration.
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, timeoutSeconds);
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(
            curl,
            CURLOPT_FTP_FILEMETHOD,
            static_cast<long>(performOptions.enterDirectory ? CURLFTPMETHOD_SINGLECWD : CURLFTPMETHOD_NOCWD));

        if (!endpoint_.passiveMode)
            curl_easy_setopt(curl, CURLOPT_FTPPORT, "-");

        if (endpoint_.useEncryptedTransport)
        {
            curl_easy_setopt(curl, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
            curl_easy_setopt(curl, CURLOPT_FTPSSLAUTH, static_cast<long>(CURLFTPAUTH_TLS));
        }
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, options_.verifyPeer ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, options_.verifyPeer ? 2L : 0L);

        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, onHeaderData);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &context);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, onBodyData);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &context);

        std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> quote{nullptr, curl_slist_free_all};
        for (auto const& command : performOptions.quoteCommands)
        {
            auto* appended = curl_slist_append(quote.get(), command.c_str());
            if (appended == nullptr)
                return std::unexpected(FtpError{.message = "curl_slist_append failed"});
            quote.release();
            quote.reset(appended);
        }
        if (quote)
            curl_easy_setopt(curl, CURLOPT_QUOTE, quote.get());

        if (!performOptions.customRequest.empty())
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, performOptions.customRequest.c_str());
        if (performOptions.namesOnly)
            curl_easy_setopt(curl, CURLOPT_DIRLISTONLY, 1L);
        if (performOptions.noBody)
            curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);

        if (performOptions.onData)
        {
            curl_easy_setopt(curl, CURLOPT_TRANSFERTEXT, 0L);
            // No SIZE before RETR, the caller decides what the length is.
            curl_easy_setopt(curl, CURLOPT_IGNORE_CONTENT_LENGTH, 1L);
            curl_easy_setopt(
                curl,
                CURLOPT_BUFFERSIZE,
                static_cast<long>(std::clamp(options_.blockSize, minimumBufferSize, maximumBufferSize)));
            if (performOptions.resumeFrom > 0)
                curl_easy_setopt(curl, CURLOPT_RESUME_FROM_LARGE, static_cast<curl_off_t>(performOptions.resumeFrom));
        }

        const CURLcode code = curl_easy_perform(curl);

        result.bytesDelivered = context.bytesDelivered;
        result.stoppedByReader = context.stoppedByReader;

        long responseCode = 0;
        if (code != CURLE_OK)
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &responseCode);
        errorBuffer.resize(std::char_traits<char>::length(errorBuffer.c_str()));

        if (auto outcome = transferOutcome(code, context.stoppedByReader, errorBuffer, responseCode); !outcome)
            return std::unexpected(std::move(outcome).error());
        return result;
    }

    std::expected<CurlSession::PerformResult, FtpError> CurlSession::runCommand(std::string const& command)
    {
        Log::trace("FTP command: {}", command);
        return perform(PerformOptions{
            .path = currentDirectory_,
            .pathIsDirectory = true,
            .enterDirectory = false,
            .quoteCommands = {command},
            .noBody = true,
        });
    }

    std::expected<std::string, FtpError> CurlSession::printWorkingDirectory()
    {
        // The server directory may have been moved by earlier requests, so it is re-entered first.
        auto result = perform(PerformOptions{
            .path = currentDirectory_,
            .pathIsDirectory = true,
            .enterDirectory = false,
            .quoteCommands = {"CWD " + currentDirectory_, "PWD"},
            .noBody = true,
        });
        if (!result)
            return std::unexpected(result.error());

        auto directory = parsePrintWorkingDirectoryReply(result->replyLines);
        if (!directory)
            return std::unexpected(FtpError{.message = "Unexpected reply to PWD"});

        currentDirectory_ = resolvePath("/", *directory);
        return currentDirectory_;
    }

    std::expected<void, FtpError> CurlSession::changeDirectory(std::string const& path)
    {
        const auto target = resolvePath(currentDirectory_, path);
        auto result = runCommand("CWD " + target);
        if (!result)
            return std::unexpected(result.error());

        currentDirectory_ = target;
        return {};
    }

    std::expected<std::uint64_t, FtpError> CurlSession::size(std::string const& path)
    {
        auto result = runCommand("SIZE " + resolvePath(currentDirectory_, path));
        if (!result)
            return std::unexpected(result.error());

        auto size = parseSizeReply(result->replyLines);
        if (!size)
            return std::unexpected(FtpError{.message = "Unexpected reply to SIZE"});
        return *size;
    }

    std::expected<void, FtpError> CurlSession::enableStructuredListing()
    {
        auto result = runCommand("OPTS MLST type;size;modify;");
        if (!result)
            return std::unexpected(result.error());
        return {};
    }

    std::expected<std::vector<std::string>, FtpError> CurlSession::listStructured()
    {
        auto result = perform(PerformOptions{
            .path = currentDirectory_,
            .pathIsDirectory = true,
            .enterDirectory = true,
            .customRequest = "MLSD",
        });
        if (!result)
            return std::unexpected(result.error());
        return splitLines(result->body);
    }

    std::expected<std::vector<std::string>, FtpError> CurlSession::listNames()
    {
        auto result = perform(PerformOptions{
            .path = currentDirectory_,
            .pathIsDirectory = true,
            .enterDirectory = true,
            .namesOnly = true,
        });
        if (!result)
            return std::unexpected(result.error());
        return splitLines(result->body);
    }

    std::expected<RetrieveResult, FtpError> CurlSession::retrieve(
        std::string const& remotePath,
        std::uint64_t offset,
        std::function<bool(std::string_view data)> onData)
    {
        if (!onData)
            return std::unexpected(FtpError{.message = "No data callback given"});

        auto result = perform(PerformOptions{
            .path = resolvePath(currentDirectory_, remotePath),
            .pathIsDirectory = false,
            .enterDirectory = false,
            .resumeFrom = offset,
            .onData = std::move(onData),
        });
        if (!result)
            return std::unexpected(result.error());

        return RetrieveResult{
            .bytesDelivered = result->bytesDelivered,
            .stoppedByReader = result->stoppedByReader,
        };
    }

    void CurlSession::close()
    {
        if (handle_)
        {
            Log::debug("Closing connection to {}:{}.", endpoint_.host, endpoint_.port);
            handle_.reset();
        }
    }

    bool CurlSession::isOpen() const
    {
        return static_cast<bool>(handle_);
    }
}
