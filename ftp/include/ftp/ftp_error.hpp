#pragma once

#include <fmt/format.h>

#include <string>

namespace Ftp
{
    struct FtpError
    {
        std::string message;
        // CURLcode of the failed call, 0 when the error did not come from libcurl.
        int curlCode = 0;
        // Last FTP reply code seen on the control connection, 0 if none.
        long responseCode = 0;

        inline std::string toString() const
        {
            return fmt::format(
                "FtpError: message: {}, curlCode: {}, responseCode: {}", message, curlCode, responseCode);
        }
    };
}
