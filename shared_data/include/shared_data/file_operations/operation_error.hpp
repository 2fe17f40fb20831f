#pragma once

#include <shared_data/file_operations/operation_error_type.hpp>
#include <ftp/ftp_error.hpp>
#include <utility/enum_string_convert.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <optional>
#include <string>
#include <vector>

namespace SharedData
{
    struct OperationError
    {
        OperationErrorType type;
        std::optional<Ftp::FtpError> ftpError = std::nullopt;
        std::optional<std::string> extraInfo = std::nullopt;
        // How many attempts were made before giving up, 0 if the operation was not retried.
        int attempts = 0;
        // Segments that exhausted their retries (PartialFailure only).
        std::vector<int> failedSegments = {};

        /**
         * @brief Errors that originate from the server or the network and may be cured by trying again.
         */
        bool isTransient() const
        {
            return ftpError.has_value() || type == OperationErrorType::ShortTransfer;
        }

        std::string toString() const
        {
            std::string result = Utility::enumToString(type, "INVALID_ENUM_VALUE");
            if (attempts > 0)
                result += fmt::format(" after {} attempt(s)", attempts);
            if (!failedSegments.empty())
                result += fmt::format(", failed segments: [{}]", fmt::join(failedSegments, ", "));
            if (ftpError)
                result += fmt::format(": {}", ftpError->toString());
            if (extraInfo)
                result += fmt::format(". {}", *extraInfo);
            return result + ".";
        }
    };
}
