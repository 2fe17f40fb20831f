#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Ftp
{
    /**
     * @brief Splits text received from the server into lines, dropping CR/LF and empty lines.
     */
    std::vector<std::string> splitLines(std::string_view text);

    /**
     * @brief Finds the directory in a 257 reply to PWD. Doubled quotes inside the name are unescaped.
     *
     * @param replyLines All control connection lines seen during the command.
     */
    std::optional<std::string> parsePrintWorkingDirectoryReply(std::vector<std::string> const& replyLines);

    /**
     * @brief Finds the byte count in a 213 reply to SIZE.
     */
    std::optional<std::uint64_t> parseSizeReply(std::vector<std::string> const& replyLines);

    /**
     * @brief Lexically resolves a path against a directory. The result is absolute, uses '/' and has no "." or ".."
     * components. ".." at the root stays at the root.
     */
    std::string resolvePath(std::string const& currentDirectory, std::string const& path);

    /**
     * @brief Builds the ftp:// URL libcurl is given for a path. Components are percent-escaped and a leading %2F
     * keeps the path absolute instead of relative to the login directory. An empty path addresses the login
     * directory. IPv6 hosts are put in brackets.
     */
    std::string makeUrl(std::string const& host, int port, std::string const& path, bool isDirectory);
}
