#include <ftp/reply_parser.hpp>

#include <boost/algorithm/string/predicate.hpp>
#include <curl/curl.h>
#include <fmt/format.h>

#include <charconv>
#include <memory>
#include <ranges>

namespace Ftp
{
    std::vector<std::string> splitLines(std::string_view text)
    {
        std::vector<std::string> lines{};
        std::size_t pos = 0;
        while (pos < text.size())
        {
            auto end = text.find('\n', pos);
            if (end == std::string_view::npos)
                end = text.size();

            auto line = text.substr(pos, end - pos);
            while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
                line.remove_suffix(1);
            if (!line.empty())
                lines.emplace_back(line);

            pos = end + 1;
        }
        return lines;
    }

    std::optional<std::string> parsePrintWorkingDirectoryReply(std::vector<std::string> const& replyLines)
    {
        // 257 "/some/dir" is the current directory
        for (auto const& line : replyLines | std::views::reverse)
        {
            if (!boost::algorithm::starts_with(line, "257"))
                continue;

            const auto open = line.find('"');
            if (open == std::string::npos)
                continue;

            std::string directory{};
            for (std::size_t i = open + 1; i < line.size(); ++i)
            {
                if (line[i] == '"')
                {
                    if (i + 1 < line.size() && line[i + 1] == '"')
                    {
                        directory.push_back('"');
                        ++i;
                        continue;
                    }
                    if (directory.empty())
                        break;
                    return directory;
                }
                directory.push_back(line[i]);
            }
        }
        return std::nullopt;
    }

    std::optional<std::uint64_t> parseSizeReply(std::vector<std::string> const& replyLines)
    {
        for (auto const& line : replyLines | std::views::reverse)
        {
            if (!boost::algorithm::starts_with(line, "213 "))
                continue;

            auto digits = std::string_view{line}.substr(4);
            while (!digits.empty() && digits.front() == ' ')
                digits.remove_prefix(1);

            std::uint64_t value = 0;
            const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
            if (ec != std::errc{} || ptr == digits.data())
                continue;
            return value;
        }
        return std::nullopt;
    }

    std::string resolvePath(std::string const& currentDirectory, std::string const& path)
    {
        std::vector<std::string_view> components{};
        auto push = [&components](std::string_view full) {
            for (auto part : full | std::views::split('/'))
            {
                const std::string_view component{part.begin(), part.end()};
                if (component.empty() || component == ".")
                    continue;
                if (component == "..")
                {
                    if (!components.empty())
                        components.pop_back();
                    continue;
                }
                components.push_back(component);
            }
        };

        if (path.empty() || path.front() != '/')
            push(currentDirectory);
        push(path);

        std::string result{};
        for (auto const& component : components)
        {
            result.push_back('/');
            result.append(component);
        }
        if (result.empty())
            result = "/";
        return result;
    }

    std::string makeUrl(std::string const& host, int port, std::string const& path, bool isDirectory)
    {
        const bool bracketed = host.find(':') != std::string::npos && !host.starts_with('[');
        auto url = fmt::format("ftp://{}{}{}:{}/", bracketed ? "[" : "", host, bracketed ? "]" : "", port);
        if (path.empty())
            return url;

        url += "%2F";
        bool first = true;
        for (auto part : std::string_view{path} | std::views::split('/'))
        {
            const std::string_view component{part.begin(), part.end()};
            if (component.empty())
                continue;

            std::unique_ptr<char, decltype(&curl_free)> escaped{
                curl_easy_escape(nullptr, component.data(), static_cast<int>(component.size())), curl_free};
            if (!first)
                url += '/';
            url += escaped ? std::string{escaped.get()} : std::string{component};
            first = false;
        }
        if (isDirectory)
            url += '/';
        return url;
    }
}
