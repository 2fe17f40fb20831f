#include <backend/listing_parser.hpp>
#include <utility/algorithm/case_convert.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

namespace
{
    bool isDecimal(std::string_view value)
    {
        return !value.empty() && std::all_of(value.begin(), value.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        });
    }
}

std::optional<SharedData::DirectoryEntry> parseStructuredListingLine(std::string_view line)
{
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.remove_suffix(1);

    const auto separator = line.find(' ');
    if (separator == std::string_view::npos)
        return std::nullopt;

    const auto facts = line.substr(0, separator);
    const auto name = line.substr(separator + 1);
    if (name.empty() || name == "." || name == "..")
        return std::nullopt;

    SharedData::DirectoryEntry entry{.name = std::string{name}};

    std::size_t pos = 0;
    while (pos < facts.size())
    {
        auto end = facts.find(';', pos);
        if (end == std::string_view::npos)
            end = facts.size();

        const auto fact = facts.substr(pos, end - pos);
        pos = end + 1;

        const auto equals = fact.find('=');
        if (equals == std::string_view::npos)
            continue;

        const auto key = Utility::Algorithm::toLowerCase(std::string{fact.substr(0, equals)});
        const auto value = fact.substr(equals + 1);

        if (key == "type")
        {
            const auto type = Utility::Algorithm::toLowerCase(std::string{value});
            if (type == "cdir" || type == "pdir")
                return std::nullopt;
            entry.kind = type == "dir" ? SharedData::EntryKind::Directory : SharedData::EntryKind::File;
        }
        else if (key == "size")
        {
            std::uint64_t size = 0;
            if (isDecimal(value))
            {
                const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), size);
                if (ec == std::errc{})
                    entry.size = size;
            }
        }
        else if (key == "modify")
        {
            if (!value.empty())
                entry.modifiedTimestamp = std::string{value};
        }
    }

    if (entry.isDirectory())
        entry.size = std::nullopt;

    return entry;
}

std::string_view nameOfListedPath(std::string_view listed)
{
    while (!listed.empty() && (listed.back() == '\r' || listed.back() == '\n' || listed.back() == '/'))
        listed.remove_suffix(1);

    const auto slash = listed.rfind('/');
    if (slash != std::string_view::npos)
        listed.remove_prefix(slash + 1);
    return listed;
}
