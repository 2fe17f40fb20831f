#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace SharedData
{
    enum class EntryKind : std::uint8_t
    {
        File = 0,
        Directory = 1,
    };

    struct DirectoryEntry
    {
        using EntryKind = SharedData::EntryKind;

        std::string name{};
        EntryKind kind{EntryKind::File};
        // Unknown for directories and for servers that did not report a (numeric) size.
        std::optional<std::uint64_t> size{std::nullopt};
        // As sent in the "modify" fact: YYYYMMDDhhmmss[.sss]
        std::optional<std::string> modifiedTimestamp{std::nullopt};

        bool isDirectory() const
        {
            return kind == EntryKind::Directory;
        }
        bool isRegularFile() const
        {
            return kind == EntryKind::File;
        }
    };

    /**
     * @brief Listing order: directories before files, each group by case-insensitive name.
     */
    bool listingOrder(DirectoryEntry const& lhs, DirectoryEntry const& rhs);
}
