#pragma once

#include <shared_data/directory_entry.hpp>

#include <optional>
#include <string_view>

/**
 * @brief Parses one line of a structured listing (MLSD), "fact=value;fact=value; name".
 *
 * Fact names are case-insensitive. A missing type counts as file, a size that is not a plain decimal number is
 * unknown. Directories never carry a size.
 *
 * @return The entry, or nullopt for the current/parent directory entries and lines without a name.
 */
std::optional<SharedData::DirectoryEntry> parseStructuredListingLine(std::string_view line);

/**
 * @brief Strips a name-only listing (NLST) line down to the bare entry name. Some servers prefix the directory.
 */
std::string_view nameOfListedPath(std::string_view listed);
