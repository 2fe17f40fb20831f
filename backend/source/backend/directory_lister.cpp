#include <backend/directory_lister.hpp>
#include <backend/listing_parser.hpp>
#include <ftp/reply_parser.hpp>
#include <log/log.hpp>

#include <algorithm>

DirectoryLister::DirectoryLister(RetryPolicy retryPolicy)
    : retryPolicy_{std::move(retryPolicy)}
{}

std::expected<std::vector<SharedData::DirectoryEntry>, DirectoryLister::Error>
DirectoryLister::list(Ftp::ISession& session, std::string const& path) const
{
    // Every attempt enters the same directory, no matter where a failed attempt left the session.
    const auto absolutePath =
        path.starts_with('/') ? Ftp::resolvePath("/", path) : Ftp::resolvePath(currentDirectory(session), path);

    auto result = retryPolicy_.run("DirectoryLister", [&](int) {
        return listOnce(session, absolutePath);
    });
    if (!result)
        return result;

    Log::info("DirectoryLister: '{}' has {} entries.", absolutePath, result->size());
    return result;
}

std::string DirectoryLister::currentDirectory(Ftp::ISession& session) const
{
    auto directory = session.printWorkingDirectory();
    if (!directory)
    {
        Log::warn("DirectoryLister: PWD failed, assuming '/': {}", directory.error().toString());
        return "/";
    }
    return std::move(directory).value();
}

std::expected<std::vector<SharedData::DirectoryEntry>, DirectoryLister::Error>
DirectoryLister::listOnce(Ftp::ISession& session, std::string const& path) const
{
    if (auto changed = session.changeDirectory(path); !changed)
    {
        return std::unexpected(Error{
            .type = ErrorType::ProtocolError,
            .ftpError = changed.error(),
            .extraInfo = "Cannot enter '" + path + "'",
        });
    }

    std::expected<std::vector<SharedData::DirectoryEntry>, Error> entries{};
    if (auto structured = session.enableStructuredListing(); structured)
    {
        entries = listStructured(session);
    }
    else
    {
        Log::debug("DirectoryLister: No structured listing support, falling back to NLST: {}", structured.error().message);
        entries = listByNames(session);
    }

    if (entries)
        std::sort(entries->begin(), entries->end(), SharedData::listingOrder);
    return entries;
}

std::expected<std::vector<SharedData::DirectoryEntry>, DirectoryLister::Error>
DirectoryLister::listStructured(Ftp::ISession& session) const
{
    auto lines = session.listStructured();
    if (!lines)
    {
        return std::unexpected(Error{
            .type = ErrorType::ProtocolError,
            .ftpError = lines.error(),
            .extraInfo = "MLSD failed",
        });
    }

    std::vector<SharedData::DirectoryEntry> entries{};
    entries.reserve(lines->size());
    for (auto const& line : *lines)
    {
        if (auto entry = parseStructuredListingLine(line); entry)
            entries.push_back(std::move(entry).value());
        else
            Log::trace("DirectoryLister: Skipping listing line '{}'.", line);
    }
    return entries;
}

std::expected<std::vector<SharedData::DirectoryEntry>, DirectoryLister::Error>
DirectoryLister::listByNames(Ftp::ISession& session) const
{
    auto names = session.listNames();
    if (!names)
    {
        return std::unexpected(Error{
            .type = ErrorType::ProtocolError,
            .ftpError = names.error(),
            .extraInfo = "NLST failed",
        });
    }

    std::vector<SharedData::DirectoryEntry> entries{};
    entries.reserve(names->size());
    for (auto const& listed : *names)
    {
        const std::string name{nameOfListedPath(listed)};
        if (name.empty() || name == "." || name == "..")
            continue;

        SharedData::DirectoryEntry entry{.name = name};
        if (session.changeDirectory(name))
        {
            if (auto back = session.changeDirectory(".."); !back)
            {
                return std::unexpected(Error{
                    .type = ErrorType::ProtocolError,
                    .ftpError = back.error(),
                    .extraInfo = "Cannot return from '" + name + "'",
                });
            }
            entry.kind = SharedData::EntryKind::Directory;
        }
        else
        {
            entry.kind = SharedData::EntryKind::File;
            if (auto size = session.size(name); size)
                entry.size = *size;
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}
