#include "ftpmirror/client/lister.hpp"

#include <utility>

#include "ftpmirror/protocol.hpp"

namespace ftpmirror::client
{

    namespace
    {

        bool is_dot_entry(std::string_view name)
        {
            return name == "." || name == "..";
        }

    } // namespace

    bool probe_directory(FtpConnection &connection, const std::string &name)
    {
        const auto origin = connection.pwd();
        try
        {
            connection.cwd(name);
        }
        catch (const ReplyError &)
        {
            return false;
        }
        connection.cwd(origin);
        return true;
    }

    std::optional<std::vector<RemoteEntry>> MlsdListing::list(FtpConnection &connection)
    {
        std::vector<std::string> lines;
        try
        {
            lines = connection.retrieve_lines("MLSD");
        }
        catch (const ReplyError &)
        {
            return std::nullopt;
        }

        std::vector<RemoteEntry> entries;
        for (const auto &line : lines)
        {
            const auto parsed = protocol::parse_mlsd_line(line);
            if (!parsed || parsed->name.empty() || is_dot_entry(parsed->name))
            {
                continue;
            }
            RemoteEntry entry{parsed->name, EntryKind::File, parsed->size, parsed->modify_time};
            switch (parsed->type)
            {
            case protocol::EntryType::CurrentDirectory:
            case protocol::EntryType::ParentDirectory:
                continue;
            case protocol::EntryType::Directory:
                entry.kind = EntryKind::Directory;
                break;
            case protocol::EntryType::File:
                entry.kind = EntryKind::File;
                break;
            case protocol::EntryType::Unknown:
                entry.kind = probe_directory(connection, entry.name) ? EntryKind::Directory : EntryKind::File;
                break;
            }
            entries.push_back(std::move(entry));
        }
        return entries;
    }

    std::optional<std::vector<RemoteEntry>> NameListing::list(FtpConnection &connection)
    {
        std::vector<std::string> lines;
        try
        {
            lines = connection.retrieve_lines("NLST");
        }
        catch (const ReplyError &)
        {
            return std::nullopt;
        }

        std::vector<RemoteEntry> entries;
        for (const auto &line : lines)
        {
            auto name = protocol::listing_name(line);
            if (name.empty() || is_dot_entry(name))
            {
                continue;
            }
            const auto kind = probe_directory(connection, name) ? EntryKind::Directory : EntryKind::File;
            entries.push_back(RemoteEntry{std::move(name), kind, std::nullopt, std::nullopt});
        }
        return entries;
    }

    Lister::Lister(ConnectionManager &connections, Logger logger)
        : connections_(connections), logger_(std::move(logger))
    {
        strategies_.push_back(std::make_unique<MlsdListing>());
        strategies_.push_back(std::make_unique<NameListing>());
    }

    std::vector<RemoteEntry> Lister::list_current(FtpConnection &connection)
    {
        for (const auto &strategy : strategies_)
        {
            if (auto entries = strategy->list(connection))
            {
                return std::move(*entries);
            }
            logger_.debug("list", strategy->name(), " refused");
        }
        // Servers answer NLST on an empty directory with 450/550.
        return {};
    }

    ListingResult Lister::list(const std::string &directory)
    {
        const auto &policy = connections_.retry_policy();
        bool needs_reconnect = false;
        std::string last_error;
        for (int attempt = 1; attempt <= policy.max_attempts; ++attempt)
        {
            try
            {
                auto &connection = needs_reconnect ? connections_.reconnect() : connections_.current();
                needs_reconnect = false;
                connection.cwd(directory);
                return ListingResult{list_current(connection), false, {}};
            }
            catch (const TransportError &ex)
            {
                last_error = ex.what();
                needs_reconnect = true;
            }
            catch (const ReplyError &ex)
            {
                last_error = ex.what();
            }
            catch (const ConnectionError &ex)
            {
                last_error = ex.what();
                needs_reconnect = true;
            }
            logger_.debug("list", "attempt ", attempt, " for ", directory, " failed: ", last_error);
            if (attempt < policy.max_attempts)
            {
                connections_.back_off(attempt);
            }
        }
        return ListingResult{{}, true, last_error};
    }

} // namespace ftpmirror::client
