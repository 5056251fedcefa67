#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ftpmirror/client/connection_manager.hpp"
#include "ftpmirror/client/ftp_connection.hpp"
#include "ftpmirror/client/logger.hpp"

namespace ftpmirror::client
{

    enum class EntryKind : std::uint8_t
    {
        Directory,
        File
    };

    struct RemoteEntry
    {
        std::string name;
        EntryKind kind{EntryKind::File};
        std::optional<std::uint64_t> size;
        std::optional<std::int64_t> modify_time;
    };

    struct ListingResult
    {
        std::vector<RemoteEntry> entries;
        // Set when every attempt failed; entries is empty and error holds the last failure.
        bool abandoned{};
        std::string error;
    };

    // PWD, CWD into name and back. A refused CWD means "not a directory".
    bool probe_directory(FtpConnection &connection, const std::string &name);

    // Lists the connection's current directory.
    class ListingStrategy
    {
    public:
        virtual ~ListingStrategy() = default;

        virtual std::string_view name() const noexcept = 0;

        // std::nullopt when the server refuses the listing command itself.
        virtual std::optional<std::vector<RemoteEntry>> list(FtpConnection &connection) = 0;
    };

    // MLSD facts; entries without a usable type fact are probed.
    class MlsdListing final : public ListingStrategy
    {
    public:
        std::string_view name() const noexcept override { return "MLSD"; }
        std::optional<std::vector<RemoteEntry>> list(FtpConnection &connection) override;
    };

    // NLST names, every one of them probed.
    class NameListing final : public ListingStrategy
    {
    public:
        std::string_view name() const noexcept override { return "NLST"; }
        std::optional<std::vector<RemoteEntry>> list(FtpConnection &connection) override;
    };

    class Lister
    {
    public:
        Lister(ConnectionManager &connections, Logger logger);

        ListingResult list(const std::string &directory);

    private:
        std::vector<RemoteEntry> list_current(FtpConnection &connection);

        ConnectionManager &connections_;
        Logger logger_;
        std::vector<std::unique_ptr<ListingStrategy>> strategies_;
    };

} // namespace ftpmirror::client
