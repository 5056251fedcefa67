#pragma once

#include <optional>
#include <vector>

#include "ftpmirror/checksum.hpp"
#include "ftpmirror/client/ftp_connection.hpp"
#include "ftpmirror/client/logger.hpp"

namespace ftpmirror::client
{

    struct ServerCapabilities
    {
        bool hash_supported{};
        std::optional<checksum::HashAlgorithm> hash_algorithm;
        bool legacy_crc_supported{};
    };

    // Queries FEAT once per connection and selects the server-side checksum.
    class CapabilityNegotiator
    {
    public:
        CapabilityNegotiator(std::vector<checksum::HashAlgorithm> preference, Logger logger);

        // Never throws: any failure yields "no server checksum".
        ServerCapabilities negotiate(FtpConnection &connection);

        const std::vector<checksum::HashAlgorithm> &preference() const noexcept { return preference_; }

    private:
        std::vector<checksum::HashAlgorithm> preference_;
        Logger logger_;
    };

} // namespace ftpmirror::client
