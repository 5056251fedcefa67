#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "ftpmirror/checksum.hpp"
#include "ftpmirror/client/config.hpp"
#include "ftpmirror/client/connection_manager.hpp"
#include "ftpmirror/client/logger.hpp"

namespace ftpmirror::client
{

    // Byte length of a remote file: the listing fact when known, SIZE otherwise.
    class SizeOracle
    {
    public:
        SizeOracle(ConnectionManager &connections, Logger logger);

        // std::nullopt when the size cannot be determined; never throws for FTP failures.
        std::optional<std::uint64_t> size(const std::string &path, const std::optional<std::uint64_t> &known);

    private:
        ConnectionManager &connections_;
        Logger logger_;
    };

    struct ChecksumReference
    {
        checksum::HashAlgorithm algorithm{checksum::HashAlgorithm::Crc32};
        std::string hex;
    };

    // Server-side reference checksum via HASH, then XCRC and SITE CRC. Advisory only.
    class ChecksumOracle
    {
    public:
        ChecksumOracle(ConnectionManager &connections, VerifyMode mode, Logger logger);

        std::optional<ChecksumReference> reference(const std::string &path);

        VerifyMode mode() const noexcept { return mode_; }

    private:
        std::optional<ChecksumReference> query_hash(FtpConnection &connection, const std::string &path,
                                                    const ServerCapabilities &capabilities);
        std::optional<ChecksumReference> query_legacy_crc(FtpConnection &connection, const std::string &path);

        ConnectionManager &connections_;
        VerifyMode mode_;
        Logger logger_;
    };

} // namespace ftpmirror::client
