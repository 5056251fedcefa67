/**
 * FtpMirror - Parsers for the FTP replies and listings consumed by the mirror engine.
 */
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ftpmirror::protocol
{

    enum class EntryType : std::uint8_t
    {
        Unknown,
        File,
        Directory,
        CurrentDirectory,
        ParentDirectory
    };

    std::string_view to_string(EntryType type) noexcept;

    // One line of an MLSD listing (RFC 3659 section 7).
    struct MlsdEntry
    {
        std::string name;
        EntryType type{EntryType::Unknown};
        std::optional<std::uint64_t> size;
        std::optional<std::int64_t> modify_time;
    };

    std::optional<MlsdEntry> parse_mlsd_line(std::string_view line);

    // Parses "YYYYMMDDHHMMSS[.sss]" (UTC) into seconds since the Unix epoch.
    std::optional<std::int64_t> parse_modify_time(std::string_view value);

    struct PassiveEndpoint
    {
        std::array<std::uint8_t, 4> address{};
        std::uint16_t port{};
    };

    // "227 Entering Passive Mode (h1,h2,h3,h4,p1,p2)"
    std::optional<PassiveEndpoint> parse_pasv_reply(std::string_view message);

    // "229 Entering Extended Passive Mode (|||port|)"
    std::optional<std::uint16_t> parse_epsv_reply(std::string_view message);

    std::string format_port_argument(const std::array<std::uint8_t, 4> &address, std::uint16_t port);

    // "257 "/some ""quoted"" dir" is current directory"
    std::optional<std::string> parse_pwd_reply(std::string_view message);

    struct FeatureSet
    {
        std::vector<std::string> hash_algorithms;
        std::optional<std::string> active_hash;
        bool hash{};
        bool legacy_crc{};
        bool mlst{};
        bool size{};
        bool rest_stream{};
    };

    FeatureSet parse_features(const std::vector<std::string> &lines);

    // Trailing hexadecimal token of a checksum reply (HASH, XCRC, SITE CRC), lower-cased.
    // The echoed path, if present at the end of the reply, is ignored.
    std::optional<std::string> extract_checksum_token(std::string_view message, std::string_view path);

    // NLST may answer with paths; keeps the last component.
    std::string listing_name(std::string_view value);

    std::string to_upper(std::string value);
    std::string to_lower(std::string value);
    std::string trim(std::string_view input);

} // namespace ftpmirror::protocol
