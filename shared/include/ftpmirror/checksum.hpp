/**
 * FtpMirror - Local checksum computation for the algorithms FTP servers report.
 *
 * CRC32 uses zlib, SHA-256/SHA-512 use libsodium, MD5/SHA-1 use OpenSSL's EVP interface.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace ftpmirror::checksum
{

    enum class HashAlgorithm : std::uint8_t
    {
        Crc32,
        Md5,
        Sha1,
        Sha256,
        Sha512
    };

    // Canonical FTP name ("CRC32", "MD5", "SHA-1", "SHA-256", "SHA-512").
    std::string_view to_string(HashAlgorithm algorithm) noexcept;

    // Accepts the canonical names as well as variants without dash and in any case ("sha256").
    std::optional<HashAlgorithm> hash_algorithm_from_string(std::string_view value) noexcept;

    void ensure_sodium_init();

    std::string hash_bytes(std::span<const std::byte> data, HashAlgorithm algorithm);

    std::string hash_stream(std::istream &input, HashAlgorithm algorithm);

    std::string hash_file(const std::filesystem::path &path, HashAlgorithm algorithm);

    // Case-insensitive digest comparison. CRC32 values are compared numerically so that
    // servers dropping leading zeros still match.
    bool digests_equal(std::string_view lhs, std::string_view rhs, HashAlgorithm algorithm);

} // namespace ftpmirror::checksum
