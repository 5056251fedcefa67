#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "ftpmirror/checksum.hpp"
#include "ftpmirror/client/config.hpp"
#include "ftpmirror/client/connection_manager.hpp"
#include "ftpmirror/client/logger.hpp"
#include "ftpmirror/client/remote_facts.hpp"

namespace ftpmirror::client
{

    enum class TransferAction : std::uint8_t
    {
        Downloaded,
        Resumed,
        Redownloaded,
        SkippedSameSize,
        None
    };

    std::string_view to_string(TransferAction action) noexcept;

    struct Verification
    {
        enum class Status : std::uint8_t
        {
            Ok,
            Fail,
            SizeOnly,
            Skipped
        };

        Status status{Status::Skipped};
        std::optional<checksum::HashAlgorithm> algorithm;

        // "OK (CRC32)", "FAIL (MD5)", "SIZE_ONLY", "SKIPPED"
        std::string to_string() const;
    };

    struct TransferOutcome
    {
        TransferAction action{TransferAction::None};
        std::uint64_t bytes_transferred{};
        double elapsed_seconds{};
        double throughput_mbps{};
        Verification verification;
    };

    struct TransferRequest
    {
        std::string remote_path;
        std::filesystem::path local_path;
        std::optional<std::uint64_t> remote_size;
        std::optional<std::int64_t> modify_time;
    };

    std::filesystem::path partial_path(const std::filesystem::path &local_path);

    // Resumable, verified download of one file:
    // Deciding -> Resuming | FreshDownloading -> Verifying -> Done | Reloading -> ReVerifying -> Done.
    class TransferEngine
    {
    public:
        TransferEngine(ConnectionManager &connections, ChecksumOracle &checksums, TransferSettings settings,
                       Logger logger);

        // Throws TransferError when the retry budget is exhausted or the local file cannot be written.
        TransferOutcome download(const TransferRequest &request);

        // Checks an existing local copy against the server's reference without transferring anything.
        Verification verify_existing(const TransferRequest &request);

    private:
        struct Transfer
        {
            std::uint64_t bytes{};
            double seconds{};
            bool resumed{};
        };

        // Runs RETR into target with reconnect and retry. With allow_resume every attempt continues
        // from target's current size; otherwise every attempt starts from an empty target.
        Transfer transfer(const std::string &remote_path, const std::filesystem::path &target, bool allow_resume);

        bool matches(const std::filesystem::path &local_path, const ChecksumReference &reference) const;
        void promote(const std::filesystem::path &part, const std::filesystem::path &local_path) const;
        void apply_modify_time(const TransferRequest &request);

        ConnectionManager &connections_;
        ChecksumOracle &checksums_;
        TransferSettings settings_;
        Logger logger_;
    };

} // namespace ftpmirror::client
