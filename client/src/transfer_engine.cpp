#include "ftpmirror/client/transfer_engine.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <span>
#include <stdexcept>
#include <utility>

#include "ftpmirror/client/errors.hpp"

namespace ftpmirror::client
{

    namespace
    {

        constexpr double kMebibyte = 1024.0 * 1024.0;

        std::uint64_t existing_size(const std::filesystem::path &path)
        {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(path, ec))
            {
                return 0;
            }
            const auto size = std::filesystem::file_size(path, ec);
            return ec ? 0 : size;
        }

        void remove_if_present(const std::filesystem::path &path)
        {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }

        double throughput(std::uint64_t bytes, double seconds)
        {
            return seconds > 0 ? static_cast<double>(bytes) / kMebibyte / seconds : 0.0;
        }

    } // namespace

    std::string_view to_string(TransferAction action) noexcept
    {
        switch (action)
        {
        case TransferAction::Downloaded:
            return "downloaded";
        case TransferAction::Resumed:
            return "resumed";
        case TransferAction::Redownloaded:
            return "re-downloaded";
        case TransferAction::SkippedSameSize:
            return "skipped_same_size";
        case TransferAction::None:
            return "none";
        }
        return "none";
    }

    std::string Verification::to_string() const
    {
        const auto label = algorithm ? std::string(checksum::to_string(*algorithm)) : std::string("?");
        switch (status)
        {
        case Status::Ok:
            return "OK (" + label + ")";
        case Status::Fail:
            return "FAIL (" + label + ")";
        case Status::SizeOnly:
            return "SIZE_ONLY";
        case Status::Skipped:
            return "SKIPPED";
        }
        return "SKIPPED";
    }

    std::filesystem::path partial_path(const std::filesystem::path &local_path)
    {
        auto part = local_path;
        part += ".part";
        return part;
    }

    TransferEngine::TransferEngine(ConnectionManager &connections, ChecksumOracle &checksums,
                                   TransferSettings settings, Logger logger)
        : connections_(connections),
          checksums_(checksums),
          settings_(std::move(settings)),
          logger_(std::move(logger)) {}

    TransferOutcome TransferEngine::download(const TransferRequest &request)
    {
        TransferOutcome outcome;
        const auto local_size = existing_size(request.local_path);
        const auto part = partial_path(request.local_path);

        bool resume = settings_.resume && local_size > 0;
        if (resume && request.remote_size)
        {
            // A local copy at least as long as the remote one cannot be continued.
            if (local_size >= *request.remote_size ||
                (settings_.overwrite_differ && local_size != *request.remote_size))
            {
                resume = false;
            }
        }

        Transfer result;
        if (resume)
        {
            logger_.debug("xfer", "resuming ", request.remote_path, " at ", local_size);
            result = transfer(request.remote_path, request.local_path, true);
            outcome.action = TransferAction::Resumed;
        }
        else
        {
            remove_if_present(part);
            result = transfer(request.remote_path, part, true);
            promote(part, request.local_path);
            outcome.action = result.resumed ? TransferAction::Resumed : TransferAction::Downloaded;
        }
        outcome.bytes_transferred = result.bytes;
        outcome.elapsed_seconds = result.seconds;

        if (checksums_.mode() == VerifyMode::Never)
        {
            outcome.verification.status = Verification::Status::Skipped;
        }
        else if (const auto reference = checksums_.reference(request.remote_path); !reference)
        {
            outcome.verification.status = Verification::Status::SizeOnly;
        }
        else
        {
            outcome.verification.algorithm = reference->algorithm;
            if (matches(request.local_path, *reference))
            {
                outcome.verification.status = Verification::Status::Ok;
            }
            else
            {
                logger_.warn("VERIFY", "checksum mismatch for ", request.remote_path, " (",
                             checksum::to_string(reference->algorithm), "), reloading");
                remove_if_present(request.local_path);
                remove_if_present(part);
                const auto reload = transfer(request.remote_path, part, false);
                promote(part, request.local_path);
                if (matches(request.local_path, *reference))
                {
                    outcome.verification.status = Verification::Status::Ok;
                    outcome.action = TransferAction::Redownloaded;
                    outcome.bytes_transferred = reload.bytes;
                    outcome.elapsed_seconds = reload.seconds;
                }
                else
                {
                    outcome.verification.status = Verification::Status::Fail;
                }
            }
        }

        outcome.throughput_mbps = throughput(outcome.bytes_transferred, outcome.elapsed_seconds);
        apply_modify_time(request);
        return outcome;
    }

    Verification TransferEngine::verify_existing(const TransferRequest &request)
    {
        Verification verification;
        if (checksums_.mode() == VerifyMode::Never)
        {
            return verification;
        }
        const auto reference = checksums_.reference(request.remote_path);
        if (!reference)
        {
            verification.status = Verification::Status::SizeOnly;
            return verification;
        }
        verification.algorithm = reference->algorithm;
        verification.status = matches(request.local_path, *reference) ? Verification::Status::Ok
                                                                       : Verification::Status::Fail;
        return verification;
    }

    TransferEngine::Transfer TransferEngine::transfer(const std::string &remote_path,
                                                      const std::filesystem::path &target, bool allow_resume)
    {
        const auto &policy = connections_.retry_policy();
        Transfer result;
        // Time spent streaming, without back-off sleeps between attempts.
        std::chrono::duration<double> active{};
        bool needs_reconnect = false;
        std::string last_error;

        for (int attempt = 1; attempt <= policy.max_attempts; ++attempt)
        {
            const std::uint64_t offset = allow_resume ? existing_size(target) : 0;
            std::ofstream out(target, std::ios::binary | (offset > 0 ? std::ios::app : std::ios::trunc));
            if (!out.is_open())
            {
                throw TransferError(ErrorCode::LocalIo, "Cannot open " + target.string() + " for writing");
            }
            if (offset > 0)
            {
                result.resumed = true;
            }
            else
            {
                // The target was truncated, so earlier attempts no longer count.
                result.bytes = 0;
                active = {};
            }

            auto attempt_started = std::chrono::steady_clock::now();
            try
            {
                auto &connection = needs_reconnect ? connections_.reconnect() : connections_.current();
                needs_reconnect = false;
                attempt_started = std::chrono::steady_clock::now();
                connection.retrieve(remote_path, offset, settings_.block_size,
                                    [&out, &result, &target](std::span<const char> block)
                                    {
                                        out.write(block.data(), static_cast<std::streamsize>(block.size()));
                                        if (!out)
                                        {
                                            throw TransferError(ErrorCode::LocalIo,
                                                                "Write to " + target.string() + " failed");
                                        }
                                        result.bytes += block.size();
                                    });
                out.close();
                if (out.fail())
                {
                    throw TransferError(ErrorCode::LocalIo, "Closing " + target.string() + " failed");
                }
                active += std::chrono::steady_clock::now() - attempt_started;
                result.seconds = std::max(active.count(), 1e-6);
                return result;
            }
            catch (const FtpError &ex)
            {
                last_error = ex.what();
                needs_reconnect = true;
            }
            catch (const ConnectionError &ex)
            {
                last_error = ex.what();
                needs_reconnect = true;
            }
            active += std::chrono::steady_clock::now() - attempt_started;
            out.close();

            logger_.warn("WARN", "Transfer attempt ", attempt, "/", policy.max_attempts, " for ", remote_path,
                         " failed: ", last_error);
            if (attempt < policy.max_attempts)
            {
                connections_.back_off(attempt);
            }
        }
        throw TransferError(ErrorCode::RetriesExhausted, "RETR " + remote_path + " failed after " +
                                                             std::to_string(policy.max_attempts) +
                                                             " attempts: " + last_error);
    }

    bool TransferEngine::matches(const std::filesystem::path &local_path, const ChecksumReference &reference) const
    {
        std::string local_hex;
        try
        {
            local_hex = checksum::hash_file(local_path, reference.algorithm);
        }
        catch (const std::runtime_error &ex)
        {
            throw TransferError(ErrorCode::LocalIo, ex.what());
        }
        return checksum::digests_equal(local_hex, reference.hex, reference.algorithm);
    }

    void TransferEngine::promote(const std::filesystem::path &part, const std::filesystem::path &local_path) const
    {
        if (settings_.overwrite_differ)
        {
            remove_if_present(local_path);
        }
        std::error_code ec;
        std::filesystem::rename(part, local_path, ec);
        if (ec)
        {
            throw TransferError(ErrorCode::LocalIo,
                                "Cannot move " + part.string() + " to " + local_path.string() + ": " + ec.message());
        }
    }

    void TransferEngine::apply_modify_time(const TransferRequest &request)
    {
        if (!settings_.sync_mtime || !request.modify_time)
        {
            return;
        }
        const auto remote_time = std::chrono::sys_seconds(std::chrono::seconds(*request.modify_time));
        std::error_code ec;
        std::filesystem::last_write_time(request.local_path, std::chrono::file_clock::from_sys(remote_time), ec);
        if (ec)
        {
            logger_.debug("xfer", "cannot set mtime of ", request.local_path.string(), ": ", ec.message());
        }
    }

} // namespace ftpmirror::client
