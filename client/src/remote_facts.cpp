#include "ftpmirror/client/remote_facts.hpp"

#include <array>
#include <sstream>
#include <utility>

#include "ftpmirror/protocol.hpp"

namespace ftpmirror::client
{

    namespace
    {

        // "213 SHA-256 0-1023 <hex> <path>": the algorithm is the first word of the reply text.
        std::optional<checksum::HashAlgorithm> algorithm_from_hash_reply(const std::string &message)
        {
            std::istringstream iss(message);
            std::string first;
            iss >> first;
            return checksum::hash_algorithm_from_string(first);
        }

    } // namespace

    SizeOracle::SizeOracle(ConnectionManager &connections, Logger logger)
        : connections_(connections), logger_(std::move(logger)) {}

    std::optional<std::uint64_t> SizeOracle::size(const std::string &path, const std::optional<std::uint64_t> &known)
    {
        if (known)
        {
            return known;
        }

        const auto &policy = connections_.retry_policy();
        bool needs_reconnect = false;
        for (int attempt = 1; attempt <= policy.max_attempts; ++attempt)
        {
            try
            {
                auto &connection = needs_reconnect ? connections_.reconnect() : connections_.current();
                needs_reconnect = false;
                // Some servers only answer SIZE in binary mode.
                if (!connection.execute("TYPE I").is_positive())
                {
                    logger_.debug("size", "TYPE I refused before SIZE ", path);
                }
                return connection.size(path);
            }
            catch (const ReplyError &ex)
            {
                logger_.debug("size", "SIZE ", path, " refused: ", ex.what());
                return std::nullopt;
            }
            catch (const TransportError &ex)
            {
                logger_.debug("size", "attempt ", attempt, " for ", path, " failed: ", ex.what());
                needs_reconnect = true;
            }
            catch (const ConnectionError &ex)
            {
                logger_.debug("size", "attempt ", attempt, " for ", path, " failed: ", ex.what());
                needs_reconnect = true;
            }
            if (attempt < policy.max_attempts)
            {
                connections_.back_off(attempt);
            }
        }
        return std::nullopt;
    }

    ChecksumOracle::ChecksumOracle(ConnectionManager &connections, VerifyMode mode, Logger logger)
        : connections_(connections), mode_(mode), logger_(std::move(logger)) {}

    std::optional<ChecksumReference> ChecksumOracle::query_hash(FtpConnection &connection, const std::string &path,
                                                                const ServerCapabilities &capabilities)
    {
        const auto reply = connection.execute("HASH " + path);
        if (!reply.is_positive())
        {
            logger_.debug("hash", "HASH ", path, " refused: ", reply.text());
            return std::nullopt;
        }
        const auto message = reply.message();
        auto hex = protocol::extract_checksum_token(message, path);
        if (!hex)
        {
            return std::nullopt;
        }
        auto algorithm = algorithm_from_hash_reply(message);
        if (!algorithm)
        {
            algorithm = capabilities.hash_algorithm;
        }
        if (!algorithm)
        {
            return std::nullopt;
        }
        return ChecksumReference{*algorithm, std::move(*hex)};
    }

    std::optional<ChecksumReference> ChecksumOracle::query_legacy_crc(FtpConnection &connection,
                                                                      const std::string &path)
    {
        static constexpr std::array<const char *, 2> kCommands{"XCRC ", "SITE CRC "};
        for (const auto *command : kCommands)
        {
            const auto reply = connection.execute(command + path);
            if (!reply.is_positive())
            {
                logger_.debug("hash", command, path, " refused: ", reply.text());
                continue;
            }
            if (auto hex = protocol::extract_checksum_token(reply.message(), path))
            {
                return ChecksumReference{checksum::HashAlgorithm::Crc32, std::move(*hex)};
            }
        }
        return std::nullopt;
    }

    std::optional<ChecksumReference> ChecksumOracle::reference(const std::string &path)
    {
        if (mode_ == VerifyMode::Never)
        {
            return std::nullopt;
        }

        const auto &policy = connections_.retry_policy();
        bool needs_reconnect = false;
        for (int attempt = 1; attempt <= policy.max_attempts; ++attempt)
        {
            try
            {
                auto &connection = needs_reconnect ? connections_.reconnect() : connections_.current();
                needs_reconnect = false;
                const auto capabilities = connections_.capabilities();
                const bool force = mode_ == VerifyMode::Always;

                if ((capabilities.hash_supported && capabilities.hash_algorithm) || force)
                {
                    if (auto result = query_hash(connection, path, capabilities))
                    {
                        return result;
                    }
                }
                if (capabilities.legacy_crc_supported || force)
                {
                    return query_legacy_crc(connection, path);
                }
                return std::nullopt;
            }
            catch (const TransportError &ex)
            {
                logger_.debug("hash", "attempt ", attempt, " for ", path, " failed: ", ex.what());
                needs_reconnect = true;
            }
            catch (const ConnectionError &ex)
            {
                logger_.debug("hash", "attempt ", attempt, " for ", path, " failed: ", ex.what());
                needs_reconnect = true;
            }
            if (attempt < policy.max_attempts)
            {
                connections_.back_off(attempt);
            }
        }
        return std::nullopt;
    }

} // namespace ftpmirror::client
