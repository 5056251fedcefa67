#include "ftpmirror/client/capabilities.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "ftpmirror/protocol.hpp"

namespace ftpmirror::client
{

    CapabilityNegotiator::CapabilityNegotiator(std::vector<checksum::HashAlgorithm> preference, Logger logger)
        : preference_(std::move(preference)), logger_(std::move(logger)) {}

    ServerCapabilities CapabilityNegotiator::negotiate(FtpConnection &connection)
    {
        ServerCapabilities capabilities;
        protocol::FeatureSet features;
        try
        {
            features = protocol::parse_features(connection.features());
        }
        catch (const FtpError &ex)
        {
            logger_.debug("feat", "FEAT failed: ", ex.what());
            return capabilities;
        }

        capabilities.legacy_crc_supported = features.legacy_crc;

        std::vector<checksum::HashAlgorithm> offered;
        for (const auto &name : features.hash_algorithms)
        {
            if (const auto algorithm = checksum::hash_algorithm_from_string(name))
            {
                offered.push_back(*algorithm);
            }
        }

        for (const auto algorithm : preference_)
        {
            if (std::find(offered.begin(), offered.end(), algorithm) == offered.end())
            {
                continue;
            }
            const auto name = std::string(checksum::to_string(algorithm));
            try
            {
                connection.execute_ok("OPTS HASH " + name);
                capabilities.hash_supported = true;
                capabilities.hash_algorithm = algorithm;
                break;
            }
            catch (const ReplyError &ex)
            {
                logger_.debug("feat", "OPTS HASH ", name, " refused: ", ex.what());
            }
            catch (const TransportError &ex)
            {
                logger_.debug("feat", "OPTS HASH ", name, " failed: ", ex.what());
                return ServerCapabilities{};
            }
        }

        logger_.debug("feat", "HASH ",
                      capabilities.hash_algorithm ? checksum::to_string(*capabilities.hash_algorithm) : "unavailable",
                      ", XCRC/SITE CRC ", capabilities.legacy_crc_supported ? "available" : "unavailable");
        return capabilities;
    }

} // namespace ftpmirror::client
