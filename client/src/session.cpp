#include "ftpmirror/client/session.hpp"

#include <chrono>
#include <iostream>
#include <utility>

#include "ftpmirror/client/capabilities.hpp"
#include "ftpmirror/client/connection_manager.hpp"
#include "ftpmirror/client/display.hpp"
#include "ftpmirror/client/errors.hpp"
#include "ftpmirror/client/lister.hpp"
#include "ftpmirror/client/mirror.hpp"
#include "ftpmirror/client/remote_facts.hpp"
#include "ftpmirror/client/report.hpp"
#include "ftpmirror/client/transfer_engine.hpp"

namespace ftpmirror::client
{

    MirrorSession::MirrorSession(MirrorConfig config, Logger logger)
        : config_(std::move(config)), logger_(std::move(logger)) {}

    int MirrorSession::run()
    {
        const auto remote_root = normalize_remote_path(config_.remote_path);
        logger_.plain("Mirroring '" + config_.server.host + "' from '" +
                      format_display_path(remote_root, config_.display) + "'");
        const auto start = std::chrono::system_clock::now();
        logger_.plain("Start time: " + format_local_time(start));

        CapabilityNegotiator negotiator(config_.transfer.hash_preference, logger_);
        ConnectionManager connections(config_.server, config_.retry, std::move(negotiator), logger_);
        try
        {
            connections.connect();
        }
        catch (const ConnectionError &ex)
        {
            logger_.error("ERROR", ex.what());
            std::cerr << "ERROR: " << ex.what() << std::endl;
            return 1;
        }

        Lister lister(connections, logger_);
        SizeOracle sizes(connections, logger_);
        ChecksumOracle checksums(connections, config_.transfer.verify, logger_);
        TransferEngine engine(connections, checksums, config_.transfer, logger_);
        MirrorOrchestrator orchestrator(connections, lister, sizes, engine, config_.transfer, config_.display,
                                        logger_);

        int exit_code = 0;
        try
        {
            orchestrator.mirror(remote_root, config_.local_root, stats_);
        }
        catch (const MirrorError &ex)
        {
            logger_.error("ERROR", ex.what(), " [", to_string(ex.code()), "]");
            exit_code = 1;
        }
        connections.close();

        const auto end = std::chrono::system_clock::now();
        logger_.plain("");
        for (const auto &line : format_summary(stats_, start, end, config_.local_root,
                                               directory_size(config_.local_root)))
        {
            logger_.plain(line);
        }
        logger_.flush();
        return exit_code;
    }

} // namespace ftpmirror::client
