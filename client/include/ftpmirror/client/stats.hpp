#pragma once

#include <cstdint>

#include "ftpmirror/client/transfer_engine.hpp"

namespace ftpmirror::client
{

    // Run totals. Written only by the orchestrator, between file visits.
    struct MirrorStats
    {
        std::uint64_t total_bytes{};
        double total_seconds{};
        std::uint64_t total_files{};
        std::uint64_t total_dirs{};

        std::uint64_t downloaded{};
        std::uint64_t resumed{};
        std::uint64_t redownloaded{};
        std::uint64_t skipped{};
        std::uint64_t failed{};
        std::uint64_t verify_failures{};
        std::uint64_t dirs_abandoned{};

        // Folds one file outcome into the totals. total_files is counted by the caller.
        void record(const TransferOutcome &outcome);

        // MiB per second over the time spent transferring.
        double average_mbps() const noexcept;
    };

} // namespace ftpmirror::client
