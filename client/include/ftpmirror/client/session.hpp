#pragma once

#include <filesystem>

#include "ftpmirror/client/config.hpp"
#include "ftpmirror/client/logger.hpp"
#include "ftpmirror/client/stats.hpp"

namespace ftpmirror::client
{

    // One mirror run: connect, walk the tree, close, summarize.
    class MirrorSession
    {
    public:
        MirrorSession(MirrorConfig config, Logger logger);

        // Process exit code: 0 after a completed walk, 1 when no connection could be made.
        int run();

        const MirrorStats &stats() const noexcept { return stats_; }

    private:
        MirrorConfig config_;
        Logger logger_;
        MirrorStats stats_;
    };

} // namespace ftpmirror::client
