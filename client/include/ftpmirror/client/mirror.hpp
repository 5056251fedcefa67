#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "ftpmirror/client/config.hpp"
#include "ftpmirror/client/connection_manager.hpp"
#include "ftpmirror/client/lister.hpp"
#include "ftpmirror/client/logger.hpp"
#include "ftpmirror/client/remote_facts.hpp"
#include "ftpmirror/client/stats.hpp"
#include "ftpmirror/client/transfer_engine.hpp"

namespace ftpmirror::client
{

    // "/a/./b//c/../d" -> "/a/b/d"; the result is always absolute.
    std::string normalize_remote_path(std::string_view path);

    std::string join_remote_path(const std::string &directory, const std::string &name);

    struct FileReport
    {
        std::string remote_path;
        std::filesystem::path local_path;
        std::optional<std::uint64_t> remote_size;
        std::optional<TransferOutcome> outcome;
        // Set instead of outcome when the file could not be mirrored.
        std::string error;
    };

    // Depth-first walk of the remote tree: subdirectories first, then the files of each directory.
    class MirrorOrchestrator
    {
    public:
        using FileObserver = std::function<void(const FileReport &)>;

        MirrorOrchestrator(ConnectionManager &connections, Lister &lister, SizeOracle &sizes, TransferEngine &engine,
                           TransferSettings settings, DisplayOptions display, Logger logger);

        void set_observer(FileObserver observer) { observer_ = std::move(observer); }

        // Throws MirrorError only when the local root cannot be created.
        void mirror(const std::string &remote_root, const std::filesystem::path &local_root, MirrorStats &stats);

    private:
        void mirror_directory(const std::string &remote_dir, const std::filesystem::path &local_dir,
                              MirrorStats &stats);
        void mirror_file(const RemoteEntry &entry, const std::string &remote_dir,
                         const std::filesystem::path &local_dir, MirrorStats &stats);
        TransferOutcome process_file(const TransferRequest &request);
        TransferOutcome download_checked(const TransferRequest &request);
        bool ensure_local_directory(const std::filesystem::path &path);

        ConnectionManager &connections_;
        Lister &lister_;
        SizeOracle &sizes_;
        TransferEngine &engine_;
        TransferSettings settings_;
        DisplayOptions display_;
        Logger logger_;
        FileObserver observer_;
    };

} // namespace ftpmirror::client
