#include "ftpmirror/client/mirror.hpp"

#include <algorithm>
#include <utility>
#include <vector>

#include "ftpmirror/client/display.hpp"
#include "ftpmirror/client/errors.hpp"
#include "ftpmirror/client/report.hpp"

namespace ftpmirror::client
{

    namespace
    {

        // Names that would escape the local directory are not mirrored.
        bool is_safe_name(const std::string &name)
        {
            return !name.empty() && name != "." && name != ".." && name.find('/') == std::string::npos &&
                   name.find('\0') == std::string::npos;
        }

        std::optional<std::uint64_t> local_file_size(const std::filesystem::path &path)
        {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(path, ec))
            {
                return std::nullopt;
            }
            const auto size = std::filesystem::file_size(path, ec);
            if (ec)
            {
                return std::nullopt;
            }
            return size;
        }

    } // namespace

    std::string normalize_remote_path(std::string_view path)
    {
        std::vector<std::string_view> parts;
        std::size_t pos = 0;
        while (pos <= path.size())
        {
            const auto end = std::min(path.find('/', pos), path.size());
            const auto part = path.substr(pos, end - pos);
            if (part == "..")
            {
                if (!parts.empty())
                {
                    parts.pop_back();
                }
            }
            else if (!part.empty() && part != ".")
            {
                parts.push_back(part);
            }
            pos = end + 1;
        }

        std::string result;
        for (const auto part : parts)
        {
            result.push_back('/');
            result.append(part);
        }
        return result.empty() ? "/" : result;
    }

    std::string join_remote_path(const std::string &directory, const std::string &name)
    {
        if (directory.empty() || directory.back() == '/')
        {
            return directory + name;
        }
        return directory + "/" + name;
    }

    MirrorOrchestrator::MirrorOrchestrator(ConnectionManager &connections, Lister &lister, SizeOracle &sizes,
                                           TransferEngine &engine, TransferSettings settings, DisplayOptions display,
                                           Logger logger)
        : connections_(connections),
          lister_(lister),
          sizes_(sizes),
          engine_(engine),
          settings_(std::move(settings)),
          display_(std::move(display)),
          logger_(std::move(logger)) {}

    void MirrorOrchestrator::mirror(const std::string &remote_root, const std::filesystem::path &local_root,
                                    MirrorStats &stats)
    {
        const auto root = normalize_remote_path(remote_root);
        std::error_code ec;
        std::filesystem::create_directories(local_root, ec);
        if (ec)
        {
            throw MirrorError(ErrorCode::LocalIo, "Cannot create " + local_root.string() + ": " + ec.message());
        }
        mirror_directory(root, local_root, stats);
    }

    bool MirrorOrchestrator::ensure_local_directory(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec)
        {
            logger_.error("WARN", "Cannot create local directory ", path.string(), ": ", ec.message());
            return false;
        }
        return true;
    }

    void MirrorOrchestrator::mirror_directory(const std::string &remote_dir, const std::filesystem::path &local_dir,
                                              MirrorStats &stats)
    {
        ++stats.total_dirs;
        const auto display = format_display_path(remote_dir, display_);
        if (!ensure_local_directory(local_dir))
        {
            ++stats.dirs_abandoned;
            return;
        }
        logger_.info("DIR", display);

        ListingResult listing;
        try
        {
            connections_.keep_alive();
            listing = lister_.list(remote_dir);
        }
        catch (const ConnectionError &ex)
        {
            listing.abandoned = true;
            listing.error = ex.what();
        }
        if (listing.abandoned)
        {
            logger_.warn("WARN", "Listing failed in '", display, "': ", listing.error);
            ++stats.dirs_abandoned;
            return;
        }

        std::vector<const RemoteEntry *> directories;
        std::vector<const RemoteEntry *> files;
        for (const auto &entry : listing.entries)
        {
            if (!is_safe_name(entry.name))
            {
                logger_.warn("WARN", "Skipping unsafe entry name in '", display, "': ", entry.name);
                continue;
            }
            (entry.kind == EntryKind::Directory ? directories : files).push_back(&entry);
        }

        for (const auto *entry : directories)
        {
            const auto child_local = local_dir / entry->name;
            ensure_local_directory(child_local);
            mirror_directory(join_remote_path(remote_dir, entry->name), child_local, stats);
        }

        for (const auto *entry : files)
        {
            mirror_file(*entry, remote_dir, local_dir, stats);
        }
    }

    void MirrorOrchestrator::mirror_file(const RemoteEntry &entry, const std::string &remote_dir,
                                         const std::filesystem::path &local_dir, MirrorStats &stats)
    {
        ++stats.total_files;
        FileReport report;
        report.remote_path = join_remote_path(remote_dir, entry.name);
        report.local_path = local_dir / entry.name;
        const auto display = format_display_path(report.remote_path, display_);

        try
        {
            connections_.keep_alive();
            report.remote_size = sizes_.size(report.remote_path, entry.size);
            const TransferRequest request{report.remote_path, report.local_path, report.remote_size,
                                          entry.modify_time};
            report.outcome = process_file(request);
            stats.record(*report.outcome);
            logger_.info("FILE", format_file_line(display, report.remote_size, *report.outcome));
        }
        catch (const MirrorError &ex)
        {
            ++stats.failed;
            report.error = ex.what();
            logger_.warn("WARN", "Download failed: ", display, " -> ", report.error, " [", to_string(ex.code()), "]");
        }

        if (observer_)
        {
            observer_(report);
        }
    }

    TransferOutcome MirrorOrchestrator::process_file(const TransferRequest &request)
    {
        const auto local_size = local_file_size(request.local_path);
        if (settings_.skip_same_size && local_size && request.remote_size && *local_size == *request.remote_size)
        {
            TransferOutcome outcome;
            outcome.action = TransferAction::SkippedSameSize;
            outcome.verification = engine_.verify_existing(request);
            if (outcome.verification.status != Verification::Status::Fail)
            {
                return outcome;
            }
            logger_.warn("VERIFY", "checksum mismatch for existing ", request.remote_path, ", downloading again");
            std::error_code ec;
            std::filesystem::remove(request.local_path, ec);
            if (ec)
            {
                throw TransferError(ErrorCode::LocalIo,
                                    "Cannot remove " + request.local_path.string() + ": " + ec.message());
            }
        }
        return download_checked(request);
    }

    TransferOutcome MirrorOrchestrator::download_checked(const TransferRequest &request)
    {
        auto outcome = engine_.download(request);
        if (request.remote_size)
        {
            const auto local_size = local_file_size(request.local_path);
            if (local_size && *local_size != *request.remote_size)
            {
                std::error_code ec;
                std::filesystem::remove(request.local_path, ec);
                throw TransferError(ErrorCode::SizeMismatch,
                                    "Size mismatch: expected " + std::to_string(*request.remote_size) + " bytes, got " +
                                        std::to_string(*local_size));
            }
        }
        return outcome;
    }

} // namespace ftpmirror::client
