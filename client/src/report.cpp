#include "ftpmirror/client/report.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

#include <spdlog/common.h>

namespace ftpmirror::client
{

    namespace
    {

        constexpr double kMebibyte = 1024.0 * 1024.0;
        constexpr double kGibibyte = kMebibyte * 1024.0;
        const std::string kRule(60, '=');

    } // namespace

    std::string format_local_time(std::chrono::system_clock::time_point time)
    {
        const auto seconds = std::chrono::system_clock::to_time_t(time);
        std::tm local{};
        localtime_r(&seconds, &local);
        std::ostringstream oss;
        oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
        return oss.str();
    }

    std::vector<std::string> format_header(const HeaderInfo &info)
    {
        std::vector<std::string> lines;
        lines.push_back(kRule);
        lines.push_back("Start: " + info.program);
        if (!info.executable.empty())
        {
            lines.push_back("Executable: " + info.executable.string());
        }
        lines.push_back("Working directory: " + info.working_directory.string());
        lines.push_back("Version: " + info.version);
        lines.push_back(kRule);
        return lines;
    }

    std::string format_file_line(std::string_view display_path, const std::optional<std::uint64_t> &remote_size,
                                 const TransferOutcome &outcome)
    {
        std::string line(display_path);
        if (remote_size)
        {
            line += spdlog::fmt_lib::format(" ({:.2f} MiB)", static_cast<double>(*remote_size) / kMebibyte);
        }
        line += spdlog::fmt_lib::format(" -> {}; {:.2f} MiB in {:.2f}s @ {:.2f} MB/s; VERIFY: {}", to_string(outcome.action),
                            static_cast<double>(outcome.bytes_transferred) / kMebibyte, outcome.elapsed_seconds,
                            outcome.throughput_mbps, outcome.verification.to_string());
        return line;
    }

    std::vector<std::string> format_summary(const MirrorStats &stats, std::chrono::system_clock::time_point start,
                                            std::chrono::system_clock::time_point end,
                                            const std::filesystem::path &local_root, std::uint64_t occupied_bytes)
    {
        const auto duration = std::chrono::duration_cast<std::chrono::minutes>(end - start);
        const auto hours = duration.count() / 60;
        const auto minutes = duration.count() % 60;

        std::vector<std::string> lines;
        lines.push_back("===== Summary =====");
        lines.push_back("Start time: " + format_local_time(start));
        lines.push_back("End time: " + format_local_time(end));
        lines.push_back(spdlog::fmt_lib::format("Duration: {} hours {} minutes", hours, minutes));
        lines.push_back(spdlog::fmt_lib::format("Directories: {}", stats.total_dirs));
        lines.push_back(spdlog::fmt_lib::format("Files: {}", stats.total_files));
        lines.push_back(spdlog::fmt_lib::format("  downloaded {}, resumed {}, re-downloaded {}, skipped {}, failed {}",
                                    stats.downloaded, stats.resumed, stats.redownloaded, stats.skipped,
                                    stats.failed));
        lines.push_back(spdlog::fmt_lib::format("Verification failures: {}", stats.verify_failures));
        lines.push_back(spdlog::fmt_lib::format("Abandoned directories: {}", stats.dirs_abandoned));
        lines.push_back(spdlog::fmt_lib::format("Total download: {:.2f} MiB",
                                    static_cast<double>(stats.total_bytes) / kMebibyte));
        lines.push_back(spdlog::fmt_lib::format("Average rate: {:.2f} MB/s", stats.average_mbps()));
        lines.push_back(spdlog::fmt_lib::format("Occupied storage in '{}': {:.2f} GB", local_root.string(),
                                    static_cast<double>(occupied_bytes) / kGibibyte));
        lines.push_back(std::string(19, '='));
        return lines;
    }

    std::uint64_t directory_size(const std::filesystem::path &root)
    {
        std::uint64_t total = 0;
        std::error_code ec;
        std::filesystem::recursive_directory_iterator it(
            root, std::filesystem::directory_options::skip_permission_denied, ec);
        const std::filesystem::recursive_directory_iterator end;
        while (!ec && it != end)
        {
            std::error_code entry_ec;
            if (it->is_regular_file(entry_ec))
            {
                const auto size = it->file_size(entry_ec);
                if (!entry_ec)
                {
                    total += size;
                }
            }
            it.increment(ec);
        }
        return total;
    }

} // namespace ftpmirror::client
