#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ftpmirror/client/stats.hpp"
#include "ftpmirror/client/transfer_engine.hpp"

namespace ftpmirror::client
{

    struct HeaderInfo
    {
        std::string program;
        std::string version;
        std::filesystem::path executable;
        std::filesystem::path working_directory;
    };

    std::vector<std::string> format_header(const HeaderInfo &info);

    // "<path> (<MiB>) -> <action>; <MiB> in <s> @ <MB/s>; VERIFY: <status>"
    std::string format_file_line(std::string_view display_path, const std::optional<std::uint64_t> &remote_size,
                                 const TransferOutcome &outcome);

    std::vector<std::string> format_summary(const MirrorStats &stats, std::chrono::system_clock::time_point start,
                                            std::chrono::system_clock::time_point end,
                                            const std::filesystem::path &local_root, std::uint64_t occupied_bytes);

    // Sum of regular file sizes below root; unreadable entries are skipped.
    std::uint64_t directory_size(const std::filesystem::path &root);

    std::string format_local_time(std::chrono::system_clock::time_point time);

} // namespace ftpmirror::client
