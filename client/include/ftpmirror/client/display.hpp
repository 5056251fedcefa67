#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "ftpmirror/client/config.hpp"

namespace ftpmirror::client
{

    // Shortens text to max_length code points, replacing the cut part with a single "…".
    // max_length == 0 disables truncation. Lengths are counted in UTF-8 code points.
    std::string ellipsize(std::string_view text, std::size_t max_length, Ellipsis where);

    // Remote path as shown on the console and in the log; never used for FTP commands.
    std::string format_display_path(std::string_view remote_path, const DisplayOptions &options);

} // namespace ftpmirror::client
