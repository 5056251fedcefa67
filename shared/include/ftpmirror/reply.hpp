/**
 * FtpMirror - Control connection reply framing (RFC 959 single and multi-line replies).
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ftpmirror::protocol
{

    struct Reply
    {
        int code{};
        std::vector<std::string> lines;

        // Text of the first line after the code and separator.
        std::string message() const;

        // All lines joined with '\n'.
        std::string text() const;

        bool is_preliminary() const noexcept { return code / 100 == 1; }
        bool is_positive() const noexcept { return code / 100 == 2; }
        bool is_intermediate() const noexcept { return code / 100 == 3; }
        bool is_transient_negative() const noexcept { return code / 100 == 4; }
        bool is_permanent_negative() const noexcept { return code / 100 == 5; }
    };

    std::optional<int> parse_reply_code(std::string_view line) noexcept;

    // Collects lines read from the control connection until a complete reply is available.
    // A multi-line reply starts with "NNN-" and ends with a line starting with "NNN ".
    class ReplyAssembler
    {
    public:
        std::optional<Reply> feed(std::string_view line);

        bool in_progress() const noexcept { return pending_code_.has_value(); }

        void reset() noexcept;

    private:
        std::optional<int> pending_code_;
        std::vector<std::string> lines_;
    };

} // namespace ftpmirror::protocol
