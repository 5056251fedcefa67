#include "ftpmirror/reply.hpp"

#include <cctype>

#include "ftpmirror/error_codes.hpp"

namespace ftpmirror::protocol
{

    namespace
    {
        constexpr std::size_t kCodeLength = 3;

        std::string_view strip_line_terminator(std::string_view line)
        {
            while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
            {
                line.remove_suffix(1);
            }
            return line;
        }
    } // namespace

    std::string Reply::message() const
    {
        if (lines.empty())
        {
            return {};
        }
        const auto &first = lines.front();
        if (first.size() <= kCodeLength + 1)
        {
            return {};
        }
        return first.substr(kCodeLength + 1);
    }

    std::string Reply::text() const
    {
        std::string result;
        for (const auto &line : lines)
        {
            if (!result.empty())
            {
                result.push_back('\n');
            }
            result += line;
        }
        return result;
    }

    std::optional<int> parse_reply_code(std::string_view line) noexcept
    {
        if (line.size() < kCodeLength)
        {
            return std::nullopt;
        }
        int code = 0;
        for (std::size_t i = 0; i < kCodeLength; ++i)
        {
            const auto ch = static_cast<unsigned char>(line[i]);
            if (!std::isdigit(ch))
            {
                return std::nullopt;
            }
            code = code * 10 + (ch - '0');
        }
        if (line.size() > kCodeLength && line[kCodeLength] != ' ' && line[kCodeLength] != '-')
        {
            return std::nullopt;
        }
        return code;
    }

    std::optional<Reply> ReplyAssembler::feed(std::string_view raw_line)
    {
        const auto line = strip_line_terminator(raw_line);

        if (!pending_code_)
        {
            const auto code = parse_reply_code(line);
            if (!code)
            {
                throw MirrorError(ErrorCode::ProtocolViolation,
                                  "Malformed reply line: " + std::string(line));
            }
            lines_.emplace_back(line);
            if (line.size() > kCodeLength && line[kCodeLength] == '-')
            {
                pending_code_ = *code;
                return std::nullopt;
            }
            Reply reply{.code = *code, .lines = std::move(lines_)};
            reset();
            return reply;
        }

        lines_.emplace_back(line);
        const auto code = parse_reply_code(line);
        const bool terminator = code && *code == *pending_code_ &&
                                (line.size() == kCodeLength || line[kCodeLength] == ' ');
        if (!terminator)
        {
            return std::nullopt;
        }
        Reply reply{.code = *pending_code_, .lines = std::move(lines_)};
        reset();
        return reply;
    }

    void ReplyAssembler::reset() noexcept
    {
        pending_code_.reset();
        lines_.clear();
    }

} // namespace ftpmirror::protocol
