#include "ftpmirror/client/display.hpp"

#include <vector>

namespace ftpmirror::client
{

    namespace
    {

        constexpr std::string_view kEllipsis = "\xE2\x80\xA6";

        // Byte offsets of every code point start, plus the total size as sentinel.
        std::vector<std::size_t> code_point_offsets(std::string_view text)
        {
            std::vector<std::size_t> offsets;
            offsets.reserve(text.size() + 1);
            for (std::size_t i = 0; i < text.size(); ++i)
            {
                const auto byte = static_cast<unsigned char>(text[i]);
                if ((byte & 0xC0u) != 0x80u)
                {
                    offsets.push_back(i);
                }
            }
            offsets.push_back(text.size());
            return offsets;
        }

    } // namespace

    std::string ellipsize(std::string_view text, std::size_t max_length, Ellipsis where)
    {
        const auto offsets = code_point_offsets(text);
        const auto length = offsets.size() - 1;
        if (max_length == 0 || length <= max_length)
        {
            return std::string(text);
        }
        if (max_length <= 3)
        {
            return std::string(text.substr(0, offsets[max_length]));
        }

        const auto keep = max_length - 1;
        std::string result;
        switch (where)
        {
        case Ellipsis::Left:
            result.append(kEllipsis);
            result.append(text.substr(offsets[length - keep]));
            break;
        case Ellipsis::Right:
            result.append(text.substr(0, offsets[keep]));
            result.append(kEllipsis);
            break;
        case Ellipsis::Middle:
        {
            const auto left = keep / 2;
            const auto right = keep - left;
            result.append(text.substr(0, offsets[left]));
            result.append(kEllipsis);
            result.append(text.substr(offsets[length - right]));
            break;
        }
        }
        return result;
    }

    std::string format_display_path(std::string_view remote_path, const DisplayOptions &options)
    {
        std::string display(remote_path);
        if (!options.rewrite_from.empty() && remote_path.starts_with(options.rewrite_from))
        {
            display = options.rewrite_to + std::string(remote_path.substr(options.rewrite_from.size()));
        }
        return ellipsize(display, options.max_length, options.ellipsis);
    }

} // namespace ftpmirror::client
