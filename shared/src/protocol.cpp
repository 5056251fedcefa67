#include "ftpmirror/protocol.hpp"

#include "ftpmirror/reply.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <chrono>
#include <sstream>

namespace ftpmirror::protocol
{

    namespace
    {

        struct EntryTypeMapping
        {
            EntryType type;
            std::string_view label;
        };

        constexpr std::array<EntryTypeMapping, 5> kEntryTypeMappings{{
            {EntryType::Unknown, "unknown"},
            {EntryType::File, "file"},
            {EntryType::Directory, "dir"},
            {EntryType::CurrentDirectory, "cdir"},
            {EntryType::ParentDirectory, "pdir"},
        }};

        bool iequals(std::string_view lhs, std::string_view rhs)
        {
            return lhs.size() == rhs.size() &&
                   std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b)
                              { return std::tolower(static_cast<unsigned char>(a)) ==
                                       std::tolower(static_cast<unsigned char>(b)); });
        }

        template <typename T>
        std::optional<T> parse_number(std::string_view text)
        {
            T value{};
            const auto *begin = text.data();
            const auto *end = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc{} || ptr != end || text.empty())
            {
                return std::nullopt;
            }
            return value;
        }

        bool is_hex_token(std::string_view token)
        {
            return !token.empty() && std::all_of(token.begin(), token.end(), [](char ch)
                                                 { return std::isxdigit(static_cast<unsigned char>(ch)) != 0; });
        }

        EntryType entry_type_from_fact(std::string_view value)
        {
            if (iequals(value, "file"))
            {
                return EntryType::File;
            }
            if (iequals(value, "dir"))
            {
                return EntryType::Directory;
            }
            if (iequals(value, "cdir"))
            {
                return EntryType::CurrentDirectory;
            }
            if (iequals(value, "pdir"))
            {
                return EntryType::ParentDirectory;
            }
            return EntryType::Unknown;
        }

    } // namespace

    std::string_view to_string(EntryType type) noexcept
    {
        for (const auto &mapping : kEntryTypeMappings)
        {
            if (mapping.type == type)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<MlsdEntry> parse_mlsd_line(std::string_view line)
    {
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        {
            line.remove_suffix(1);
        }
        if (line.empty())
        {
            return std::nullopt;
        }

        // Facts are terminated by "; " before the name. NcFTPd omits the final semicolon.
        std::string_view facts;
        std::string_view name;
        const auto separator = line.find("; ");
        if (separator != std::string_view::npos)
        {
            facts = line.substr(0, separator);
            name = line.substr(separator + 2);
        }
        else
        {
            const auto space = line.find(' ');
            if (space == std::string_view::npos)
            {
                return std::nullopt;
            }
            facts = line.substr(0, space);
            name = line.substr(space + 1);
        }
        if (name.empty())
        {
            return std::nullopt;
        }

        MlsdEntry entry;
        entry.name = std::string(name);

        while (!facts.empty())
        {
            const auto end = facts.find(';');
            const auto fact = facts.substr(0, end);
            facts = end == std::string_view::npos ? std::string_view{} : facts.substr(end + 1);

            const auto equals = fact.find('=');
            if (equals == std::string_view::npos)
            {
                continue;
            }
            const auto key = fact.substr(0, equals);
            const auto value = fact.substr(equals + 1);
            if (iequals(key, "type"))
            {
                entry.type = entry_type_from_fact(value);
            }
            else if (iequals(key, "size") || iequals(key, "sizd"))
            {
                if (!entry.size)
                {
                    entry.size = parse_number<std::uint64_t>(value);
                }
            }
            else if (iequals(key, "modify"))
            {
                entry.modify_time = parse_modify_time(value);
            }
        }

        if (entry.name == ".")
        {
            entry.type = EntryType::CurrentDirectory;
        }
        else if (entry.name == "..")
        {
            entry.type = EntryType::ParentDirectory;
        }
        return entry;
    }

    std::optional<std::int64_t> parse_modify_time(std::string_view value)
    {
        const auto dot = value.find('.');
        const auto digits = value.substr(0, dot);
        if (digits.size() != 14)
        {
            return std::nullopt;
        }
        const auto y = parse_number<int>(digits.substr(0, 4));
        const auto mo = parse_number<unsigned>(digits.substr(4, 2));
        const auto d = parse_number<unsigned>(digits.substr(6, 2));
        const auto h = parse_number<int>(digits.substr(8, 2));
        const auto mi = parse_number<int>(digits.substr(10, 2));
        const auto s = parse_number<int>(digits.substr(12, 2));
        if (!y || !mo || !d || !h || !mi || !s)
        {
            return std::nullopt;
        }
        if (*h > 23 || *mi > 59 || *s > 60)
        {
            return std::nullopt;
        }

        const std::chrono::year_month_day date{std::chrono::year{*y}, std::chrono::month{*mo}, std::chrono::day{*d}};
        if (!date.ok())
        {
            return std::nullopt;
        }
        const auto point = std::chrono::sys_days{date} + std::chrono::hours{*h} + std::chrono::minutes{*mi} +
                           std::chrono::seconds{*s};
        return static_cast<std::int64_t>(point.time_since_epoch().count());
    }

    std::optional<PassiveEndpoint> parse_pasv_reply(std::string_view message)
    {
        const auto first_digit = std::find_if(message.begin(), message.end(), [](char ch)
                                              { return std::isdigit(static_cast<unsigned char>(ch)) != 0; });
        if (first_digit == message.end())
        {
            return std::nullopt;
        }
        auto rest = message.substr(static_cast<std::size_t>(first_digit - message.begin()));

        std::array<unsigned, 6> numbers{};
        for (std::size_t i = 0; i < numbers.size(); ++i)
        {
            std::size_t length = 0;
            while (length < rest.size() && std::isdigit(static_cast<unsigned char>(rest[length])))
            {
                ++length;
            }
            const auto value = parse_number<unsigned>(rest.substr(0, length));
            if (!value || *value > 255)
            {
                return std::nullopt;
            }
            numbers[i] = *value;
            rest.remove_prefix(length);
            if (i + 1 < numbers.size())
            {
                if (rest.empty() || rest.front() != ',')
                {
                    return std::nullopt;
                }
                rest.remove_prefix(1);
            }
        }

        PassiveEndpoint endpoint;
        for (std::size_t i = 0; i < 4; ++i)
        {
            endpoint.address[i] = static_cast<std::uint8_t>(numbers[i]);
        }
        endpoint.port = static_cast<std::uint16_t>((numbers[4] << 8) | numbers[5]);
        return endpoint;
    }

    std::optional<std::uint16_t> parse_epsv_reply(std::string_view message)
    {
        const auto open = message.find('(');
        if (open == std::string_view::npos || open + 1 >= message.size())
        {
            return std::nullopt;
        }
        const char delimiter = message[open + 1];
        auto rest = message.substr(open + 1);
        // Expected form: <d><d><d><port><d>
        if (rest.size() < 5 || rest[0] != delimiter || rest[1] != delimiter || rest[2] != delimiter)
        {
            return std::nullopt;
        }
        rest.remove_prefix(3);
        const auto close = rest.find(delimiter);
        if (close == std::string_view::npos)
        {
            return std::nullopt;
        }
        const auto port = parse_number<unsigned>(rest.substr(0, close));
        if (!port || *port == 0 || *port > 65535)
        {
            return std::nullopt;
        }
        return static_cast<std::uint16_t>(*port);
    }

    std::string format_port_argument(const std::array<std::uint8_t, 4> &address, std::uint16_t port)
    {
        std::ostringstream oss;
        for (const auto octet : address)
        {
            oss << static_cast<unsigned>(octet) << ',';
        }
        oss << (port >> 8) << ',' << (port & 0xFF);
        return oss.str();
    }

    std::optional<std::string> parse_pwd_reply(std::string_view message)
    {
        const auto open = message.find('"');
        if (open == std::string_view::npos)
        {
            return std::nullopt;
        }
        std::string path;
        for (std::size_t i = open + 1; i < message.size(); ++i)
        {
            if (message[i] == '"')
            {
                if (i + 1 < message.size() && message[i + 1] == '"')
                {
                    path.push_back('"');
                    ++i;
                    continue;
                }
                return path;
            }
            path.push_back(message[i]);
        }
        return std::nullopt;
    }

    FeatureSet parse_features(const std::vector<std::string> &lines)
    {
        FeatureSet features;
        for (const auto &raw : lines)
        {
            if (parse_reply_code(raw))
            {
                continue;
            }
            const auto line = trim(raw);
            const auto upper = to_upper(line);

            if (upper.rfind("HASH", 0) == 0 && (upper.size() == 4 || upper[4] == ' '))
            {
                features.hash = true;
                if (line.size() > 5)
                {
                    std::string_view list(line);
                    list.remove_prefix(5);
                    while (!list.empty())
                    {
                        const auto end = list.find(';');
                        auto item = trim(list.substr(0, end));
                        list = end == std::string_view::npos ? std::string_view{} : list.substr(end + 1);
                        const bool active = !item.empty() && item.back() == '*';
                        item.erase(std::remove(item.begin(), item.end(), '*'), item.end());
                        if (item.empty())
                        {
                            continue;
                        }
                        if (active)
                        {
                            features.active_hash = item;
                        }
                        features.hash_algorithms.push_back(std::move(item));
                    }
                }
            }
            if (upper.find("XCRC") != std::string::npos ||
                (upper.find("SITE") != std::string::npos && upper.find("CRC") != std::string::npos))
            {
                features.legacy_crc = true;
            }
            if (upper.rfind("MLST", 0) == 0)
            {
                features.mlst = true;
            }
            if (upper == "SIZE")
            {
                features.size = true;
            }
            if (upper == "REST STREAM")
            {
                features.rest_stream = true;
            }
        }
        return features;
    }

    std::optional<std::string> extract_checksum_token(std::string_view message, std::string_view path)
    {
        auto text = std::string_view(message);
        while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        {
            text.remove_suffix(1);
        }
        if (!path.empty() && text.size() > path.size() && text.substr(text.size() - path.size()) == path)
        {
            text.remove_suffix(path.size());
        }

        std::vector<std::string_view> tokens;
        std::size_t pos = 0;
        while (pos < text.size())
        {
            while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])))
            {
                ++pos;
            }
            const auto start = pos;
            while (pos < text.size() && !std::isspace(static_cast<unsigned char>(text[pos])))
            {
                ++pos;
            }
            if (pos > start)
            {
                tokens.push_back(text.substr(start, pos - start));
            }
        }

        for (auto it = tokens.rbegin(); it != tokens.rend(); ++it)
        {
            if (is_hex_token(*it))
            {
                return to_lower(std::string(*it));
            }
        }
        return std::nullopt;
    }

    std::string listing_name(std::string_view value)
    {
        while (!value.empty() && (value.back() == '/' || value.back() == '\r'))
        {
            value.remove_suffix(1);
        }
        const auto slash = value.rfind('/');
        if (slash != std::string_view::npos)
        {
            value.remove_prefix(slash + 1);
        }
        return std::string(value);
    }

    std::string to_upper(std::string value)
    {
        for (auto &ch : value)
        {
            ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
        }
        return value;
    }

    std::string to_lower(std::string value)
    {
        for (auto &ch : value)
        {
            ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
        return value;
    }

    std::string trim(std::string_view input)
    {
        const auto begin = input.find_first_not_of(" \t\r\n");
        if (begin == std::string_view::npos)
        {
            return "";
        }
        const auto end = input.find_last_not_of(" \t\r\n");
        return std::string(input.substr(begin, end - begin + 1));
    }

} // namespace ftpmirror::protocol
