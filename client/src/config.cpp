#include "ftpmirror/client/config.hpp"

#include <array>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace ftpmirror::client
{

    namespace
    {

        struct VerifyModeMapping
        {
            VerifyMode mode;
            std::string_view label;
        };

        constexpr std::array<VerifyModeMapping, 3> kVerifyModeMappings{{
            {VerifyMode::Auto, "auto"},
            {VerifyMode::Always, "always"},
            {VerifyMode::Never, "never"},
        }};

        std::string require_value(int &index, int argc, char *argv[], const std::string &flag)
        {
            if (index >= argc)
            {
                throw ConfigError(flag + " requires a value");
            }
            return argv[index++];
        }

        long long parse_integer(const std::string &value, const std::string &what)
        {
            try
            {
                std::size_t consumed = 0;
                const auto result = std::stoll(value, &consumed);
                if (consumed != value.size())
                {
                    throw ConfigError("Invalid " + what + ": " + value);
                }
                return result;
            }
            catch (const std::logic_error &)
            {
                throw ConfigError("Invalid " + what + ": " + value);
            }
        }

        double parse_seconds(const std::string &value, const std::string &what)
        {
            try
            {
                std::size_t consumed = 0;
                const auto result = std::stod(value, &consumed);
                if (consumed != value.size() || !std::isfinite(result) || result < 0)
                {
                    throw ConfigError("Invalid " + what + ": " + value);
                }
                return result;
            }
            catch (const std::logic_error &)
            {
                throw ConfigError("Invalid " + what + ": " + value);
            }
        }

        std::chrono::milliseconds to_milliseconds(double seconds)
        {
            return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
        }

        std::uint16_t to_port(long long value)
        {
            if (value <= 0 || value > 65535)
            {
                throw ConfigError("Port out of range: " + std::to_string(value));
            }
            return static_cast<std::uint16_t>(value);
        }

        std::vector<checksum::HashAlgorithm> parse_hash_list(const std::vector<std::string> &names)
        {
            std::vector<checksum::HashAlgorithm> result;
            for (const auto &name : names)
            {
                const auto algorithm = checksum::hash_algorithm_from_string(name);
                if (!algorithm)
                {
                    throw ConfigError("Unknown hash algorithm: " + name);
                }
                result.push_back(*algorithm);
            }
            return result;
        }

        std::vector<std::string> split_list(const std::string &value)
        {
            std::vector<std::string> items;
            std::istringstream iss(value);
            std::string item;
            while (std::getline(iss, item, ','))
            {
                if (!item.empty())
                {
                    items.push_back(item);
                }
            }
            return items;
        }

        // "[user@]host[:port]"
        void apply_endpoint(const std::string &endpoint, MirrorConfig &config)
        {
            std::string host_part = endpoint;
            const auto at_pos = endpoint.rfind('@');
            if (at_pos != std::string::npos)
            {
                config.server.user = endpoint.substr(0, at_pos);
                host_part = endpoint.substr(at_pos + 1);
            }
            const auto colon_pos = host_part.find(':');
            if (colon_pos != std::string::npos)
            {
                config.server.port = to_port(parse_integer(host_part.substr(colon_pos + 1), "port"));
                host_part = host_part.substr(0, colon_pos);
            }
            config.server.host = host_part;
        }

        template <typename T>
        void read_if_present(const nlohmann::json &json, const char *key, T &target)
        {
            const auto it = json.find(key);
            if (it != json.end() && !it->is_null())
            {
                target = it->get<T>();
            }
        }

    } // namespace

    ConfigError::ConfigError(std::string message)
        : MirrorError(ErrorCode::InvalidConfig, std::move(message)) {}

    std::string_view to_string(VerifyMode mode) noexcept
    {
        for (const auto &mapping : kVerifyModeMappings)
        {
            if (mapping.mode == mode)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<VerifyMode> verify_mode_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kVerifyModeMappings)
        {
            if (mapping.label == value)
            {
                return mapping.mode;
            }
        }
        if (value == "true")
        {
            return VerifyMode::Always;
        }
        if (value == "false")
        {
            return VerifyMode::Never;
        }
        return std::nullopt;
    }

    std::optional<Ellipsis> ellipsis_from_string(std::string_view value) noexcept
    {
        if (value == "left")
        {
            return Ellipsis::Left;
        }
        if (value == "middle")
        {
            return Ellipsis::Middle;
        }
        if (value == "right")
        {
            return Ellipsis::Right;
        }
        return std::nullopt;
    }

    void apply_config_json(const nlohmann::json &json, MirrorConfig &config)
    {
        if (!json.is_object())
        {
            throw ConfigError("Configuration root must be a JSON object");
        }
        try
        {
            read_if_present(json, "host", config.server.host);
            if (const auto it = json.find("port"); it != json.end())
            {
                config.server.port = to_port(it->get<long long>());
            }
            read_if_present(json, "user", config.server.user);
            read_if_present(json, "password", config.server.password);
            read_if_present(json, "passive", config.server.passive);
            if (const auto it = json.find("timeout_seconds"); it != json.end())
            {
                config.server.timeout = std::chrono::seconds(it->get<std::int64_t>());
            }
            read_if_present(json, "max_retries", config.retry.max_attempts);
            if (const auto it = json.find("retry_delay_seconds"); it != json.end())
            {
                config.retry.base_delay = to_milliseconds(it->get<double>());
            }
            read_if_present(json, "remote_path", config.remote_path);
            if (const auto it = json.find("local_root"); it != json.end())
            {
                config.local_root = std::filesystem::path(it->get<std::string>());
            }

            read_if_present(json, "block_size", config.transfer.block_size);
            read_if_present(json, "resume", config.transfer.resume);
            read_if_present(json, "skip_same_size", config.transfer.skip_same_size);
            read_if_present(json, "overwrite_differ", config.transfer.overwrite_differ);
            read_if_present(json, "sync_mtime", config.transfer.sync_mtime);
            if (const auto it = json.find("verify"); it != json.end())
            {
                // The original boolean form maps onto always/never.
                const auto text = it->is_boolean() ? std::string(it->get<bool>() ? "always" : "never")
                                                   : it->get<std::string>();
                const auto mode = verify_mode_from_string(text);
                if (!mode)
                {
                    throw ConfigError("Invalid verify mode: " + text);
                }
                config.transfer.verify = *mode;
            }
            if (const auto it = json.find("hash_preference"); it != json.end())
            {
                config.transfer.hash_preference = parse_hash_list(it->get<std::vector<std::string>>());
            }

            if (const auto it = json.find("log_dir"); it != json.end() && !it->is_null())
            {
                config.log.directory = std::filesystem::path(it->get<std::string>());
            }
            read_if_present(json, "log_file", config.log.file);
            read_if_present(json, "header", config.log.header);
            read_if_present(json, "verbose", config.log.verbose);

            if (const auto it = json.find("display"); it != json.end() && it->is_object())
            {
                read_if_present(*it, "rewrite_from", config.display.rewrite_from);
                read_if_present(*it, "rewrite_to", config.display.rewrite_to);
                read_if_present(*it, "max_length", config.display.max_length);
                if (const auto ellipsis = it->find("ellipsis"); ellipsis != it->end())
                {
                    const auto text = ellipsis->get<std::string>();
                    const auto value = ellipsis_from_string(text);
                    if (!value)
                    {
                        throw ConfigError("Invalid ellipsis position: " + text);
                    }
                    config.display.ellipsis = *value;
                }
            }
        }
        catch (const nlohmann::json::exception &ex)
        {
            throw ConfigError(std::string("Invalid configuration value: ") + ex.what());
        }
    }

    void load_config_file(const std::filesystem::path &path, MirrorConfig &config)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw ConfigError("Cannot open configuration file: " + path.string());
        }
        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            throw ConfigError("Malformed configuration file " + path.string() + ": " + ex.what());
        }
        apply_config_json(json, config);
    }

    void validate(const MirrorConfig &config)
    {
        if (config.server.host.empty())
        {
            throw ConfigError("No server given (use [user@]host[:port] or --host)");
        }
        if (config.retry.max_attempts < 1)
        {
            throw ConfigError("max_retries must be at least 1");
        }
        if (config.transfer.block_size == 0)
        {
            throw ConfigError("block_size must be positive");
        }
        if (config.server.timeout.count() <= 0)
        {
            throw ConfigError("timeout must be positive");
        }
        if (config.local_root.empty())
        {
            throw ConfigError("local root must not be empty");
        }
        if (config.transfer.hash_preference.empty() && config.transfer.verify != VerifyMode::Never)
        {
            throw ConfigError("hash preference list must not be empty unless verification is disabled");
        }
    }

    CommandLine parse_arguments(int argc, char *argv[])
    {
        CommandLine command_line;
        auto &config = command_line.config;

        // The configuration file is applied first so that flags override it.
        for (int i = 1; i + 1 < argc; ++i)
        {
            if (std::string(argv[i]) == "--config")
            {
                load_config_file(std::filesystem::path(argv[i + 1]), config);
            }
        }

        int index = 1;
        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--help" || arg == "-h")
            {
                command_line.show_help = true;
            }
            else if (arg == "--version")
            {
                command_line.show_version = true;
            }
            else if (arg == "--config")
            {
                (void)require_value(index, argc, argv, arg);
            }
            else if (arg == "--host")
            {
                config.server.host = require_value(index, argc, argv, arg);
            }
            else if (arg == "--port")
            {
                config.server.port = to_port(parse_integer(require_value(index, argc, argv, arg), "port"));
            }
            else if (arg == "--user")
            {
                config.server.user = require_value(index, argc, argv, arg);
            }
            else if (arg == "--password")
            {
                config.server.password = require_value(index, argc, argv, arg);
            }
            else if (arg == "--remote")
            {
                config.remote_path = require_value(index, argc, argv, arg);
            }
            else if (arg == "--local")
            {
                config.local_root = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--active")
            {
                config.server.passive = false;
            }
            else if (arg == "--passive")
            {
                config.server.passive = true;
            }
            else if (arg == "--timeout")
            {
                config.server.timeout =
                    std::chrono::seconds(parse_integer(require_value(index, argc, argv, arg), "timeout"));
            }
            else if (arg == "--retries")
            {
                config.retry.max_attempts =
                    static_cast<int>(parse_integer(require_value(index, argc, argv, arg), "retry count"));
            }
            else if (arg == "--retry-delay")
            {
                config.retry.base_delay =
                    to_milliseconds(parse_seconds(require_value(index, argc, argv, arg), "retry delay"));
            }
            else if (arg == "--block-size")
            {
                const auto value = parse_integer(require_value(index, argc, argv, arg), "block size");
                if (value <= 0)
                {
                    throw ConfigError("block size must be positive");
                }
                config.transfer.block_size = static_cast<std::size_t>(value);
            }
            else if (arg == "--no-resume")
            {
                config.transfer.resume = false;
            }
            else if (arg == "--no-skip-same-size")
            {
                config.transfer.skip_same_size = false;
            }
            else if (arg == "--overwrite-differ")
            {
                config.transfer.overwrite_differ = true;
            }
            else if (arg == "--no-mtime")
            {
                config.transfer.sync_mtime = false;
            }
            else if (arg == "--verify")
            {
                const auto value = require_value(index, argc, argv, arg);
                const auto mode = verify_mode_from_string(value);
                if (!mode)
                {
                    throw ConfigError("--verify expects auto, always or never");
                }
                config.transfer.verify = *mode;
            }
            else if (arg == "--hash-order")
            {
                config.transfer.hash_preference = parse_hash_list(split_list(require_value(index, argc, argv, arg)));
            }
            else if (arg == "--log-dir")
            {
                config.log.directory = std::filesystem::path(require_value(index, argc, argv, arg));
            }
            else if (arg == "--no-log-file")
            {
                config.log.file = false;
            }
            else if (arg == "--no-header")
            {
                config.log.header = false;
            }
            else if (arg == "--verbose" || arg == "-v")
            {
                config.log.verbose = true;
            }
            else if (arg == "--display-rewrite-from")
            {
                config.display.rewrite_from = require_value(index, argc, argv, arg);
            }
            else if (arg == "--display-rewrite-to")
            {
                config.display.rewrite_to = require_value(index, argc, argv, arg);
            }
            else if (arg == "--display-max-length")
            {
                const auto value = parse_integer(require_value(index, argc, argv, arg), "display length");
                if (value < 0)
                {
                    throw ConfigError("display length must not be negative");
                }
                config.display.max_length = static_cast<std::size_t>(value);
            }
            else if (arg == "--display-ellipsis")
            {
                const auto value = ellipsis_from_string(require_value(index, argc, argv, arg));
                if (!value)
                {
                    throw ConfigError("--display-ellipsis expects left, middle or right");
                }
                config.display.ellipsis = *value;
            }
            else if (!arg.empty() && arg.front() == '-')
            {
                throw ConfigError("Unknown argument: " + arg);
            }
            else
            {
                apply_endpoint(arg, config);
            }
        }

        return command_line;
    }

    std::string usage(std::string_view program)
    {
        std::ostringstream oss;
        oss << "Usage: " << program << " [user@]host[:port] [options]\n"
            << "\nConnection:\n"
            << "  --config <file>              Read settings from a JSON file (flags override it)\n"
            << "  --host <host>                FTP server\n"
            << "  --port <port>                Control port (default 21)\n"
            << "  --user <name>                Login name (default ftp)\n"
            << "  --password <secret>          Password (default any)\n"
            << "  --active | --passive         Data connection mode (default passive)\n"
            << "  --timeout <seconds>          Network timeout (default 300)\n"
            << "  --retries <n>                Attempts per operation (default 3)\n"
            << "  --retry-delay <seconds>      Base delay between attempts (default 2)\n"
            << "\nMirror:\n"
            << "  --remote <path>              Remote directory to mirror (default /)\n"
            << "  --local <dir>                Local target directory (default mirror)\n"
            << "  --block-size <bytes>         Transfer block size (default 1048576)\n"
            << "  --no-resume                  Always download from the start\n"
            << "  --no-skip-same-size          Re-download files whose size already matches\n"
            << "  --overwrite-differ           Replace local files whose size differs instead of resuming\n"
            << "  --no-mtime                   Do not copy remote modification times\n"
            << "  --verify <auto|always|never> Server checksum verification (default auto)\n"
            << "  --hash-order <list>          Preferred algorithms, e.g. CRC32,MD5,SHA-1,SHA-256\n"
            << "\nOutput:\n"
            << "  --log-dir <dir>              Directory for the dated log file\n"
            << "  --no-log-file                Log to the console only\n"
            << "  --no-header                  Skip the start banner\n"
            << "  --verbose, -v                Log protocol traffic\n"
            << "  --display-rewrite-from <p>   Remote prefix to shorten in output\n"
            << "  --display-rewrite-to <p>     Replacement for that prefix\n"
            << "  --display-max-length <n>     Truncate displayed paths (0 = off)\n"
            << "  --display-ellipsis <pos>     left, middle or right\n"
            << "  --help, --version\n";
        return oss.str();
    }

} // namespace ftpmirror::client
