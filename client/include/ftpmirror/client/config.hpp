#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "ftpmirror/checksum.hpp"
#include "ftpmirror/error_codes.hpp"

namespace ftpmirror::client
{

    enum class VerifyMode : std::uint8_t
    {
        Auto,
        Always,
        Never
    };

    std::string_view to_string(VerifyMode mode) noexcept;
    std::optional<VerifyMode> verify_mode_from_string(std::string_view value) noexcept;

    enum class Ellipsis : std::uint8_t
    {
        Left,
        Middle,
        Right
    };

    std::optional<Ellipsis> ellipsis_from_string(std::string_view value) noexcept;

    // Uniform retry policy: attempt N (1-based) is followed by a pause of base_delay * N.
    struct RetryPolicy
    {
        int max_attempts{3};
        std::chrono::milliseconds base_delay{2000};

        std::chrono::milliseconds delay_for(int attempt) const
        {
            return base_delay * attempt;
        }
    };

    struct ServerSettings
    {
        std::string host;
        std::uint16_t port{21};
        std::string user{"ftp"};
        std::string password{"any"};
        bool passive{true};
        std::chrono::seconds timeout{300};
    };

    struct TransferSettings
    {
        std::size_t block_size{1024 * 1024};
        bool resume{true};
        bool skip_same_size{true};
        bool overwrite_differ{false};
        bool sync_mtime{true};
        VerifyMode verify{VerifyMode::Auto};
        std::vector<checksum::HashAlgorithm> hash_preference{
            checksum::HashAlgorithm::Crc32,
            checksum::HashAlgorithm::Md5,
            checksum::HashAlgorithm::Sha1,
            checksum::HashAlgorithm::Sha256,
        };
    };

    struct DisplayOptions
    {
        std::string rewrite_from;
        std::string rewrite_to;
        std::size_t max_length{0};
        Ellipsis ellipsis{Ellipsis::Middle};
    };

    struct LogSettings
    {
        bool file{true};
        std::optional<std::filesystem::path> directory;
        bool header{true};
        bool verbose{false};
    };

    struct MirrorConfig
    {
        ServerSettings server;
        RetryPolicy retry;
        TransferSettings transfer;
        DisplayOptions display;
        LogSettings log;
        std::string remote_path{"/"};
        std::filesystem::path local_root{"mirror"};
    };

    struct CommandLine
    {
        MirrorConfig config;
        bool show_help{};
        bool show_version{};
    };

    class ConfigError : public MirrorError
    {
    public:
        explicit ConfigError(std::string message);
    };

    CommandLine parse_arguments(int argc, char *argv[]);

    // Merges the keys present in the JSON document into config; absent keys keep their value.
    void apply_config_json(const nlohmann::json &json, MirrorConfig &config);

    void load_config_file(const std::filesystem::path &path, MirrorConfig &config);

    void validate(const MirrorConfig &config);

    std::string usage(std::string_view program);

} // namespace ftpmirror::client
