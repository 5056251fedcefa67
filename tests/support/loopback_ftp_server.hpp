#pragma once

#include <asio.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace ftpmirror::testing
{

    struct ServerOptions
    {
        bool mlsd{true};
        // Without type facts every MLSD entry has to be probed.
        bool mlsd_type_facts{true};
        bool mlsd_size_facts{true};
        bool size_command{true};
        bool pasv{true};
        // Advertised in FEAT as "HASH a*;b;c"; the first one is active. Empty disables HASH.
        std::vector<std::string> hash_algorithms;
        bool legacy_crc{};
    };

    struct RetrDrop
    {
        // 1-based count of RETR commands for the path.
        std::size_t retr{1};
        std::uint64_t after{};
    };

    struct FaultPlan
    {
        // Remote path -> bytes sent before the first RETR of it drops the connection.
        std::map<std::string, std::uint64_t> drop_retr_after;
        // Remote path -> bytes sent before every RETR of it drops the connection.
        std::map<std::string, std::uint64_t> drop_every_retr;
        // Remote path -> one specific RETR of it drops the connection.
        std::map<std::string, RetrDrop> drop_nth_retr;
        // Remote path -> amount added to the size reported by MLSD and SIZE.
        std::map<std::string, std::int64_t> advertised_size_delta;
        // The first RETR of these paths delivers altered bytes.
        std::set<std::string> corrupt_first_retr;
        // HASH, XCRC and SITE CRC always report a wrong digest for these paths.
        std::set<std::string> wrong_hash;
        // Drop the connection instead of answering the Nth NOOP (1-based, 0 = never).
        int drop_on_noop{};
        // Drop the connection on this many MLSD/NLST commands before answering normally.
        int fail_list_count{};
        // Refuse every connection attempt with 421.
        bool refuse_logins{};
    };

    // Minimal FTP server on 127.0.0.1 serving a local directory, with fault injection.
    class LoopbackFtpServer
    {
    public:
        explicit LoopbackFtpServer(std::filesystem::path root, ServerOptions options = {});
        ~LoopbackFtpServer();

        LoopbackFtpServer(const LoopbackFtpServer &) = delete;
        LoopbackFtpServer &operator=(const LoopbackFtpServer &) = delete;

        std::uint16_t port() const noexcept { return port_; }

        void set_faults(FaultPlan faults);

        std::size_t command_count(const std::string &verb) const;
        std::size_t retr_count(const std::string &path) const;
        std::vector<std::uint64_t> rest_offsets() const;
        std::uint64_t bytes_sent(const std::string &path) const;
        std::size_t sessions() const;
        void reset_observations();

        void stop();

    private:
        class Session;
        friend class Session;

        void accept_next();

        // Shared state, called from session handlers.
        const ServerOptions &options() const noexcept { return options_; }
        const std::filesystem::path &root() const noexcept { return root_; }
        void record_command(const std::string &verb);
        void record_retr(const std::string &path);
        void record_rest(std::uint64_t offset);
        void record_bytes(const std::string &path, std::uint64_t bytes);
        std::optional<std::uint64_t> take_retr_drop(const std::string &path);
        bool take_corruption(const std::string &path);
        std::uint64_t advertised_size(const std::string &path, std::uint64_t actual) const;
        bool wrong_hash(const std::string &path) const;
        bool take_noop_drop();
        bool take_list_failure();
        bool refuse_logins() const;

        std::filesystem::path root_;
        ServerOptions options_;
        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        std::uint16_t port_{};
        std::vector<std::thread> workers_;
        bool stopped_{false};

        mutable std::mutex mutex_;
        FaultPlan faults_;
        std::map<std::string, std::size_t> commands_;
        std::map<std::string, std::size_t> retrs_;
        std::vector<std::uint64_t> rest_offsets_;
        std::map<std::string, std::uint64_t> bytes_sent_;
        std::size_t sessions_{0};
        int noops_seen_{0};
        int lists_failed_{0};
    };

} // namespace ftpmirror::testing
