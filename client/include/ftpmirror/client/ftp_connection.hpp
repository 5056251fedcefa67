#pragma once

#include <asio.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "ftpmirror/client/config.hpp"
#include "ftpmirror/client/errors.hpp"
#include "ftpmirror/client/logger.hpp"
#include "ftpmirror/reply.hpp"

namespace ftpmirror::client
{

    // One FTP control connection plus the data connections it opens.
    // Every blocking step is bounded by ServerSettings::timeout; a timeout closes the
    // affected socket and raises TransportError.
    class FtpConnection
    {
    public:
        using DataSink = std::function<void(std::span<const char>)>;

        FtpConnection(ServerSettings settings, Logger logger);
        ~FtpConnection();

        FtpConnection(const FtpConnection &) = delete;
        FtpConnection &operator=(const FtpConnection &) = delete;

        // TCP connect and greeting.
        void open();
        void login();
        void set_binary();
        // SO_KEEPALIVE on the control socket; failures are only logged.
        void enable_keepalive();

        bool is_open() const noexcept { return control_.is_open(); }

        // Sends a command and returns the final (non-1xx) reply, whatever its class.
        protocol::Reply execute(const std::string &command);
        // Like execute() but throws ReplyError unless the reply is 2xx.
        protocol::Reply execute_ok(const std::string &command);

        std::vector<std::string> features();
        std::string pwd();
        void cwd(const std::string &path);
        std::uint64_t size(const std::string &path);
        void noop();

        // Runs a listing command (MLSD, NLST) and returns the data connection's lines.
        std::vector<std::string> retrieve_lines(const std::string &command);

        // RETR with an optional REST offset. Blocks of up to block_size bytes are handed to sink.
        // Returns the number of bytes received.
        std::uint64_t retrieve(const std::string &path, std::uint64_t offset, std::size_t block_size,
                               const DataSink &sink);

        // QUIT; throws if the server does not answer.
        void quit();
        void close() noexcept;

        const ServerSettings &settings() const noexcept { return settings_; }

    private:
        using Socket = asio::ip::tcp::socket;

        struct DataChannel
        {
            explicit DataChannel(asio::io_context &io) : socket(io), acceptor(io) {}

            Socket socket;
            asio::ip::tcp::acceptor acceptor;
        };

        template <typename Closable>
        void await(Closable &closable, const std::string &what);

        void send_line(const std::string &line);
        std::string read_line();
        protocol::Reply read_reply();

        // Opens the passive connection or the active listener before the transfer command.
        void prepare_data_channel(DataChannel &channel);
        // For active mode, waits for the server to connect once the command was accepted.
        void complete_data_channel(DataChannel &channel);
        void start_transfer(DataChannel &channel, const std::string &command, std::optional<std::uint64_t> offset);
        std::uint64_t drain(DataChannel &channel, std::size_t block_size, const DataSink &sink);
        void finish_transfer(const std::string &command);

        ServerSettings settings_;
        Logger logger_;
        asio::io_context io_context_;
        Socket control_;
        asio::streambuf control_buffer_;
        bool use_epsv_{false};
    };

} // namespace ftpmirror::client
