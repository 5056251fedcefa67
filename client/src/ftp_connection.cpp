#include "ftpmirror/client/ftp_connection.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/read_until.hpp>
#include <asio/write.hpp>

#include <charconv>
#include <istream>
#include <utility>

#include "ftpmirror/protocol.hpp"

namespace ftpmirror::client
{

    namespace
    {

        std::vector<std::string> split_lines(const std::string &data)
        {
            std::vector<std::string> lines;
            std::size_t start = 0;
            while (start < data.size())
            {
                auto end = data.find('\n', start);
                if (end == std::string::npos)
                {
                    end = data.size();
                }
                auto line = data.substr(start, end - start);
                if (!line.empty() && line.back() == '\r')
                {
                    line.pop_back();
                }
                if (!line.empty())
                {
                    lines.push_back(std::move(line));
                }
                start = end + 1;
            }
            return lines;
        }

        std::string command_verb(const std::string &command)
        {
            const auto space = command.find(' ');
            return space == std::string::npos ? command : command.substr(0, space);
        }

    } // namespace

    FtpConnection::FtpConnection(ServerSettings settings, Logger logger)
        : settings_(std::move(settings)),
          logger_(std::move(logger)),
          control_(io_context_) {}

    FtpConnection::~FtpConnection()
    {
        close();
    }

    template <typename Closable>
    void FtpConnection::await(Closable &closable, const std::string &what)
    {
        io_context_.restart();
        io_context_.run_for(settings_.timeout);
        if (!io_context_.stopped())
        {
            std::error_code ignored;
            closable.close(ignored);
            io_context_.run();
            throw TransportError(what + " timed out after " + std::to_string(settings_.timeout.count()) + "s",
                                 ErrorCode::Timeout);
        }
    }

    void FtpConnection::open()
    {
        asio::ip::tcp::resolver resolver(io_context_);
        std::error_code ec;
        const auto endpoints = resolver.resolve(settings_.host, std::to_string(settings_.port), ec);
        if (ec)
        {
            throw TransportError("Cannot resolve " + settings_.host + ": " + ec.message(), ErrorCode::ConnectionFailed);
        }

        asio::async_connect(control_, endpoints,
                            [&ec](const std::error_code &result, const asio::ip::tcp::endpoint & /*endpoint*/)
                            { ec = result; });
        await(control_, "connect to " + settings_.host);
        if (ec)
        {
            close();
            throw TransportError("Cannot connect to " + settings_.host + ":" + std::to_string(settings_.port) + ": " +
                                     ec.message(),
                                 ErrorCode::ConnectionFailed);
        }

        auto greeting = read_reply();
        while (greeting.is_preliminary())
        {
            greeting = read_reply();
        }
        if (!greeting.is_positive())
        {
            throw ReplyError("connect", greeting);
        }
        logger_.debug("ftp", "connected to ", settings_.host, ':', settings_.port);
    }

    void FtpConnection::login()
    {
        auto reply = execute("USER " + settings_.user);
        if (reply.is_intermediate())
        {
            reply = execute("PASS " + settings_.password);
            if (!reply.is_positive())
            {
                throw ReplyError("PASS", reply);
            }
        }
        else if (!reply.is_positive())
        {
            throw ReplyError("USER " + settings_.user, reply);
        }
    }

    void FtpConnection::set_binary()
    {
        execute_ok("TYPE I");
    }

    void FtpConnection::enable_keepalive()
    {
        std::error_code ec;
        control_.set_option(asio::socket_base::keep_alive(true), ec);
        if (ec)
        {
            logger_.debug("ftp", "SO_KEEPALIVE not available: ", ec.message());
        }
    }

    void FtpConnection::send_line(const std::string &line)
    {
        if (!control_.is_open())
        {
            throw TransportError("Control connection is closed");
        }
        logger_.debug("ftp", "-> ", redact_command(line));
        const auto payload = line + "\r\n";
        std::error_code ec;
        asio::async_write(control_, asio::buffer(payload),
                          [&ec](const std::error_code &result, std::size_t /*bytes*/)
                          { ec = result; });
        await(control_, "sending " + command_verb(line));
        if (ec)
        {
            close();
            throw TransportError("Sending " + command_verb(line) + " failed: " + ec.message());
        }
    }

    std::string FtpConnection::read_line()
    {
        if (!control_.is_open())
        {
            throw TransportError("Control connection is closed");
        }
        std::error_code ec;
        asio::async_read_until(control_, control_buffer_, '\n',
                               [&ec](const std::error_code &result, std::size_t /*bytes*/)
                               { ec = result; });
        await(control_, "waiting for a reply");
        if (ec)
        {
            close();
            if (ec == asio::error::eof)
            {
                throw TransportError("Server closed the control connection");
            }
            throw TransportError("Control connection failed: " + ec.message());
        }

        std::istream input(&control_buffer_);
        std::string line;
        std::getline(input, line);
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        return line;
    }

    protocol::Reply FtpConnection::read_reply()
    {
        protocol::ReplyAssembler assembler;
        for (;;)
        {
            const auto line = read_line();
            logger_.debug("ftp", "<- ", line);
            std::optional<protocol::Reply> reply;
            try
            {
                reply = assembler.feed(line);
            }
            catch (const MirrorError &ex)
            {
                close();
                throw TransportError(ex.what(), ErrorCode::ProtocolViolation);
            }
            if (!reply)
            {
                continue;
            }
            if (reply->code == 421)
            {
                close();
                throw TransportError("Service not available: " + reply->text());
            }
            return *reply;
        }
    }

    protocol::Reply FtpConnection::execute(const std::string &command)
    {
        send_line(command);
        auto reply = read_reply();
        while (reply.is_preliminary())
        {
            reply = read_reply();
        }
        return reply;
    }

    protocol::Reply FtpConnection::execute_ok(const std::string &command)
    {
        auto reply = execute(command);
        if (!reply.is_positive())
        {
            throw ReplyError(command, std::move(reply));
        }
        return reply;
    }

    std::vector<std::string> FtpConnection::features()
    {
        return execute_ok("FEAT").lines;
    }

    std::string FtpConnection::pwd()
    {
        const auto reply = execute_ok("PWD");
        auto path = protocol::parse_pwd_reply(reply.message());
        if (!path)
        {
            throw ReplyError("PWD", reply);
        }
        return *path;
    }

    void FtpConnection::cwd(const std::string &path)
    {
        execute_ok("CWD " + path);
    }

    std::uint64_t FtpConnection::size(const std::string &path)
    {
        const auto command = "SIZE " + path;
        const auto reply = execute(command);
        if (reply.code != 213)
        {
            throw ReplyError(command, reply);
        }
        const auto text = protocol::trim(reply.message());
        std::uint64_t value = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec != std::errc{} || ptr == text.data())
        {
            throw ReplyError(command, reply);
        }
        return value;
    }

    void FtpConnection::noop()
    {
        execute_ok("NOOP");
    }

    void FtpConnection::prepare_data_channel(DataChannel &channel)
    {
        std::error_code ec;
        if (settings_.passive)
        {
            const auto peer = control_.remote_endpoint(ec);
            if (ec)
            {
                close();
                throw TransportError("Control connection lost: " + ec.message());
            }

            std::uint16_t port = 0;
            if (!use_epsv_)
            {
                const auto reply = execute("PASV");
                if (reply.code == 227)
                {
                    const auto endpoint = protocol::parse_pasv_reply(reply.message());
                    if (!endpoint)
                    {
                        throw TransportError("Malformed PASV reply: " + reply.text(), ErrorCode::ProtocolViolation);
                    }
                    // Data connections always go to the control peer; the advertised address is not used.
                    port = endpoint->port;
                }
                else
                {
                    logger_.debug("ftp", "PASV refused, switching to EPSV");
                    use_epsv_ = true;
                }
            }
            if (use_epsv_)
            {
                const auto reply = execute("EPSV");
                if (reply.code != 229)
                {
                    throw ReplyError("EPSV", reply);
                }
                const auto epsv_port = protocol::parse_epsv_reply(reply.message());
                if (!epsv_port)
                {
                    throw TransportError("Malformed EPSV reply: " + reply.text(), ErrorCode::ProtocolViolation);
                }
                port = *epsv_port;
            }

            channel.socket.async_connect(asio::ip::tcp::endpoint(peer.address(), port),
                                         [&ec](const std::error_code &result)
                                         { ec = result; });
            await(channel.socket, "data connection");
            if (ec)
            {
                throw TransportError("Data connection to port " + std::to_string(port) + " failed: " + ec.message());
            }
            return;
        }

        const auto local = control_.local_endpoint(ec);
        if (ec)
        {
            close();
            throw TransportError("Control connection lost: " + ec.message());
        }
        if (!local.address().is_v4())
        {
            throw TransportError("Active mode requires an IPv4 control connection", ErrorCode::Unsupported);
        }
        channel.acceptor.open(asio::ip::tcp::v4(), ec);
        if (!ec)
        {
            channel.acceptor.bind(asio::ip::tcp::endpoint(local.address(), 0), ec);
        }
        if (!ec)
        {
            channel.acceptor.listen(1, ec);
        }
        if (ec)
        {
            throw TransportError("Cannot listen for the data connection: " + ec.message());
        }
        const auto port = channel.acceptor.local_endpoint(ec).port();
        execute_ok("PORT " + protocol::format_port_argument(local.address().to_v4().to_bytes(), port));
    }

    void FtpConnection::complete_data_channel(DataChannel &channel)
    {
        if (settings_.passive)
        {
            return;
        }
        std::error_code ec;
        channel.acceptor.async_accept(channel.socket, [&ec](const std::error_code &result)
                                      { ec = result; });
        await(channel.acceptor, "waiting for the data connection");
        if (ec)
        {
            throw TransportError("Data connection not established: " + ec.message());
        }
        channel.acceptor.close(ec);
    }

    void FtpConnection::start_transfer(DataChannel &channel, const std::string &command,
                                       std::optional<std::uint64_t> offset)
    {
        prepare_data_channel(channel);
        if (offset && *offset > 0)
        {
            const auto rest = "REST " + std::to_string(*offset);
            const auto reply = execute(rest);
            if (!reply.is_intermediate())
            {
                throw ReplyError(rest, reply);
            }
        }
        send_line(command);
        const auto reply = read_reply();
        if (!reply.is_preliminary())
        {
            throw ReplyError(command, reply);
        }
        complete_data_channel(channel);
    }

    std::uint64_t FtpConnection::drain(DataChannel &channel, std::size_t block_size, const DataSink &sink)
    {
        std::vector<char> buffer(block_size);
        std::uint64_t total = 0;
        for (;;)
        {
            std::error_code ec;
            std::size_t received = 0;
            asio::async_read(channel.socket, asio::buffer(buffer),
                             [&ec, &received](const std::error_code &result, std::size_t bytes)
                             {
                                 ec = result;
                                 received = bytes;
                             });
            await(channel.socket, "data transfer");
            if (received > 0)
            {
                sink(std::span<const char>(buffer.data(), received));
                total += received;
            }
            if (ec == asio::error::eof)
            {
                break;
            }
            if (ec)
            {
                throw TransportError("Data connection failed: " + ec.message());
            }
        }
        std::error_code ignored;
        channel.socket.close(ignored);
        return total;
    }

    void FtpConnection::finish_transfer(const std::string &command)
    {
        const auto reply = read_reply();
        if (!reply.is_positive())
        {
            throw ReplyError(command, reply);
        }
    }

    std::vector<std::string> FtpConnection::retrieve_lines(const std::string &command)
    {
        DataChannel channel(io_context_);
        std::string data;
        try
        {
            start_transfer(channel, command, std::nullopt);
            drain(channel, 64 * 1024, [&data](std::span<const char> block)
                  { data.append(block.data(), block.size()); });
            finish_transfer(command);
        }
        catch (const ReplyError &)
        {
            throw;
        }
        catch (const TransportError &)
        {
            close();
            throw;
        }
        return split_lines(data);
    }

    std::uint64_t FtpConnection::retrieve(const std::string &path, std::uint64_t offset, std::size_t block_size,
                                          const DataSink &sink)
    {
        const auto command = "RETR " + path;
        DataChannel channel(io_context_);
        try
        {
            start_transfer(channel, command, offset);
            const auto total = drain(channel, block_size, sink);
            finish_transfer(command);
            return total;
        }
        catch (const ReplyError &)
        {
            throw;
        }
        catch (...)
        {
            // Transport failures and local write errors leave the control channel mid-transfer.
            close();
            throw;
        }
    }

    void FtpConnection::quit()
    {
        const auto reply = execute("QUIT");
        close();
        if (!reply.is_positive())
        {
            throw ReplyError("QUIT", reply);
        }
    }

    void FtpConnection::close() noexcept
    {
        std::error_code ignored;
        if (control_.is_open())
        {
            control_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
            control_.close(ignored);
        }
        control_buffer_.consume(control_buffer_.size());
    }

} // namespace ftpmirror::client
