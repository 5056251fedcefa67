#include "loopback_ftp_server.hpp"

#include <asio/read_until.hpp>
#include <asio/write.hpp>

#include <algorithm>
#include <array>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <istream>
#include <sstream>
#include <utility>

#include "ftpmirror/checksum.hpp"
#include "ftpmirror/client/mirror.hpp"
#include "ftpmirror/protocol.hpp"

namespace ftpmirror::testing
{

    namespace
    {

        std::string format_mlsd_time(std::filesystem::file_time_type time)
        {
            const auto system_time = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                std::chrono::file_clock::to_sys(time));
            const auto seconds = std::chrono::system_clock::to_time_t(system_time);
            std::tm utc{};
            gmtime_r(&seconds, &utc);
            std::ostringstream oss;
            oss << std::put_time(&utc, "%Y%m%d%H%M%S");
            return oss.str();
        }

        std::string quote_path(const std::string &path)
        {
            std::string result;
            for (const char ch : path)
            {
                result.push_back(ch);
                if (ch == '"')
                {
                    result.push_back('"');
                }
            }
            return result;
        }

        std::optional<std::uint64_t> parse_offset(const std::string &text)
        {
            try
            {
                std::size_t consumed = 0;
                const auto value = std::stoull(text, &consumed);
                if (consumed != text.size())
                {
                    return std::nullopt;
                }
                return value;
            }
            catch (const std::logic_error &)
            {
                return std::nullopt;
            }
        }

    } // namespace

    class LoopbackFtpServer::Session : public std::enable_shared_from_this<Session>
    {
    public:
        Session(asio::ip::tcp::socket socket, LoopbackFtpServer &server)
            : socket_(std::move(socket)),
              server_(server)
        {
            if (!server_.options().hash_algorithms.empty())
            {
                active_hash_ = server_.options().hash_algorithms.front();
            }
        }

        void start()
        {
            if (server_.refuse_logins())
            {
                reply("421 Service not available");
                close();
                return;
            }
            reply("220 ftpmirror loopback server ready");
            read_command();
        }

    private:
        void read_command()
        {
            auto self = shared_from_this();
            asio::async_read_until(socket_, buffer_, '\n',
                                   [this, self](const std::error_code &ec, std::size_t /*bytes*/)
                                   {
                                       if (ec)
                                       {
                                           close();
                                           return;
                                       }
                                       std::istream input(&buffer_);
                                       std::string line;
                                       std::getline(input, line);
                                       if (!line.empty() && line.back() == '\r')
                                       {
                                           line.pop_back();
                                       }
                                       if (handle(line))
                                       {
                                           read_command();
                                       }
                                       else
                                       {
                                           close();
                                       }
                                   });
        }

        void reply(const std::string &text)
        {
            const auto payload = text + "\r\n";
            std::error_code ec;
            asio::write(socket_, asio::buffer(payload), ec);
        }

        void close()
        {
            std::error_code ec;
            socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
            socket_.close(ec);
            passive_.reset();
        }

        std::string virtual_path(const std::string &argument) const
        {
            if (!argument.empty() && argument.front() == '/')
            {
                return client::normalize_remote_path(argument);
            }
            return client::normalize_remote_path(cwd_ + "/" + argument);
        }

        std::filesystem::path local_path(const std::string &virtual_path) const
        {
            return server_.root() / virtual_path.substr(1);
        }

        // Returns false when the session has to end.
        bool handle(const std::string &line)
        {
            const auto space = line.find(' ');
            const auto verb = protocol::to_upper(line.substr(0, space));
            const auto argument = space == std::string::npos ? std::string() : line.substr(space + 1);
            server_.record_command(verb);

            if (verb == "USER")
            {
                reply("331 Password required for " + argument);
            }
            else if (verb == "PASS")
            {
                reply("230 Logged in");
            }
            else if (verb == "SYST")
            {
                reply("215 UNIX Type: L8");
            }
            else if (verb == "FEAT")
            {
                send_features();
            }
            else if (verb == "OPTS")
            {
                handle_opts(argument);
            }
            else if (verb == "TYPE")
            {
                reply("200 Type set to " + argument);
            }
            else if (verb == "NOOP")
            {
                if (server_.take_noop_drop())
                {
                    return false;
                }
                reply("200 NOOP ok");
            }
            else if (verb == "PWD")
            {
                reply("257 \"" + quote_path(cwd_) + "\" is the current directory");
            }
            else if (verb == "CWD")
            {
                handle_cwd(argument);
            }
            else if (verb == "PASV")
            {
                handle_pasv();
            }
            else if (verb == "EPSV")
            {
                handle_epsv();
            }
            else if (verb == "PORT")
            {
                handle_port(argument);
            }
            else if (verb == "REST")
            {
                handle_rest(argument);
            }
            else if (verb == "SIZE")
            {
                handle_size(argument);
            }
            else if (verb == "RETR")
            {
                return handle_retr(argument);
            }
            else if (verb == "MLSD")
            {
                if (!server_.options().mlsd)
                {
                    reply("500 MLSD not understood");
                    return true;
                }
                return handle_listing(true);
            }
            else if (verb == "NLST")
            {
                return handle_listing(false);
            }
            else if (verb == "HASH")
            {
                handle_hash(argument);
            }
            else if (verb == "XCRC")
            {
                handle_crc(argument);
            }
            else if (verb == "SITE")
            {
                const auto upper = protocol::to_upper(argument);
                if (upper.rfind("CRC ", 0) == 0)
                {
                    handle_crc(argument.substr(4));
                }
                else
                {
                    reply("500 Unknown SITE command");
                }
            }
            else if (verb == "QUIT")
            {
                reply("221 Goodbye");
                return false;
            }
            else
            {
                reply("502 " + verb + " not implemented");
            }
            return true;
        }

        void send_features()
        {
            const auto &options = server_.options();
            std::string text = "211-Features:\r\n";
            if (options.mlsd)
            {
                text += " MLST type*;size*;modify*;\r\n";
            }
            if (options.size_command)
            {
                text += " SIZE\r\n";
            }
            text += " REST STREAM\r\n";
            if (!options.hash_algorithms.empty())
            {
                text += " HASH ";
                for (std::size_t i = 0; i < options.hash_algorithms.size(); ++i)
                {
                    if (i > 0)
                    {
                        text += ";";
                    }
                    text += options.hash_algorithms[i];
                    if (options.hash_algorithms[i] == active_hash_)
                    {
                        text += "*";
                    }
                }
                text += "\r\n";
            }
            if (options.legacy_crc)
            {
                text += " XCRC\r\n";
            }
            text += "211 End";
            reply(text);
        }

        void handle_opts(const std::string &argument)
        {
            const auto upper = protocol::to_upper(argument);
            if (upper.rfind("HASH ", 0) != 0)
            {
                reply("501 Option not understood");
                return;
            }
            const auto requested = checksum::hash_algorithm_from_string(argument.substr(5));
            for (const auto &name : server_.options().hash_algorithms)
            {
                if (requested && checksum::hash_algorithm_from_string(name) == requested)
                {
                    active_hash_ = name;
                    reply("200 " + name);
                    return;
                }
            }
            reply("504 Unsupported algorithm");
        }

        void handle_cwd(const std::string &argument)
        {
            const auto target = virtual_path(argument);
            std::error_code ec;
            if (!std::filesystem::is_directory(local_path(target), ec))
            {
                reply("550 " + argument + ": No such directory");
                return;
            }
            cwd_ = target;
            reply("250 Directory changed to " + cwd_);
        }

        std::uint16_t open_passive()
        {
            active_.reset();
            passive_.emplace(server_.io_context_);
            const asio::ip::tcp::endpoint endpoint(asio::ip::make_address("127.0.0.1"), 0);
            passive_->open(endpoint.protocol());
            passive_->bind(endpoint);
            passive_->listen();
            return passive_->local_endpoint().port();
        }

        void handle_pasv()
        {
            if (!server_.options().pasv)
            {
                reply("502 PASV disabled, use EPSV");
                return;
            }
            const auto port = open_passive();
            reply("227 Entering Passive Mode (127,0,0,1," + std::to_string(port >> 8) + "," +
                  std::to_string(port & 0xFF) + ")");
        }

        void handle_epsv()
        {
            const auto port = open_passive();
            reply("229 Entering Extended Passive Mode (|||" + std::to_string(port) + "|)");
        }

        void handle_port(const std::string &argument)
        {
            std::array<unsigned, 6> numbers{};
            std::istringstream iss(argument);
            for (std::size_t i = 0; i < numbers.size(); ++i)
            {
                char separator = 0;
                if (!(iss >> numbers[i]) || numbers[i] > 255 || (i + 1 < numbers.size() && !(iss >> separator)))
                {
                    reply("501 Malformed PORT argument");
                    return;
                }
            }
            const asio::ip::address_v4::bytes_type bytes{
                static_cast<unsigned char>(numbers[0]), static_cast<unsigned char>(numbers[1]),
                static_cast<unsigned char>(numbers[2]), static_cast<unsigned char>(numbers[3])};
            passive_.reset();
            active_ = asio::ip::tcp::endpoint(asio::ip::address_v4(bytes),
                                              static_cast<std::uint16_t>(numbers[4] * 256 + numbers[5]));
            reply("200 PORT command successful");
        }

        void handle_rest(const std::string &argument)
        {
            const auto offset = parse_offset(argument);
            if (!offset)
            {
                reply("501 Invalid restart offset");
                return;
            }
            rest_ = *offset;
            server_.record_rest(*offset);
            reply("350 Restarting at " + std::to_string(*offset));
        }

        void handle_size(const std::string &argument)
        {
            if (!server_.options().size_command)
            {
                reply("502 SIZE not implemented");
                return;
            }
            const auto path = local_path(virtual_path(argument));
            std::error_code ec;
            if (!std::filesystem::is_regular_file(path, ec))
            {
                reply("550 " + argument + ": No such file");
                return;
            }
            const auto size = server_.advertised_size(virtual_path(argument), std::filesystem::file_size(path));
            reply("213 " + std::to_string(size));
        }

        std::optional<asio::ip::tcp::socket> open_data()
        {
            std::error_code ec;
            asio::ip::tcp::socket data(server_.io_context_);
            if (passive_)
            {
                passive_->accept(data, ec);
                passive_.reset();
            }
            else if (active_)
            {
                data.connect(*active_, ec);
                active_.reset();
            }
            else
            {
                return std::nullopt;
            }
            if (ec)
            {
                return std::nullopt;
            }
            return data;
        }

        static void finish_data(asio::ip::tcp::socket &data)
        {
            std::error_code ignored;
            data.shutdown(asio::ip::tcp::socket::shutdown_send, ignored);
            data.close(ignored);
        }

        bool handle_retr(const std::string &argument)
        {
            const auto target = virtual_path(argument);
            const auto path = local_path(target);
            const auto offset = std::exchange(rest_, 0);
            std::error_code ec;
            if (!std::filesystem::is_regular_file(path, ec))
            {
                reply("550 " + argument + ": No such file");
                return true;
            }
            server_.record_retr(target);

            std::ifstream in(path, std::ios::binary);
            in.seekg(static_cast<std::streamoff>(offset));
            reply("150 Opening BINARY mode data connection for " + argument);
            auto data = open_data();
            if (!data)
            {
                reply("425 Cannot open data connection");
                return true;
            }

            const auto drop_after = server_.take_retr_drop(target);
            const bool corrupt = server_.take_corruption(target);
            std::vector<char> buffer(64 * 1024);
            std::uint64_t sent = 0;
            bool first = true;
            while (in)
            {
                std::size_t wanted = buffer.size();
                if (drop_after)
                {
                    if (sent >= *drop_after)
                    {
                        break;
                    }
                    wanted = static_cast<std::size_t>(std::min<std::uint64_t>(wanted, *drop_after - sent));
                }
                in.read(buffer.data(), static_cast<std::streamsize>(wanted));
                const auto got = static_cast<std::size_t>(in.gcount());
                if (got == 0)
                {
                    break;
                }
                if (corrupt && first)
                {
                    buffer[0] = static_cast<char>(buffer[0] ^ 0x5A);
                }
                first = false;
                asio::write(*data, asio::buffer(buffer.data(), got), ec);
                if (ec)
                {
                    server_.record_bytes(target, sent);
                    return false;
                }
                sent += got;
            }
            server_.record_bytes(target, sent);
            finish_data(*data);

            if (drop_after && sent >= *drop_after)
            {
                return false;
            }
            reply("226 Transfer complete");
            return true;
        }

        bool handle_listing(bool machine_readable)
        {
            if (server_.take_list_failure())
            {
                return false;
            }

            std::vector<std::filesystem::directory_entry> entries;
            std::error_code ec;
            for (const auto &entry : std::filesystem::directory_iterator(local_path(cwd_), ec))
            {
                entries.push_back(entry);
            }
            std::sort(entries.begin(), entries.end(), [](const auto &lhs, const auto &rhs)
                      { return lhs.path().filename() < rhs.path().filename(); });

            const auto &options = server_.options();
            std::string text;
            if (machine_readable && options.mlsd_type_facts)
            {
                text += "type=cdir;modify=" + format_mlsd_time(std::filesystem::last_write_time(local_path(cwd_))) +
                        "; .\r\n";
            }
            for (const auto &entry : entries)
            {
                const auto name = entry.path().filename().string();
                if (!machine_readable)
                {
                    text += name + "\r\n";
                    continue;
                }
                std::string facts;
                if (entry.is_directory())
                {
                    if (options.mlsd_type_facts)
                    {
                        facts += "type=dir;";
                    }
                }
                else
                {
                    if (options.mlsd_type_facts)
                    {
                        facts += "type=file;";
                    }
                    if (options.mlsd_size_facts)
                    {
                        const auto size = server_.advertised_size(client::join_remote_path(cwd_, name),
                                                                  entry.file_size());
                        facts += "size=" + std::to_string(size) + ";";
                    }
                }
                facts += "modify=" + format_mlsd_time(entry.last_write_time()) + ";";
                text += facts + " " + name + "\r\n";
            }

            reply("150 Here comes the directory listing");
            auto data = open_data();
            if (!data)
            {
                reply("425 Cannot open data connection");
                return true;
            }
            asio::write(*data, asio::buffer(text), ec);
            finish_data(*data);
            reply("226 Directory send OK");
            return true;
        }

        std::string reported_digest(const std::string &target, checksum::HashAlgorithm algorithm)
        {
            auto hex = checksum::hash_file(local_path(target), algorithm);
            if (server_.wrong_hash(target))
            {
                hex.assign(hex.size(), hex.front() == '0' ? '1' : '0');
            }
            return hex;
        }

        void handle_hash(const std::string &argument)
        {
            if (server_.options().hash_algorithms.empty())
            {
                reply("502 HASH not implemented");
                return;
            }
            const auto target = virtual_path(argument);
            const auto path = local_path(target);
            std::error_code ec;
            const auto algorithm = checksum::hash_algorithm_from_string(active_hash_);
            if (!algorithm || !std::filesystem::is_regular_file(path, ec))
            {
                reply("550 " + argument + ": Cannot compute hash");
                return;
            }
            const auto size = std::filesystem::file_size(path);
            reply("213 " + active_hash_ + " 0-" + std::to_string(size) + " " + reported_digest(target, *algorithm) +
                  " " + argument);
        }

        void handle_crc(const std::string &argument)
        {
            if (!server_.options().legacy_crc)
            {
                reply("502 CRC not implemented");
                return;
            }
            const auto target = virtual_path(argument);
            std::error_code ec;
            if (!std::filesystem::is_regular_file(local_path(target), ec))
            {
                reply("550 " + argument + ": No such file");
                return;
            }
            reply("250 " + protocol::to_upper(reported_digest(target, checksum::HashAlgorithm::Crc32)));
        }

        asio::ip::tcp::socket socket_;
        LoopbackFtpServer &server_;
        asio::streambuf buffer_;
        std::string cwd_{"/"};
        std::uint64_t rest_{0};
        std::optional<asio::ip::tcp::acceptor> passive_;
        std::optional<asio::ip::tcp::endpoint> active_;
        std::string active_hash_;
    };

    LoopbackFtpServer::LoopbackFtpServer(std::filesystem::path root, ServerOptions options)
        : root_(std::move(root)),
          options_(std::move(options)),
          acceptor_(io_context_)
    {
        const asio::ip::tcp::endpoint endpoint(asio::ip::make_address("127.0.0.1"), 0);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        port_ = acceptor_.local_endpoint().port();

        accept_next();
        for (int i = 0; i < 2; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
    }

    LoopbackFtpServer::~LoopbackFtpServer()
    {
        stop();
    }

    void LoopbackFtpServer::accept_next()
    {
        acceptor_.async_accept([this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               {
                                   if (!ec)
                                   {
                                       {
                                           std::lock_guard<std::mutex> lock(mutex_);
                                           ++sessions_;
                                       }
                                       std::make_shared<Session>(std::move(socket), *this)->start();
                                   }
                                   if (acceptor_.is_open() && ec != asio::error::operation_aborted)
                                   {
                                       accept_next();
                                   } });
    }

    void LoopbackFtpServer::stop()
    {
        if (stopped_)
        {
            return;
        }
        stopped_ = true;
        io_context_.stop();
        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
        std::error_code ec;
        acceptor_.close(ec);
    }

    void LoopbackFtpServer::set_faults(FaultPlan faults)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        faults_ = std::move(faults);
        noops_seen_ = 0;
        lists_failed_ = 0;
    }

    std::size_t LoopbackFtpServer::command_count(const std::string &verb) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = commands_.find(verb);
        return it == commands_.end() ? 0 : it->second;
    }

    std::size_t LoopbackFtpServer::retr_count(const std::string &path) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = retrs_.find(path);
        return it == retrs_.end() ? 0 : it->second;
    }

    std::vector<std::uint64_t> LoopbackFtpServer::rest_offsets() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return rest_offsets_;
    }

    std::uint64_t LoopbackFtpServer::bytes_sent(const std::string &path) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = bytes_sent_.find(path);
        return it == bytes_sent_.end() ? 0 : it->second;
    }

    std::size_t LoopbackFtpServer::sessions() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions_;
    }

    void LoopbackFtpServer::reset_observations()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        commands_.clear();
        retrs_.clear();
        rest_offsets_.clear();
        bytes_sent_.clear();
        sessions_ = 0;
    }

    void LoopbackFtpServer::record_command(const std::string &verb)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++commands_[verb];
    }

    void LoopbackFtpServer::record_retr(const std::string &path)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++retrs_[path];
    }

    void LoopbackFtpServer::record_rest(std::uint64_t offset)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rest_offsets_.push_back(offset);
    }

    void LoopbackFtpServer::record_bytes(const std::string &path, std::uint64_t bytes)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        bytes_sent_[path] += bytes;
    }

    std::optional<std::uint64_t> LoopbackFtpServer::take_retr_drop(const std::string &path)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (const auto every = faults_.drop_every_retr.find(path); every != faults_.drop_every_retr.end())
        {
            return every->second;
        }
        if (const auto nth = faults_.drop_nth_retr.find(path);
            nth != faults_.drop_nth_retr.end() && retrs_[path] == nth->second.retr)
        {
            return nth->second.after;
        }
        const auto it = faults_.drop_retr_after.find(path);
        if (it == faults_.drop_retr_after.end())
        {
            return std::nullopt;
        }
        const auto bytes = it->second;
        faults_.drop_retr_after.erase(it);
        return bytes;
    }

    std::uint64_t LoopbackFtpServer::advertised_size(const std::string &path, std::uint64_t actual) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = faults_.advertised_size_delta.find(path);
        if (it == faults_.advertised_size_delta.end())
        {
            return actual;
        }
        return static_cast<std::uint64_t>(static_cast<std::int64_t>(actual) + it->second);
    }

    bool LoopbackFtpServer::take_corruption(const std::string &path)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return faults_.corrupt_first_retr.erase(path) > 0;
    }

    bool LoopbackFtpServer::wrong_hash(const std::string &path) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return faults_.wrong_hash.count(path) > 0;
    }

    bool LoopbackFtpServer::take_noop_drop()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++noops_seen_;
        return faults_.drop_on_noop > 0 && noops_seen_ == faults_.drop_on_noop;
    }

    bool LoopbackFtpServer::take_list_failure()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (lists_failed_ < faults_.fail_list_count)
        {
            ++lists_failed_;
            return true;
        }
        return false;
    }

    bool LoopbackFtpServer::refuse_logins() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return faults_.refuse_logins;
    }

} // namespace ftpmirror::testing
