#include "ftpmirror/client/connection_manager.hpp"

#include <string>
#include <thread>
#include <utility>

namespace ftpmirror::client
{

    ConnectionManager::ConnectionManager(ServerSettings server, RetryPolicy retry, CapabilityNegotiator negotiator,
                                         Logger logger)
        : server_(std::move(server)),
          retry_(retry),
          negotiator_(std::move(negotiator)),
          logger_(std::move(logger)) {}

    ConnectionManager::~ConnectionManager()
    {
        close();
    }

    std::unique_ptr<FtpConnection> ConnectionManager::open_session()
    {
        auto connection = std::make_unique<FtpConnection>(server_, logger_);
        connection->open();
        connection->login();
        connection->enable_keepalive();
        connection->set_binary();
        return connection;
    }

    FtpConnection &ConnectionManager::connect()
    {
        std::string last_error;
        for (int attempt = 1; attempt <= retry_.max_attempts; ++attempt)
        {
            try
            {
                auto connection = open_session();
                connection_ = std::move(connection);
                ++sessions_opened_;
                capabilities_ = negotiator_.negotiate(*connection_);
                return *connection_;
            }
            catch (const FtpError &ex)
            {
                last_error = ex.what();
                logger_.warn("WARN", "Connection attempt ", attempt, "/", retry_.max_attempts, " to ", server_.host,
                             " failed: ", last_error);
            }
            if (attempt < retry_.max_attempts)
            {
                back_off(attempt);
            }
        }
        throw ConnectionError("Cannot connect to " + server_.host + ":" + std::to_string(server_.port) + " after " +
                              std::to_string(retry_.max_attempts) + " attempts: " + last_error);
    }

    FtpConnection &ConnectionManager::reconnect()
    {
        if (connection_)
        {
            connection_->close();
            connection_.reset();
        }
        capabilities_ = ServerCapabilities{};
        logger_.debug("ftp", "reconnecting to ", server_.host);
        return connect();
    }

    FtpConnection &ConnectionManager::keep_alive()
    {
        if (!connection_ || !connection_->is_open())
        {
            return reconnect();
        }
        try
        {
            connection_->noop();
            return *connection_;
        }
        catch (const FtpError &ex)
        {
            logger_.debug("ftp", "keep-alive failed: ", ex.what());
        }
        return reconnect();
    }

    FtpConnection &ConnectionManager::current()
    {
        if (!connection_)
        {
            return connect();
        }
        if (!connection_->is_open())
        {
            return reconnect();
        }
        return *connection_;
    }

    void ConnectionManager::back_off(int attempt) const
    {
        const auto delay = retry_.delay_for(attempt);
        if (delay.count() > 0)
        {
            std::this_thread::sleep_for(delay);
        }
    }

    void ConnectionManager::close() noexcept
    {
        if (!connection_)
        {
            return;
        }
        try
        {
            if (connection_->is_open())
            {
                connection_->quit();
            }
        }
        catch (const FtpError &ex)
        {
            logger_.debug("ftp", "QUIT failed, closing: ", ex.what());
        }
        connection_->close();
        connection_.reset();
    }

} // namespace ftpmirror::client
