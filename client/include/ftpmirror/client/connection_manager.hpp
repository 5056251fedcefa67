#pragma once

#include <cstddef>
#include <memory>

#include "ftpmirror/client/capabilities.hpp"
#include "ftpmirror/client/config.hpp"
#include "ftpmirror/client/ftp_connection.hpp"
#include "ftpmirror/client/logger.hpp"

namespace ftpmirror::client
{

    // Owns the single control connection. Any reconnect replaces it wholesale, so callers
    // must not keep references across keep_alive() or reconnect(); use the returned one.
    class ConnectionManager
    {
    public:
        ConnectionManager(ServerSettings server, RetryPolicy retry, CapabilityNegotiator negotiator, Logger logger);
        ~ConnectionManager();

        ConnectionManager(const ConnectionManager &) = delete;
        ConnectionManager &operator=(const ConnectionManager &) = delete;

        // Throws ConnectionError once the retry budget is exhausted.
        FtpConnection &connect();
        FtpConnection &reconnect();
        // NOOP on the current connection, reconnecting transparently if that fails.
        FtpConnection &keep_alive();
        FtpConnection &current();

        const ServerCapabilities &capabilities() const noexcept { return capabilities_; }
        const RetryPolicy &retry_policy() const noexcept { return retry_; }

        // Sleeps for the back-off that follows the given failed attempt.
        void back_off(int attempt) const;

        // QUIT, or an abrupt close when the server does not answer.
        void close() noexcept;

        std::size_t sessions_opened() const noexcept { return sessions_opened_; }

    private:
        std::unique_ptr<FtpConnection> open_session();

        ServerSettings server_;
        RetryPolicy retry_;
        CapabilityNegotiator negotiator_;
        Logger logger_;
        std::unique_ptr<FtpConnection> connection_;
        ServerCapabilities capabilities_;
        std::size_t sessions_opened_{0};
    };

} // namespace ftpmirror::client
