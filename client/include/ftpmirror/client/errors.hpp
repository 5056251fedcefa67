#pragma once

#include <string>

#include "ftpmirror/error_codes.hpp"
#include "ftpmirror/reply.hpp"

namespace ftpmirror::client
{

    // PASS arguments never end up in logs or messages.
    std::string redact_command(const std::string &command);

    // Any failure of an FTP exchange.
    class FtpError : public MirrorError
    {
    public:
        using MirrorError::MirrorError;
    };

    // The control or data connection is unusable: socket error, EOF, timeout, 421 or garbage.
    class TransportError : public FtpError
    {
    public:
        explicit TransportError(std::string message, ErrorCode code = ErrorCode::TransportFailure);
    };

    // The server answered with a negative or unexpected reply; the connection stays usable.
    class ReplyError : public FtpError
    {
    public:
        ReplyError(std::string command, protocol::Reply reply);

        const protocol::Reply &reply() const noexcept { return reply_; }
        const std::string &command() const noexcept { return command_; }

    private:
        std::string command_;
        protocol::Reply reply_;
    };

    // No connection could be established within the retry budget.
    class ConnectionError : public MirrorError
    {
    public:
        explicit ConnectionError(std::string message);
    };

    // A single file could not be mirrored.
    class TransferError : public MirrorError
    {
    public:
        TransferError(ErrorCode code, std::string message);
    };

} // namespace ftpmirror::client
