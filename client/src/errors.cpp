#include "ftpmirror/client/errors.hpp"

#include <utility>

namespace ftpmirror::client
{

    std::string redact_command(const std::string &command)
    {
        if (command.rfind("PASS", 0) == 0)
        {
            return "PASS ****";
        }
        return command;
    }

    TransportError::TransportError(std::string message, ErrorCode code)
        : FtpError(code, std::move(message)) {}

    ReplyError::ReplyError(std::string command, protocol::Reply reply)
        : FtpError(reply.code == 550 ? ErrorCode::NotFound : ErrorCode::ReplyRefused,
                   redact_command(command) + " -> " + reply.text()),
          command_(std::move(command)),
          reply_(std::move(reply)) {}

    ConnectionError::ConnectionError(std::string message)
        : MirrorError(ErrorCode::ConnectionFailed, std::move(message)) {}

    TransferError::TransferError(ErrorCode code, std::string message)
        : MirrorError(code, std::move(message)) {}

} // namespace ftpmirror::client
