/**
 * FtpMirror - Error codes and the exception base shared by all layers.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ftpmirror
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        ConnectionFailed = 1,
        TransportFailure = 2,
        Timeout = 3,
        ProtocolViolation = 4,
        ReplyRefused = 5,
        NotFound = 6,
        SizeMismatch = 7,
        ChecksumMismatch = 8,
        RetriesExhausted = 9,
        LocalIo = 10,
        InvalidConfig = 11,
        Unsupported = 12,
        InternalError = 13
    };

    std::string_view to_string(ErrorCode code) noexcept;

    class MirrorError : public std::runtime_error
    {
    public:
        MirrorError(ErrorCode code, std::string message);

        ErrorCode code() const noexcept { return code_; }

    private:
        ErrorCode code_;
    };

} // namespace ftpmirror
