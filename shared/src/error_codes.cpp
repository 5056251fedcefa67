#include "ftpmirror/error_codes.hpp"

#include <array>

namespace ftpmirror
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 14> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::ConnectionFailed, "connection_failed"},
            {ErrorCode::TransportFailure, "transport_failure"},
            {ErrorCode::Timeout, "timeout"},
            {ErrorCode::ProtocolViolation, "protocol_violation"},
            {ErrorCode::ReplyRefused, "reply_refused"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::SizeMismatch, "size_mismatch"},
            {ErrorCode::ChecksumMismatch, "checksum_mismatch"},
            {ErrorCode::RetriesExhausted, "retries_exhausted"},
            {ErrorCode::LocalIo, "local_io"},
            {ErrorCode::InvalidConfig, "invalid_config"},
            {ErrorCode::Unsupported, "unsupported"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    MirrorError::MirrorError(ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

} // namespace ftpmirror
