#include "ftpmirror/client/stats.hpp"

namespace ftpmirror::client
{

    void MirrorStats::record(const TransferOutcome &outcome)
    {
        total_bytes += outcome.bytes_transferred;
        total_seconds += outcome.elapsed_seconds;

        switch (outcome.action)
        {
        case TransferAction::Downloaded:
            ++downloaded;
            break;
        case TransferAction::Resumed:
            ++resumed;
            break;
        case TransferAction::Redownloaded:
            ++redownloaded;
            break;
        case TransferAction::SkippedSameSize:
            ++skipped;
            break;
        case TransferAction::None:
            break;
        }

        if (outcome.verification.status == Verification::Status::Fail)
        {
            ++verify_failures;
        }
    }

    double MirrorStats::average_mbps() const noexcept
    {
        if (total_seconds <= 0)
        {
            return 0.0;
        }
        return static_cast<double>(total_bytes) / (1024.0 * 1024.0) / total_seconds;
    }

} // namespace ftpmirror::client
