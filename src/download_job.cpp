#include "resumedl/download_job.hpp"

#include <algorithm>

namespace resumedl {

const char* toString(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::InvalidSource:
        return "InvalidSource";
    case ErrorKind::Cancelled:
        return "Cancelled";
    case ErrorKind::Resumable:
        return "Resumable";
    case ErrorKind::Unrecoverable:
        return "Unrecoverable";
    case ErrorKind::StorageFinalizeFailure:
        return "StorageFinalizeFailure";
    }
    return "Unknown";
}

const char* toString(JobState state) noexcept {
    switch (state) {
    case JobState::Idle:
        return "Idle";
    case JobState::Active:
        return "Active";
    case JobState::Paused:
        return "Paused";
    case JobState::Interrupted:
        return "Interrupted";
    case JobState::Completed:
        return "Completed";
    case JobState::Failed:
        return "Failed";
    }
    return "Unknown";
}

double DownloadJob::fraction() const noexcept {
    if (state == JobState::Completed) {
        return 1.0;
    }
    // Unknown size: report nothing rather than a full bar after the first byte.
    if (total_bytes == 0) {
        return 0.0;
    }
    const auto denominator = std::max<std::uint64_t>(1, total_bytes);
    const double ratio = static_cast<double>(downloaded_bytes) / static_cast<double>(denominator);
    return std::clamp(ratio, 0.0, 1.0);
}

} // namespace resumedl
