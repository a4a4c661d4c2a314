#pragma once

#include "error.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace resumedl {

enum class JobState {
    Idle,
    Active,
    Paused,
    Interrupted,
    Completed,
    Failed
};

[[nodiscard]] const char* toString(JobState state) noexcept;

// Opaque to everything but the transport that produced it.
struct ResumeToken {
    std::string bytes;

    [[nodiscard]] bool empty() const noexcept { return bytes.empty(); }
    bool operator==(const ResumeToken& other) const { return bytes == other.bytes; }
    bool operator!=(const ResumeToken& other) const { return bytes != other.bytes; }
};

struct TransferIdentity {
    std::uint64_t value{0};

    [[nodiscard]] bool valid() const noexcept { return value != 0; }
    bool operator==(const TransferIdentity& other) const { return value == other.value; }
    bool operator!=(const TransferIdentity& other) const { return value != other.value; }
    bool operator<(const TransferIdentity& other) const { return value < other.value; }
};

struct DownloadJob {
    std::string source_url;
    std::optional<ResumeToken> resume_token;
    std::uint64_t downloaded_bytes{0};
    std::uint64_t total_bytes{0};   // 0 until the transport learns the size
    JobState state{JobState::Idle};
    std::optional<ErrorKind> error;
    std::string error_message;
    // Bumped whenever progress is allowed to go back to zero (cancel, fresh start).
    std::uint64_t epoch{0};

    [[nodiscard]] bool isDownloading() const noexcept { return state == JobState::Active; }
    [[nodiscard]] bool resumable() const noexcept {
        return resume_token.has_value() && !resume_token->empty();
    }
    [[nodiscard]] double fraction() const noexcept;
};

// What the presentation layer gets to see.
struct StatusView {
    double progress{0.0};
    std::string status{"Idle"};
    bool is_downloading{false};
    std::uint64_t downloaded_bytes{0};
    std::uint64_t total_bytes{0};
    JobState state{JobState::Idle};
};

} // namespace resumedl
