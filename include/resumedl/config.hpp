#pragma once

#include <chrono>
#include <filesystem>

namespace resumedl {

// Opt-in automatic retry. The default (max_attempts == 0) leaves a failed
// job alone until the user starts it again.
struct RetryPolicy {
    int max_attempts{0};
    std::chrono::milliseconds delay{std::chrono::seconds(2)};
};

struct EngineConfig {
    std::filesystem::path state_dir;     // persisted resume record
    std::filesystem::path staging_dir;   // partial payloads
    std::filesystem::path download_dir;  // finished files
    std::chrono::milliseconds progress_interval{100};
    RetryPolicy retry;

    // $XDG_STATE_HOME/resumedl (or ~/.local/state/resumedl), downloads into
    // the current directory.
    static EngineConfig defaults();

    // Points every directory below `root`; used by tests and --state.
    static EngineConfig underRoot(const std::filesystem::path& root);
};

} // namespace resumedl
