#pragma once

#include "completion_handler.hpp"
#include "config.hpp"
#include "download_job.hpp"
#include "progress_publisher.hpp"
#include "serial_queue.hpp"
#include "state_store.hpp"
#include "transfer_session.hpp"
#include "transport.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace resumedl {

// Process-wide entry point. Construct once: the persisted record is loaded and
// an interrupted job is offered for resume. Destroy (or shutdown()) to flush a
// running transfer into a resume token.
class ResumeCoordinator {
public:
    // libcurl transport and a FileStateStore under config.state_dir.
    explicit ResumeCoordinator(EngineConfig config);
    ResumeCoordinator(EngineConfig config, TransportPtr transport, StateStorePtr store);
    ~ResumeCoordinator();

    ResumeCoordinator(const ResumeCoordinator&) = delete;
    ResumeCoordinator& operator=(const ResumeCoordinator&) = delete;

    // No-op while a transfer is active. A stored resume token always wins
    // over `url`: the engine finishes what it started first.
    bool start(const std::optional<std::string>& url = std::nullopt);
    std::optional<ResumeToken> pause();
    void cancel();

    // Background reawakening: adopt a transfer that kept running, then call
    // on_ready so the host may suspend the process again.
    void reconnect(const std::function<void()>& on_ready);

    void shutdown();

    [[nodiscard]] ProgressPublisher& publisher() noexcept { return publisher_; }
    [[nodiscard]] DownloadJob snapshot() const { return session_.snapshot(); }
    [[nodiscard]] StatusView status() const { return publisher_.latest(); }
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }
    [[nodiscard]] bool retryPending() const;

private:
    bool startTransfer(const std::optional<std::string>& url);
    void onTerminal(const DownloadJob& job);
    void retry();

    EngineConfig config_;
    StateStorePtr store_;
    ResumeRecordStore records_;
    ProgressPublisher publisher_;
    CompletionHandler completion_;
    TransportPtr transport_;
    TransferSession session_;

    mutable std::mutex retry_mutex_;
    int retry_attempts_{0};
    bool retry_pending_{false};
    bool shut_down_{false};

    // Declared last so it stops before the session it calls into.
    SerialQueue retry_queue_;
};

} // namespace resumedl
