#pragma once

#include "completion_handler.hpp"
#include "download_job.hpp"
#include "progress_publisher.hpp"
#include "state_store.hpp"
#include "transport.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace resumedl {

// Owns the job and at most one live transfer. Every mutation happens under
// state_mutex_ and is checked against the current TransferIdentity; events
// from any other identity are dropped.
class TransferSession final : public TransportEvents {
public:
    using TerminalListener = std::function<void(const DownloadJob&)>;

    TransferSession(Transport& transport, ResumeRecordStore& records,
                    ProgressPublisher& publisher, const CompletionHandler& completion);
    ~TransferSession() override = default;

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    std::optional<TransferIdentity> start(const std::string& url,
                                          const std::optional<ResumeToken>& token = std::nullopt);
    std::optional<ResumeToken> pause();
    void cancel();

    // Adopts a transfer that kept running without us (background reawakening).
    void bind(const LiveTransfer& transfer);
    // Seeds the idle job from what survived the last process.
    void restore(const PersistedRecord& record);

    // Invoked, outside the state lock, after a failure or an interruption.
    void setTerminalListener(TerminalListener listener);

    [[nodiscard]] DownloadJob snapshot() const;
    [[nodiscard]] TransferIdentity currentIdentity() const;

    void onProgress(TransferIdentity identity, std::uint64_t bytes_received,
                    std::uint64_t bytes_expected) override;
    void onFailure(TransferIdentity identity, const TransportError& error) override;
    void onComplete(TransferIdentity identity, const std::string& final_location) override;

private:
    void persist(const DownloadJob& job);
    void purgeRecord();

    Transport& transport_;
    ResumeRecordStore& records_;
    ProgressPublisher& publisher_;
    const CompletionHandler& completion_;

    mutable std::mutex state_mutex_;
    DownloadJob job_;
    TransferIdentity current_;
    TerminalListener terminal_listener_;
};

} // namespace resumedl
