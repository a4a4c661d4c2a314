#pragma once

#include "download_job.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace resumedl {

// Raw failure as the transport sees it. Classified by TransferSession before
// anything reaches an observer.
struct TransportError {
    int code{0};
    std::string message;
    bool cancelled{false};
    std::optional<ResumeToken> resume_token;
};

// Event channel. Called on transport-owned threads; no progress follows
// onFailure/onComplete for the same identity.
class TransportEvents {
public:
    virtual ~TransportEvents() = default;

    virtual void onProgress(TransferIdentity identity, std::uint64_t bytes_received,
                            std::uint64_t bytes_expected) = 0;
    virtual void onFailure(TransferIdentity identity, const TransportError& error) = 0;
    virtual void onComplete(TransferIdentity identity, const std::string& final_location) = 0;
};

struct LiveTransfer {
    TransferIdentity identity;
    std::string url;
    std::uint64_t bytes_received{0};
    std::uint64_t bytes_expected{0};
};

class Transport {
public:
    virtual ~Transport() = default;

    virtual void setEventSink(TransportEvents* events) = 0;

    [[nodiscard]] virtual TransferIdentity issueNewTransfer(const std::string& url) = 0;
    [[nodiscard]] virtual TransferIdentity issueResumedTransfer(const ResumeToken& token) = 0;

    // Stops the transfer. Returns a token only when produce_token is set and
    // the bytes already on disk can be continued.
    virtual std::optional<ResumeToken> cancel(TransferIdentity identity, bool produce_token) = 0;

    // Releases the partial data behind a token that will never be resumed.
    virtual void discard(const ResumeToken& token) = 0;

    [[nodiscard]] virtual std::vector<LiveTransfer> liveTransfers() const = 0;
};

using TransportPtr = std::shared_ptr<Transport>;

} // namespace resumedl
