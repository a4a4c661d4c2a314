#include "resumedl/transfer_session.hpp"

#include "resumedl/error.hpp"
#include "resumedl/logging.hpp"
#include "resumedl/url.hpp"

#include <utility>

namespace resumedl {

TransferSession::TransferSession(Transport& transport, ResumeRecordStore& records,
                                 ProgressPublisher& publisher,
                                 const CompletionHandler& completion)
    : transport_(transport), records_(records), publisher_(publisher), completion_(completion) {}

std::optional<TransferIdentity> TransferSession::start(const std::string& url,
                                                       const std::optional<ResumeToken>& token) {
    const auto parsed = parseSourceUrl(url);

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (job_.state == JobState::Active) {
        logger()->debug("start ignored: transfer {} is already active", current_.value);
        if (current_.valid()) {
            return current_;
        }
        return std::nullopt;
    }

    if (!parsed) {
        logger()->warn("{}: '{}'", toString(ErrorKind::InvalidSource), url);
        job_.state = JobState::Failed;
        job_.error = ErrorKind::InvalidSource;
        job_.error_message = "Invalid URL: " + url;
        publisher_.publish(job_, true);
        return std::nullopt;
    }

    const bool resuming = token.has_value() && !token->empty();
    if (!resuming) {
        // A fresh download invalidates whatever was stored before.
        records_.purge();
        records_.rememberSource(parsed->normalized);
    }

    const TransferIdentity identity = resuming ? transport_.issueResumedTransfer(*token)
                                               : transport_.issueNewTransfer(parsed->normalized);

    if (!resuming) {
        job_.downloaded_bytes = 0;
        job_.total_bytes = 0;
        ++job_.epoch;
    }
    job_.source_url = parsed->normalized;
    // The transport owns the token now; the persisted copy stays until the
    // transfer completes or is cancelled.
    job_.resume_token.reset();
    job_.state = JobState::Active;
    job_.error.reset();
    job_.error_message.clear();
    current_ = identity;

    logger()->info("{} transfer {} for {}", resuming ? "Resuming" : "Starting", identity.value,
                   job_.source_url);
    publisher_.publish(job_, true);
    return identity;
}

std::optional<ResumeToken> TransferSession::pause() {
    TransferIdentity outgoing;
    std::uint64_t epoch = 0;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (job_.state != JobState::Active || !current_.valid()) {
            return std::nullopt;
        }
        outgoing = current_;
        epoch = job_.epoch;
        // From here on, trailing events of the outgoing transfer are stale.
        current_ = TransferIdentity{};
    }

    // Not under the lock: the transport waits for its worker, which may be
    // blocked delivering an event to us.
    auto token = transport_.cancel(outgoing, true);

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (job_.epoch == epoch && job_.state == JobState::Active && !current_.valid()) {
            job_.resume_token = token;
            job_.state = token ? JobState::Paused : JobState::Interrupted;
            if (token) {
                persist(job_);
                logger()->info("Paused transfer {} at {} bytes", outgoing.value,
                               job_.downloaded_bytes);
            } else {
                logger()->warn("Transfer {} stopped without a resume token; progress is not safe",
                               outgoing.value);
            }
            publisher_.publish(job_, true);
            return token;
        }
    }

    // Cancelled while we were waiting: nothing may refer to the partial data.
    if (token) {
        transport_.discard(*token);
    }
    return std::nullopt;
}

void TransferSession::cancel() {
    TransferIdentity outgoing;
    std::optional<ResumeToken> stale_token;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        outgoing = current_;
        current_ = TransferIdentity{};
        stale_token = std::move(job_.resume_token);

        const std::uint64_t next_epoch = job_.epoch + 1;
        job_ = DownloadJob{};
        job_.epoch = next_epoch;
        purgeRecord();
        publisher_.publish(job_, true);
    }

    if (outgoing.valid()) {
        transport_.cancel(outgoing, false);
    }
    if (stale_token) {
        transport_.discard(*stale_token);
    }
    logger()->info("Download cancelled");
}

void TransferSession::bind(const LiveTransfer& transfer) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    current_ = transfer.identity;
    job_.source_url = transfer.url;
    job_.downloaded_bytes = transfer.bytes_received;
    if (transfer.bytes_expected > 0) {
        job_.total_bytes = transfer.bytes_expected;
    }
    job_.resume_token.reset();
    job_.state = JobState::Active;
    job_.error.reset();
    job_.error_message.clear();
    logger()->info("Bound live transfer {} for {}", transfer.identity.value, transfer.url);
    publisher_.publish(job_, true);
}

void TransferSession::restore(const PersistedRecord& record) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    job_.source_url = record.source_url;
    job_.resume_token = record.resume_token;
    job_.downloaded_bytes = record.resume_token ? record.downloaded_bytes : 0;
    job_.total_bytes = record.resume_token ? record.total_bytes : 0;
    job_.state = record.resume_token ? JobState::Interrupted : JobState::Idle;
    job_.error.reset();
    job_.error_message.clear();
    publisher_.publish(job_, true);
}

void TransferSession::setTerminalListener(TerminalListener listener) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    terminal_listener_ = std::move(listener);
}

DownloadJob TransferSession::snapshot() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return job_;
}

TransferIdentity TransferSession::currentIdentity() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return current_;
}

void TransferSession::onProgress(TransferIdentity identity, std::uint64_t bytes_received,
                                 std::uint64_t bytes_expected) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (identity != current_ || !current_.valid()) {
        return;
    }
    if (bytes_received < job_.downloaded_bytes) {
        // The transfer restarted from byte zero.
        ++job_.epoch;
    }
    job_.downloaded_bytes = bytes_received;
    if (bytes_expected > 0) {
        job_.total_bytes = bytes_expected;
    }
    publisher_.publish(job_, false);
}

void TransferSession::onFailure(TransferIdentity identity, const TransportError& error) {
    DownloadJob terminal;
    TerminalListener listener;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (identity != current_ || !current_.valid()) {
            return;
        }
        current_ = TransferIdentity{};

        if (error.resume_token && !error.resume_token->empty()) {
            job_.resume_token = error.resume_token;
            job_.state = JobState::Interrupted;
            job_.error = ErrorKind::Resumable;
            job_.error_message = error.message;
            persist(job_);
            logger()->warn("Transfer {} interrupted at {} bytes, resumable: {}", identity.value,
                           job_.downloaded_bytes, error.message);
        } else if (error.cancelled) {
            logger()->info("{}: transfer {} was stopped outside the session",
                           toString(ErrorKind::Cancelled), identity.value);
            const std::string url = job_.source_url;
            const std::uint64_t next_epoch = job_.epoch + 1;
            job_ = DownloadJob{};
            job_.source_url = url;
            job_.epoch = next_epoch;
            purgeRecord();
            publisher_.publish(job_, true);
            return;
        } else {
            job_.state = JobState::Failed;
            job_.error = ErrorKind::Unrecoverable;
            job_.error_message = error.message.empty() ? "transfer failed" : error.message;
            // The partial data is gone; keep only the URL for a manual retry.
            job_.resume_token.reset();
            persist(job_);
            logger()->error("Transfer {} failed: {} (code {})", identity.value,
                            job_.error_message, error.code);
        }
        publisher_.publish(job_, true);
        terminal = job_;
        listener = terminal_listener_;
    }

    if (listener) {
        listener(terminal);
    }
}

void TransferSession::onComplete(TransferIdentity identity, const std::string& final_location) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (identity != current_ || !current_.valid()) {
        return;
    }
    current_ = TransferIdentity{};

    const auto saved = completion_.finalize(final_location, job_.source_url);
    purgeRecord();

    if (job_.total_bytes == 0 || job_.downloaded_bytes > job_.total_bytes) {
        job_.total_bytes = job_.downloaded_bytes;
    }
    job_.downloaded_bytes = job_.total_bytes;
    job_.resume_token.reset();
    job_.state = JobState::Completed;
    if (saved) {
        job_.error.reset();
        job_.error_message.clear();
    } else {
        // The bytes arrived; only the final move failed.
        job_.error = ErrorKind::StorageFinalizeFailure;
        job_.error_message = "payload left at " + final_location;
    }
    logger()->info("Transfer {} complete ({} bytes)", identity.value, job_.total_bytes);
    publisher_.publish(job_, true);
}

void TransferSession::persist(const DownloadJob& job) {
    PersistedRecord record;
    record.source_url = job.source_url;
    record.resume_token = job.resume_token;
    record.downloaded_bytes = job.downloaded_bytes;
    record.total_bytes = job.total_bytes;
    try {
        records_.save(record);
    } catch (const EngineError& ex) {
        logger()->error("Resume state not persisted, it will not survive a restart: {}",
                        ex.what());
    }
}

void TransferSession::purgeRecord() {
    try {
        records_.purge();
    } catch (const EngineError& ex) {
        logger()->error("Stale resume record left behind: {}", ex.what());
    }
}

} // namespace resumedl
