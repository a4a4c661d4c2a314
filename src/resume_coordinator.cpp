#include "resumedl/resume_coordinator.hpp"

#include "resumedl/curl_transport.hpp"
#include "resumedl/error.hpp"
#include "resumedl/logging.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

namespace resumedl {

namespace {

TransportPtr requireTransport(TransportPtr transport) {
    if (!transport) {
        throw std::invalid_argument("ResumeCoordinator requires a transport");
    }
    return transport;
}

} // namespace

ResumeCoordinator::ResumeCoordinator(EngineConfig config)
    : ResumeCoordinator(config, std::make_shared<CurlTransport>(config.staging_dir),
                        std::make_shared<FileStateStore>(config.state_dir)) {}

ResumeCoordinator::ResumeCoordinator(EngineConfig config, TransportPtr transport,
                                     StateStorePtr store)
    : config_(std::move(config)),
      store_(std::move(store)),
      records_(store_),
      publisher_(config_.progress_interval),
      completion_(config_.download_dir),
      transport_(requireTransport(std::move(transport))),
      session_(*transport_, records_, publisher_, completion_),
      retry_queue_("retry") {
    transport_->setEventSink(&session_);
    session_.setTerminalListener([this](const DownloadJob& job) { onTerminal(job); });

    if (auto record = records_.load()) {
        session_.restore(*record);
        if (record->resume_token) {
            logger()->info("Found interrupted download of {} ({} / {} bytes)", record->source_url,
                           record->downloaded_bytes, record->total_bytes);
        }
    }
}

ResumeCoordinator::~ResumeCoordinator() {
    try {
        shutdown();
    } catch (const std::exception& ex) {
        logger()->error("Shutdown did not complete cleanly: {}", ex.what());
    }
    transport_->setEventSink(nullptr);
}

bool ResumeCoordinator::start(const std::optional<std::string>& url) {
    {
        std::lock_guard<std::mutex> lock(retry_mutex_);
        if (shut_down_) {
            return false;
        }
        retry_attempts_ = 0;
        retry_pending_ = false;
    }
    retry_queue_.cancelDelayed();
    return startTransfer(url);
}

bool ResumeCoordinator::startTransfer(const std::optional<std::string>& url) {
    const DownloadJob job = session_.snapshot();
    if (job.state == JobState::Active) {
        logger()->debug("start ignored: a transfer is already active");
        return false;
    }

    if (job.resumable()) {
        if (url && !url->empty() && *url != job.source_url) {
            logger()->info("Finishing interrupted download of {} before {}", job.source_url, *url);
        }
        return session_.start(job.source_url, job.resume_token).has_value();
    }

    const std::string target = url && !url->empty() ? *url : job.source_url;
    return session_.start(target).has_value();
}

std::optional<ResumeToken> ResumeCoordinator::pause() {
    {
        std::lock_guard<std::mutex> lock(retry_mutex_);
        retry_pending_ = false;
    }
    retry_queue_.cancelDelayed();
    return session_.pause();
}

void ResumeCoordinator::cancel() {
    {
        std::lock_guard<std::mutex> lock(retry_mutex_);
        retry_attempts_ = 0;
        retry_pending_ = false;
    }
    retry_queue_.cancelDelayed();
    session_.cancel();
}

void ResumeCoordinator::reconnect(const std::function<void()>& on_ready) {
    auto live = transport_->liveTransfers();
    if (live.empty()) {
        logger()->debug("reconnect: no live transfers, keeping {}",
                        toString(session_.snapshot().state));
    } else {
        const TransferIdentity current = session_.currentIdentity();
        const auto owned = std::find_if(live.begin(), live.end(), [&](const LiveTransfer& t) {
            return t.identity == current;
        });
        const LiveTransfer chosen =
            owned != live.end()
                ? *owned
                : *std::max_element(live.begin(), live.end(),
                                    [](const LiveTransfer& a, const LiveTransfer& b) {
                                        return a.identity < b.identity;
                                    });

        for (const auto& stale : live) {
            if (stale.identity != chosen.identity) {
                logger()->info("reconnect: dropping stale transfer {}", stale.identity.value);
                transport_->cancel(stale.identity, false);
            }
        }
        if (chosen.identity != current) {
            session_.bind(chosen);
        }
    }

    if (on_ready) {
        on_ready();
    }
}

void ResumeCoordinator::shutdown() {
    {
        std::lock_guard<std::mutex> lock(retry_mutex_);
        if (shut_down_) {
            return;
        }
        shut_down_ = true;
        retry_pending_ = false;
    }
    retry_queue_.cancelDelayed();

    if (session_.snapshot().state == JobState::Active) {
        if (session_.pause()) {
            logger()->info("Resume token flushed on shutdown");
        } else {
            logger()->warn("Active transfer stopped on shutdown without a resume token");
        }
    }
    publisher_.flush();
}

bool ResumeCoordinator::retryPending() const {
    std::lock_guard<std::mutex> lock(retry_mutex_);
    return retry_pending_;
}

void ResumeCoordinator::onTerminal(const DownloadJob& job) {
    const bool retryable = job.state == JobState::Interrupted || job.state == JobState::Failed;
    if (!retryable || job.error == ErrorKind::InvalidSource) {
        return;
    }

    std::lock_guard<std::mutex> lock(retry_mutex_);
    if (shut_down_ || retry_attempts_ >= config_.retry.max_attempts) {
        return;
    }
    ++retry_attempts_;
    retry_pending_ = true;
    logger()->info("Retrying {} in {} ms (attempt {} of {})", job.source_url,
                   config_.retry.delay.count(), retry_attempts_, config_.retry.max_attempts);
    retry_queue_.postAfter(config_.retry.delay, [this]() { retry(); });
}

void ResumeCoordinator::retry() {
    {
        std::lock_guard<std::mutex> lock(retry_mutex_);
        if (shut_down_ || !retry_pending_) {
            return;
        }
        retry_pending_ = false;
    }
    try {
        startTransfer(std::nullopt);
    } catch (const EngineError& ex) {
        logger()->error("Retry failed to start: {}", ex.what());
    }
}

} // namespace resumedl
