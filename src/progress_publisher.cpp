#include "resumedl/progress_publisher.hpp"

#include "resumedl/logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <exception>
#include <utility>
#include <vector>

namespace resumedl {

ProgressPublisher::ProgressPublisher(std::chrono::milliseconds interval, Executor executor)
    : interval_(std::max(interval, std::chrono::milliseconds::zero())),
      executor_(std::move(executor)),
      queue_("progress-publisher") {}

ProgressPublisher::~ProgressPublisher() = default;

ProgressPublisher::SubscriptionId ProgressPublisher::subscribe(Observer observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    const SubscriptionId id = next_id_++;
    observers_.emplace(id, std::move(observer));
    return id;
}

void ProgressPublisher::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.erase(id);
}

void ProgressPublisher::publish(const DownloadJob& job, bool transition) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (job.epoch != epoch_) {
        epoch_ = job.epoch;
        floor_ = 0.0;
    }
    const double progress = std::max(std::clamp(job.fraction(), 0.0, 1.0), floor_);
    floor_ = progress;

    Update update;
    update.view.progress = progress;
    update.view.status = formatStatus(job, progress);
    update.view.is_downloading = job.isDownloading();
    update.view.downloaded_bytes = job.downloaded_bytes;
    update.view.total_bytes = job.total_bytes;
    update.view.state = job.state;
    update.transition = transition;

    if (!transition && !pending_.empty() && !pending_.back().transition) {
        pending_.back() = std::move(update);
    } else {
        pending_.push_back(std::move(update));
    }

    if (transition) {
        queue_.post([this]() { deliverPending(); });
        return;
    }
    if (delayed_drain_scheduled_) {
        return;
    }

    delayed_drain_scheduled_ = true;
    auto delay = SerialQueue::Clock::duration::zero();
    if (last_progress_delivery_) {
        const auto now = SerialQueue::Clock::now();
        const auto due = *last_progress_delivery_ + interval_;
        if (due > now) {
            delay = due - now;
        }
    }
    queue_.postAfter(delay, [this]() { deliverPending(); });
}

StatusView ProgressPublisher::latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_;
}

void ProgressPublisher::flush() {
    queue_.post([this]() { deliverPending(); });
    queue_.drain();
}

void ProgressPublisher::deliverPending() {
    std::deque<Update> batch;
    std::vector<Observer> observers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        delayed_drain_scheduled_ = false;
        if (pending_.empty()) {
            return;
        }
        batch.swap(pending_);
        if (std::any_of(batch.begin(), batch.end(), [](const Update& u) { return !u.transition; })) {
            last_progress_delivery_ = SerialQueue::Clock::now();
        }
        latest_ = batch.back().view;
        observers.reserve(observers_.size());
        for (const auto& entry : observers_) {
            observers.push_back(entry.second);
        }
    }

    for (const auto& update : batch) {
        for (const auto& observer : observers) {
            if (executor_) {
                executor_([observer, view = update.view]() { observer(view); });
                continue;
            }
            try {
                observer(update.view);
            } catch (const std::exception& ex) {
                logger()->error("Progress observer threw: {}", ex.what());
            }
        }
    }
}

std::string ProgressPublisher::formatMegabytes(std::uint64_t bytes) {
    constexpr double kMegabyte = 1024.0 * 1024.0;
    return fmt::format("{:.1f} MB", static_cast<double>(bytes) / kMegabyte);
}

std::string ProgressPublisher::formatStatus(const DownloadJob& job, double progress) {
    switch (job.state) {
    case JobState::Idle:
        return "Idle";
    case JobState::Active:
        if (job.total_bytes > 0) {
            return fmt::format("Downloading... {:.1f}% ({} / {})", progress * 100.0,
                               formatMegabytes(job.downloaded_bytes),
                               formatMegabytes(job.total_bytes));
        }
        if (job.downloaded_bytes > 0) {
            return fmt::format("Downloading... {}", formatMegabytes(job.downloaded_bytes));
        }
        return "Starting download...";
    case JobState::Paused:
        return "Paused";
    case JobState::Interrupted:
        return job.resumable() ? "Interrupted (resumable)" : "Interrupted (not resumable)";
    case JobState::Completed:
        return "Download complete";
    case JobState::Failed:
        if (job.error == ErrorKind::InvalidSource) {
            return "Invalid URL";
        }
        return fmt::format("Error: {}",
                           job.error_message.empty() ? "unknown error" : job.error_message);
    }
    return "Idle";
}

} // namespace resumedl
