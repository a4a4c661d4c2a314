#pragma once

#include "download_job.hpp"
#include "serial_queue.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace resumedl {

class ProgressPublisher {
public:
    using Observer = std::function<void(const StatusView&)>;
    // Hands a notification to the presentation layer's own context.
    using Executor = std::function<void(std::function<void()>)>;
    using SubscriptionId = std::uint64_t;

    explicit ProgressPublisher(std::chrono::milliseconds interval = std::chrono::milliseconds(100),
                               Executor executor = nullptr);
    ~ProgressPublisher();

    ProgressPublisher(const ProgressPublisher&) = delete;
    ProgressPublisher& operator=(const ProgressPublisher&) = delete;

    SubscriptionId subscribe(Observer observer);
    void unsubscribe(SubscriptionId id);

    // Called from the session with its state lock held. Never blocks on
    // observers. Transitions are always delivered; plain progress updates are
    // coalesced to one per interval.
    void publish(const DownloadJob& job, bool transition);

    // Last view handed to observers.
    [[nodiscard]] StatusView latest() const;

    // Waits until everything published so far has been delivered.
    void flush();

    [[nodiscard]] static std::string formatStatus(const DownloadJob& job, double progress);
    [[nodiscard]] static std::string formatMegabytes(std::uint64_t bytes);

private:
    struct Update {
        StatusView view;
        bool transition{false};
    };

    void deliverPending();

    std::chrono::milliseconds interval_;
    Executor executor_;

    mutable std::mutex mutex_;
    std::map<SubscriptionId, Observer> observers_;
    SubscriptionId next_id_{1};
    std::deque<Update> pending_;
    bool delayed_drain_scheduled_{false};
    std::optional<SerialQueue::Clock::time_point> last_progress_delivery_;
    std::uint64_t epoch_{0};
    double floor_{0.0};
    StatusView latest_;

    // Last member: stopped before anything it might still touch.
    SerialQueue queue_;
};

} // namespace resumedl
