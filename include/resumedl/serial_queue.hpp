#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

namespace resumedl {

// A single worker thread draining tasks in order. Delayed tasks run once
// their deadline has passed, in deadline order.
class SerialQueue {
public:
    using Task = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    explicit SerialQueue(std::string name);
    ~SerialQueue();

    SerialQueue(const SerialQueue&) = delete;
    SerialQueue& operator=(const SerialQueue&) = delete;

    void post(Task task);
    void postAfter(Clock::duration delay, Task task);

    // Drops delayed tasks that have not started yet.
    void cancelDelayed();

    // Blocks until every task posted before the call (delayed ones excluded)
    // has run. Must not be called from the queue's own thread.
    void drain();

    [[nodiscard]] bool isCurrentThread() const noexcept;
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    void run();

    std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    // Keyed by (deadline, sequence) so equal deadlines keep posting order.
    std::map<std::pair<Clock::time_point, std::uint64_t>, Task> tasks_;
    std::uint64_t next_sequence_{0};
    bool stopping_{false};
    std::thread worker_;
};

} // namespace resumedl
