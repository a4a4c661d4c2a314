#include "resumedl/serial_queue.hpp"

#include "resumedl/logging.hpp"

#include <exception>
#include <future>
#include <stdexcept>

namespace resumedl {

SerialQueue::SerialQueue(std::string name)
    : name_(std::move(name)), worker_([this]() { run(); }) {}

SerialQueue::~SerialQueue() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void SerialQueue::post(Task task) {
    postAfter(Clock::duration::zero(), std::move(task));
}

void SerialQueue::postAfter(Clock::duration delay, Task task) {
    if (!task) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        tasks_.emplace(std::make_pair(Clock::now() + delay, next_sequence_++), std::move(task));
    }
    cv_.notify_all();
}

void SerialQueue::cancelDelayed() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = Clock::now();
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (it->first.first > now) {
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }
}

void SerialQueue::drain() {
    if (isCurrentThread()) {
        throw std::logic_error("SerialQueue::drain called from its own thread: " + name_);
    }
    auto done = std::make_shared<std::promise<void>>();
    auto finished = done->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        tasks_.emplace(std::make_pair(Clock::now(), next_sequence_++),
                       [done]() { done->set_value(); });
    }
    cv_.notify_all();
    finished.wait();
}

bool SerialQueue::isCurrentThread() const noexcept {
    return std::this_thread::get_id() == worker_.get_id();
}

void SerialQueue::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (stopping_) {
            break;
        }
        if (tasks_.empty()) {
            cv_.wait(lock);
            continue;
        }

        const auto deadline = tasks_.begin()->first.first;
        if (deadline > Clock::now()) {
            cv_.wait_until(lock, deadline);
            continue;
        }

        Task task = std::move(tasks_.begin()->second);
        tasks_.erase(tasks_.begin());
        lock.unlock();
        try {
            task();
        } catch (const std::exception& ex) {
            logger()->error("[{}] task threw: {}", name_, ex.what());
        }
        lock.lock();
    }
}

} // namespace resumedl
