#pragma once

#include "resumedl/transport.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace resumedl::test {

namespace fs = std::filesystem;

class TempDir {
public:
    TempDir() {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        std::uniform_int_distribution<unsigned long long> dist;
        const auto base = fs::temp_directory_path();
        do {
            path_ = base / ("resumedl-test-" + std::to_string(dist(gen)));
        } while (fs::exists(path_));
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const fs::path& path() const noexcept { return path_; }

private:
    fs::path path_;
};

inline void writeFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

inline std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

inline std::string patternBytes(std::size_t size) {
    std::string out(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        out[i] = static_cast<char>('a' + (i * 7 + i / 251) % 26);
    }
    return out;
}

inline bool waitUntil(const std::function<bool()>& predicate,
                      std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

// Transport double: records every request and lets the test play the
// network side by calling the event sink directly.
class FakeTransport final : public Transport {
public:
    struct Request {
        TransferIdentity identity;
        std::string url;
        std::optional<ResumeToken> token;
    };

    struct Cancellation {
        TransferIdentity identity;
        bool produce_token{false};
    };

    void setEventSink(TransportEvents* events) override {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = events;
    }

    TransferIdentity issueNewTransfer(const std::string& url) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const TransferIdentity identity{++next_id_};
        requests_.push_back({identity, url, std::nullopt});
        live_.push_back({identity, url, 0, 0});
        return identity;
    }

    TransferIdentity issueResumedTransfer(const ResumeToken& token) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const TransferIdentity identity{++next_id_};
        requests_.push_back({identity, {}, token});
        live_.push_back({identity, {}, 0, 0});
        return identity;
    }

    std::optional<ResumeToken> cancel(TransferIdentity identity, bool produce_token) override {
        std::lock_guard<std::mutex> lock(mutex_);
        cancellations_.push_back({identity, produce_token});
        live_.erase(std::remove_if(live_.begin(), live_.end(),
                                   [&](const LiveTransfer& t) { return t.identity == identity; }),
                    live_.end());
        if (produce_token) {
            return pause_token_;
        }
        return std::nullopt;
    }

    void discard(const ResumeToken& token) override {
        std::lock_guard<std::mutex> lock(mutex_);
        discarded_.push_back(token);
    }

    std::vector<LiveTransfer> liveTransfers() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return live_;
    }

    // Test controls.
    void setPauseToken(std::optional<ResumeToken> token) {
        std::lock_guard<std::mutex> lock(mutex_);
        pause_token_ = std::move(token);
    }

    void addLive(const LiveTransfer& transfer) {
        std::lock_guard<std::mutex> lock(mutex_);
        live_.push_back(transfer);
        next_id_ = std::max(next_id_, transfer.identity.value);
    }

    void progress(TransferIdentity identity, std::uint64_t received, std::uint64_t expected) {
        sink()->onProgress(identity, received, expected);
    }

    void fail(TransferIdentity identity, const TransportError& error) {
        finished(identity);
        sink()->onFailure(identity, error);
    }

    void complete(TransferIdentity identity, const std::string& location) {
        finished(identity);
        sink()->onComplete(identity, location);
    }

    [[nodiscard]] std::vector<Request> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    [[nodiscard]] std::vector<Cancellation> cancellations() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancellations_;
    }

    [[nodiscard]] std::vector<ResumeToken> discarded() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return discarded_;
    }

    [[nodiscard]] TransportEvents* sink() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sink_;
    }

private:
    void finished(TransferIdentity identity) {
        std::lock_guard<std::mutex> lock(mutex_);
        live_.erase(std::remove_if(live_.begin(), live_.end(),
                                   [&](const LiveTransfer& t) { return t.identity == identity; }),
                    live_.end());
    }

    mutable std::mutex mutex_;
    TransportEvents* sink_{nullptr};
    std::uint64_t next_id_{0};
    std::optional<ResumeToken> pause_token_{ResumeToken{"token-T"}};
    std::vector<Request> requests_;
    std::vector<Cancellation> cancellations_;
    std::vector<ResumeToken> discarded_;
    std::vector<LiveTransfer> live_;
};

// Event sink that records what a real transport delivers.
class RecordingEvents final : public TransportEvents {
public:
    struct Progress {
        TransferIdentity identity;
        std::uint64_t received{0};
        std::uint64_t expected{0};
    };

    void onProgress(TransferIdentity identity, std::uint64_t bytes_received,
                    std::uint64_t bytes_expected) override {
        std::lock_guard<std::mutex> lock(mutex_);
        progress_.push_back({identity, bytes_received, bytes_expected});
    }

    void onFailure(TransferIdentity identity, const TransportError& error) override {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_.emplace_back(identity, error);
        cv_.notify_all();
    }

    void onComplete(TransferIdentity identity, const std::string& final_location) override {
        std::lock_guard<std::mutex> lock(mutex_);
        completions_.emplace_back(identity, final_location);
        cv_.notify_all();
    }

    bool waitForTerminal(std::size_t count = 1,
                         std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&]() {
            return failures_.size() + completions_.size() >= count;
        });
    }

    [[nodiscard]] std::vector<Progress> progress() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return progress_;
    }

    [[nodiscard]] std::vector<std::pair<TransferIdentity, TransportError>> failures() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return failures_;
    }

    [[nodiscard]] std::vector<std::pair<TransferIdentity, std::string>> completions() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return completions_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Progress> progress_;
    std::vector<std::pair<TransferIdentity, TransportError>> failures_;
    std::vector<std::pair<TransferIdentity, std::string>> completions_;
};

} // namespace resumedl::test
