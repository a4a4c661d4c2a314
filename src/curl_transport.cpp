#include "resumedl/curl_transport.hpp"

#include "resumedl/detail/curl_utils.hpp"
#include "resumedl/error.hpp"
#include "resumedl/logging.hpp"

#include <curl/curl.h>
#include <fmt/format.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <exception>
#include <map>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

namespace resumedl {

namespace fs = std::filesystem;

namespace {

constexpr const char* kTokenHeader = "resumedl-resume 1";

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

using FilePtr = std::unique_ptr<FILE, FileDeleter>;

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

bool parseCount(const std::string& text, std::uint64_t& out) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return false;
    }
    try {
        out = std::stoull(text);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

bool isHttp(const std::string& url) {
    const auto scheme = lowercase(url.substr(0, url.find(':')));
    return scheme == "http" || scheme == "https";
}

// Opens the partial payload positioned at `offset`, shrinking offset to what
// is actually on disk.
FilePtr openPartial(const std::string& path, std::uint64_t& offset) {
    if (offset == 0) {
        return FilePtr{std::fopen(path.c_str(), "w+b")};
    }

    FilePtr file{std::fopen(path.c_str(), "r+b")};
    if (!file) {
        offset = 0;
        return FilePtr{std::fopen(path.c_str(), "w+b")};
    }
    if (fseeko(file.get(), 0, SEEK_END) != 0) {
        return nullptr;
    }
    const off_t size = ftello(file.get());
    if (size < 0) {
        return nullptr;
    }
    offset = std::min<std::uint64_t>(offset, static_cast<std::uint64_t>(size));
    if (ftruncate(fileno(file.get()), static_cast<off_t>(offset)) == -1) {
        return nullptr;
    }
    if (fseeko(file.get(), static_cast<off_t>(offset), SEEK_SET) != 0) {
        return nullptr;
    }
    return file;
}

} // namespace

class CurlTransport::Impl {
public:
    Impl(fs::path staging_dir, std::string user_agent)
        : staging_dir_(std::move(staging_dir)), user_agent_(std::move(user_agent)) {
        detail::ensureCurlInitialized();
        std::error_code ec;
        fs::create_directories(staging_dir_, ec);
        if (ec) {
            throw EngineError(fmt::format("Failed to create staging directory: {} - {}",
                                          staging_dir_.string(), ec.message()));
        }
    }

    ~Impl() { stopAll(); }

    void setEventSink(TransportEvents* events) {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        sink_ = events;
    }

    TransferIdentity issueNew(const std::string& url) {
        CurlResumeState state;
        state.url = url;
        const auto id = next_id_.fetch_add(1) + 1;
        state.partial_path = partialPathFor(id).string();
        return launch(id, std::move(state), false, false);
    }

    TransferIdentity issueResumed(const ResumeToken& token) {
        const auto id = next_id_.fetch_add(1) + 1;
        auto state = decodeToken(token);
        if (!state) {
            // Reported through the event channel like any other failure.
            return launch(id, CurlResumeState{}, true, true);
        }
        return launch(id, std::move(*state), true, false);
    }

    std::optional<ResumeToken> cancel(TransferIdentity identity, bool produce_token) {
        std::shared_ptr<Transfer> transfer;
        {
            std::lock_guard<std::mutex> lock(transfers_mutex_);
            const auto it = transfers_.find(identity.value);
            if (it == transfers_.end()) {
                return std::nullopt;
            }
            transfer = it->second;
            transfers_.erase(it);
        }

        transfer->abort = true;
        joinWorker(*transfer);

        if (produce_token && !transfer->corrupt_token) {
            if (auto token = tokenFor(*transfer)) {
                logger()->debug("Transfer {} stopped with resume token", identity.value);
                return token;
            }
        }
        removePartial(transfer->state.partial_path);
        return std::nullopt;
    }

    void discard(const ResumeToken& token) {
        const auto state = decodeToken(token);
        if (!state || state->partial_path.empty()) {
            return;
        }
        const fs::path partial{state->partial_path};
        std::error_code ec;
        if (fs::weakly_canonical(partial.parent_path(), ec) != fs::weakly_canonical(staging_dir_, ec)) {
            logger()->warn("Not discarding {}: outside the staging directory", partial.string());
            return;
        }
        removePartial(state->partial_path);
    }

    std::vector<LiveTransfer> liveTransfers() const {
        std::vector<LiveTransfer> live;
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        for (const auto& entry : transfers_) {
            const Transfer& transfer = *entry.second;
            if (transfer.finished) {
                continue;
            }
            live.push_back({transfer.identity, transfer.state.url, transfer.received.load(),
                            transfer.expected.load()});
        }
        return live;
    }

private:
    struct Transfer {
        TransferIdentity identity;
        // Owned by the worker until it has been joined.
        CurlResumeState state;
        bool resuming{false};
        bool corrupt_token{false};
        bool range_capable{false};

        std::atomic<bool> abort{false};
        std::atomic<bool> finished{false};
        std::atomic<bool> succeeded{false};
        std::atomic<std::uint64_t> received{0};
        std::atomic<std::uint64_t> expected{0};

        std::thread worker;
    };

    struct RequestContext {
        Impl* owner{nullptr};
        Transfer* transfer{nullptr};
        CURL* curl{nullptr};
        FILE* file{nullptr};
        std::uint64_t base_offset{0};
        bool response_checked{false};
        std::string write_error;

        // From the most recent response headers.
        std::string etag;
        std::string last_modified;
        std::uint64_t range_total{0};
        bool accepts_ranges{false};
        long status{0};

        std::uint64_t reported_received{0};
        std::uint64_t reported_expected{0};
    };

    TransferIdentity launch(std::uint64_t id, CurlResumeState state, bool resuming,
                            bool corrupt_token) {
        reapFinished();

        auto transfer = std::make_shared<Transfer>();
        transfer->identity = TransferIdentity{id};
        transfer->state = std::move(state);
        transfer->resuming = resuming;
        transfer->corrupt_token = corrupt_token;
        transfer->received = transfer->state.offset;
        transfer->expected = transfer->state.total;

        std::lock_guard<std::mutex> lock(transfers_mutex_);
        transfers_.emplace(id, transfer);
        transfer->worker = std::thread([this, transfer]() { run(*transfer); });
        return transfer->identity;
    }

    void run(Transfer& transfer) {
        try {
            perform(transfer);
        } catch (const std::exception& ex) {
            logger()->error("Transfer {} aborted: {}", transfer.identity.value, ex.what());
            fail(transfer, TransportError{-1, ex.what(), false, std::nullopt});
        }
    }

    void perform(Transfer& transfer) {
        if (transfer.corrupt_token) {
            fail(transfer, TransportError{CURLE_BAD_DOWNLOAD_RESUME, "Resume data is unreadable",
                                          false, std::nullopt});
            return;
        }

        std::uint64_t offset = transfer.resuming ? transfer.state.offset : 0;
        FilePtr file = openPartial(transfer.state.partial_path, offset);
        if (!file) {
            fail(transfer, TransportError{CURLE_WRITE_ERROR,
                                          "Cannot open partial file " + transfer.state.partial_path,
                                          false, std::nullopt});
            return;
        }
        if (offset != transfer.state.offset && transfer.resuming) {
            logger()->warn("Partial file for transfer {} holds {} bytes, expected {}",
                           transfer.identity.value, offset, transfer.state.offset);
        }
        transfer.state.offset = offset;
        transfer.received = offset;

        if (transfer.resuming && transfer.state.total > 0 && offset >= transfer.state.total) {
            file.reset();
            complete(transfer);
            return;
        }

        auto curl = detail::makeCurlHandle();
        if (!curl) {
            fail(transfer, TransportError{CURLE_FAILED_INIT, "Failed to allocate curl handle",
                                          false, std::nullopt});
            return;
        }

        RequestContext ctx;
        ctx.owner = this;
        ctx.transfer = &transfer;
        ctx.curl = curl.get();
        ctx.file = file.get();
        ctx.base_offset = offset;

        detail::CurlHeaderList headers;
        const std::string range = fmt::format("{}-", offset);

        curl_easy_setopt(curl.get(), CURLOPT_URL, transfer.state.url.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent_.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &Impl::writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &Impl::headerCallback);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &ctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &Impl::progressCallback);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &ctx);
        if (offset > 0) {
            curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
            const std::string validator = ifRangeValidator(transfer.state);
            if (!validator.empty() && isHttp(transfer.state.url)) {
                const std::string header = "If-Range: " + validator;
                headers.reset(curl_slist_append(nullptr, header.c_str()));
                curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
            }
            logger()->info("Transfer {} resuming {} at byte {}", transfer.identity.value,
                           transfer.state.url, offset);
        }

        const CURLcode res = curl_easy_perform(curl.get());
        const bool flushed = std::fflush(file.get()) == 0;
        file.reset();

        mergeResponse(transfer, ctx);

        // Completes even if an abort was raised after the last byte arrived.
        if (res == CURLE_OK && ctx.write_error.empty() && flushed) {
            complete(transfer);
            return;
        }
        if (transfer.abort) {
            finish(transfer, [&](TransportEvents& sink) {
                sink.onFailure(transfer.identity,
                               TransportError{CURLE_ABORTED_BY_CALLBACK, "cancelled", true,
                                              std::nullopt});
            });
            return;
        }
        if (!ctx.write_error.empty() || !flushed) {
            removePartial(transfer.state.partial_path);
            fail(transfer, TransportError{CURLE_WRITE_ERROR,
                                          ctx.write_error.empty() ? "Failed to flush partial file"
                                                                  : ctx.write_error,
                                          false, std::nullopt});
            return;
        }

        std::string message = curl_easy_strerror(res);
        if (res == CURLE_HTTP_RETURNED_ERROR) {
            long code = 0;
            curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &code);
            message = fmt::format("HTTP {}", code);
        }

        if (detail::isTransientError(res)) {
            if (auto token = tokenFor(transfer)) {
                fail(transfer, TransportError{static_cast<int>(res), message, false, token});
                return;
            }
        }
        removePartial(transfer.state.partial_path);
        fail(transfer, TransportError{static_cast<int>(res), message, false, std::nullopt});
    }

    static std::string ifRangeValidator(const CurlResumeState& state) {
        // Weak entity tags are not allowed in If-Range.
        if (!state.etag.empty() && state.etag.rfind("W/", 0) != 0) {
            return state.etag;
        }
        return state.last_modified;
    }

    static void mergeResponse(Transfer& transfer, const RequestContext& ctx) {
        if (!ctx.etag.empty()) {
            transfer.state.etag = ctx.etag;
        }
        if (!ctx.last_modified.empty()) {
            transfer.state.last_modified = ctx.last_modified;
        }
        const bool offset_honoured = ctx.status == 206 || ctx.base_offset > 0;
        transfer.range_capable = transfer.range_capable || ctx.accepts_ranges || offset_honoured ||
                                 !isHttp(transfer.state.url);
    }

    // Token for the bytes on disk, or nullopt when they cannot be continued.
    std::optional<ResumeToken> tokenFor(const Transfer& transfer) const {
        std::error_code ec;
        const auto on_disk = fs::file_size(transfer.state.partial_path, ec);
        if (ec) {
            return std::nullopt;
        }
        if (on_disk > 0 && !transfer.range_capable && !transfer.succeeded) {
            return std::nullopt;
        }

        CurlResumeState state = transfer.state;
        state.offset = on_disk;
        state.total = transfer.expected.load();
        return encodeToken(state);
    }

    void complete(Transfer& transfer) {
        const std::uint64_t received = transfer.received.load();
        transfer.expected = received;
        transfer.succeeded = true;
        finish(transfer, [&](TransportEvents& sink) {
            sink.onProgress(transfer.identity, received, received);
            sink.onComplete(transfer.identity, transfer.state.partial_path);
        });
    }

    void fail(Transfer& transfer, const TransportError& error) {
        finish(transfer, [&](TransportEvents& sink) { sink.onFailure(transfer.identity, error); });
    }

    template <typename Deliver>
    void finish(Transfer& transfer, Deliver&& deliver) {
        emit(std::forward<Deliver>(deliver));
        transfer.finished = true;
    }

    template <typename Deliver>
    void emit(Deliver&& deliver) {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        if (sink_) {
            deliver(*sink_);
        }
    }

    static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* ctx = static_cast<RequestContext*>(userdata);
        if (!ctx || !ctx->transfer || !ctx->file) {
            return 0;
        }
        Transfer& transfer = *ctx->transfer;
        if (transfer.abort) {
            return 0;
        }

        const size_t total = size * nmemb;
        if (!ctx->response_checked) {
            ctx->response_checked = true;
            long code = 0;
            curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &code);
            if (ctx->base_offset > 0 && code == 200) {
                // Range ignored or the resource changed: the body starts at byte zero.
                logger()->info("Server sent the full resource for transfer {}, restarting",
                               transfer.identity.value);
                if (ftruncate(fileno(ctx->file), 0) == -1 || fseeko(ctx->file, 0, SEEK_SET) != 0) {
                    ctx->write_error = "Cannot rewind partial file";
                    return 0;
                }
                ctx->base_offset = 0;
                transfer.received = 0;
                transfer.state.etag.clear();
                transfer.state.last_modified.clear();
            }
        }

        const size_t written = std::fwrite(ptr, 1, total, ctx->file);
        if (written != total) {
            ctx->write_error = "Failed to write partial file";
            return written;
        }
        transfer.received += written;
        return written;
    }

    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
        auto* ctx = static_cast<RequestContext*>(userdata);
        const size_t total = size * nitems;
        if (!ctx) {
            return total;
        }

        const std::string line(buffer, total);
        if (line.rfind("HTTP/", 0) == 0) {
            // A new response (redirects produce several).
            ctx->etag.clear();
            ctx->last_modified.clear();
            ctx->range_total = 0;
            ctx->accepts_ranges = false;
            std::istringstream status_line(line);
            std::string version;
            status_line >> version >> ctx->status;
            return total;
        }

        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            return total;
        }
        const std::string name = lowercase(trim(line.substr(0, colon)));
        const std::string value = trim(line.substr(colon + 1));

        if (name == "etag") {
            ctx->etag = value;
        } else if (name == "last-modified") {
            ctx->last_modified = value;
        } else if (name == "accept-ranges") {
            ctx->accepts_ranges = lowercase(value) == "bytes";
        } else if (name == "content-range") {
            const auto slash = value.rfind('/');
            std::uint64_t range_total = 0;
            if (slash != std::string::npos && parseCount(value.substr(slash + 1), range_total)) {
                ctx->range_total = range_total;
            }
        }
        return total;
    }

    static int progressCallback(void* clientp, curl_off_t dltotal, curl_off_t /*dlnow*/,
                                curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
        auto* ctx = static_cast<RequestContext*>(clientp);
        if (!ctx || !ctx->transfer) {
            return 1;
        }
        Transfer& transfer = *ctx->transfer;
        if (transfer.abort) {
            return 1;
        }

        if (ctx->range_total > 0 && ctx->base_offset > 0) {
            transfer.expected = ctx->range_total;
        } else if (dltotal > 0) {
            transfer.expected = ctx->base_offset + static_cast<std::uint64_t>(dltotal);
        }

        const std::uint64_t received = transfer.received.load();
        const std::uint64_t expected = transfer.expected.load();
        if (received == ctx->reported_received && expected == ctx->reported_expected) {
            return 0;
        }
        ctx->reported_received = received;
        ctx->reported_expected = expected;
        ctx->owner->emit([&](TransportEvents& sink) {
            sink.onProgress(transfer.identity, received, expected);
        });
        return 0;
    }

    fs::path partialPathFor(std::uint64_t id) const {
        const auto stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::system_clock::now().time_since_epoch())
                               .count();
        return staging_dir_ / fmt::format("transfer-{}-{}.part", stamp, id);
    }

    static void removePartial(const std::string& path) {
        if (path.empty()) {
            return;
        }
        std::error_code ec;
        fs::remove(path, ec);
        if (ec) {
            logger()->warn("Could not remove partial file {}: {}", path, ec.message());
        }
    }

    static void joinWorker(Transfer& transfer) {
        if (!transfer.worker.joinable()) {
            return;
        }
        if (transfer.worker.get_id() == std::this_thread::get_id()) {
            transfer.worker.detach();
            return;
        }
        transfer.worker.join();
    }

    void reapFinished() {
        std::vector<std::shared_ptr<Transfer>> done;
        {
            std::lock_guard<std::mutex> lock(transfers_mutex_);
            for (auto it = transfers_.begin(); it != transfers_.end();) {
                if (it->second->finished) {
                    done.push_back(it->second);
                    it = transfers_.erase(it);
                } else {
                    ++it;
                }
            }
        }
        for (auto& transfer : done) {
            joinWorker(*transfer);
        }
    }

    void stopAll() {
        std::map<std::uint64_t, std::shared_ptr<Transfer>> remaining;
        {
            std::lock_guard<std::mutex> lock(transfers_mutex_);
            remaining.swap(transfers_);
        }
        for (auto& entry : remaining) {
            entry.second->abort = true;
        }
        for (auto& entry : remaining) {
            joinWorker(*entry.second);
        }
    }

    fs::path staging_dir_;
    std::string user_agent_;
    std::atomic<std::uint64_t> next_id_{0};

    mutable std::mutex transfers_mutex_;
    std::map<std::uint64_t, std::shared_ptr<Transfer>> transfers_;

    std::mutex sink_mutex_;
    TransportEvents* sink_{nullptr};
};

CurlTransport::CurlTransport(fs::path staging_dir, std::string user_agent)
    : impl_(std::make_unique<Impl>(std::move(staging_dir), std::move(user_agent))) {}

CurlTransport::~CurlTransport() = default;

void CurlTransport::setEventSink(TransportEvents* events) { impl_->setEventSink(events); }

TransferIdentity CurlTransport::issueNewTransfer(const std::string& url) {
    return impl_->issueNew(url);
}

TransferIdentity CurlTransport::issueResumedTransfer(const ResumeToken& token) {
    return impl_->issueResumed(token);
}

std::optional<ResumeToken> CurlTransport::cancel(TransferIdentity identity, bool produce_token) {
    return impl_->cancel(identity, produce_token);
}

void CurlTransport::discard(const ResumeToken& token) { impl_->discard(token); }

std::vector<LiveTransfer> CurlTransport::liveTransfers() const { return impl_->liveTransfers(); }

ResumeToken CurlTransport::encodeToken(const CurlResumeState& state) {
    std::string out = fmt::format("{}\n", kTokenHeader);
    out += fmt::format("url={}\n", state.url);
    out += fmt::format("partial={}\n", state.partial_path);
    out += fmt::format("offset={}\n", state.offset);
    out += fmt::format("total={}\n", state.total);
    if (!state.etag.empty()) {
        out += fmt::format("etag={}\n", state.etag);
    }
    if (!state.last_modified.empty()) {
        out += fmt::format("last_modified={}\n", state.last_modified);
    }
    return ResumeToken{std::move(out)};
}

std::optional<CurlResumeState> CurlTransport::decodeToken(const ResumeToken& token) {
    std::istringstream in(token.bytes);
    std::string line;
    if (!std::getline(in, line) || line != kTokenHeader) {
        return std::nullopt;
    }

    CurlResumeState state;
    while (std::getline(in, line)) {
        if (line.empty()) {
            continue;
        }
        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            return std::nullopt;
        }
        const std::string key = line.substr(0, eq);
        const std::string value = line.substr(eq + 1);
        if (key == "url") {
            state.url = value;
        } else if (key == "partial") {
            state.partial_path = value;
        } else if (key == "offset") {
            if (!parseCount(value, state.offset)) {
                return std::nullopt;
            }
        } else if (key == "total") {
            if (!parseCount(value, state.total)) {
                return std::nullopt;
            }
        } else if (key == "etag") {
            state.etag = value;
        } else if (key == "last_modified") {
            state.last_modified = value;
        }
    }

    if (state.url.empty() || state.partial_path.empty()) {
        return std::nullopt;
    }
    return state;
}

} // namespace resumedl
