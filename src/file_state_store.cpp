#include "resumedl/state_store.hpp"

#include "resumedl/error.hpp"
#include "resumedl/logging.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace resumedl {

namespace fs = std::filesystem;

FileStateStore::FileStateStore(fs::path directory) : directory_(std::move(directory)) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw EngineError(fmt::format("Failed to create state directory: {} - {}",
                                      directory_.string(), ec.message()));
    }
}

fs::path FileStateStore::pathFor(const std::string& key) const {
    const bool valid = !key.empty() && std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return std::isalnum(c) != 0 || c == '_' || c == '-' || c == '.';
    });
    if (!valid || key.front() == '.') {
        throw std::invalid_argument("Invalid state key: '" + key + "'");
    }
    return directory_ / key;
}

void FileStateStore::write(const std::string& key, const std::string& bytes) {
    const fs::path target = pathFor(key);
    fs::path staging = target;
    staging += ".tmp";

    std::lock_guard<std::mutex> lock(mutex_);
    {
        std::ofstream out(staging, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw EngineError("Cannot open state file for writing: " + staging.string());
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            throw EngineError("Failed to write state file: " + staging.string());
        }
    }

    std::error_code ec;
    fs::rename(staging, target, ec);
    if (ec) {
        fs::remove(staging, ec);
        throw EngineError(fmt::format("Failed to commit state key '{}': {}", key, ec.message()));
    }
}

std::optional<std::string> FileStateStore::read(const std::string& key) const {
    const fs::path target = pathFor(key);

    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(target, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::string bytes{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    return bytes;
}

void FileStateStore::remove(const std::string& key) {
    const fs::path target = pathFor(key);

    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    fs::remove(target, ec);
    if (ec) {
        throw EngineError(fmt::format("Failed to remove state key '{}': {}", key, ec.message()));
    }
}

namespace {

std::uint64_t parseCount(const std::optional<std::string>& text) {
    if (!text || text->empty()) {
        return 0;
    }
    std::istringstream in(*text);
    std::uint64_t value = 0;
    if (!(in >> value)) {
        logger()->warn("Ignoring malformed byte count in state store: '{}'", *text);
        return 0;
    }
    return value;
}

} // namespace

ResumeRecordStore::ResumeRecordStore(StateStorePtr store) : store_(std::move(store)) {
    if (!store_) {
        throw std::invalid_argument("ResumeRecordStore requires a state store");
    }
}

std::optional<PersistedRecord> ResumeRecordStore::load() const {
    auto url = store_->read(kSourceUrlKey);
    if (!url || url->empty()) {
        return std::nullopt;
    }

    PersistedRecord record;
    record.source_url = std::move(*url);
    if (auto token = store_->read(kResumeTokenKey); token && !token->empty()) {
        record.resume_token = ResumeToken{std::move(*token)};
        record.downloaded_bytes = parseCount(store_->read(kDownloadedBytesKey));
        record.total_bytes = parseCount(store_->read(kTotalBytesKey));
    }
    return record;
}

void ResumeRecordStore::save(const PersistedRecord& record) {
    // The token goes last: a crash mid-save leaves either the old token or
    // counts that are merely informational.
    store_->write(kSourceUrlKey, record.source_url);
    store_->write(kDownloadedBytesKey, std::to_string(record.downloaded_bytes));
    store_->write(kTotalBytesKey, std::to_string(record.total_bytes));
    if (record.resume_token && !record.resume_token->empty()) {
        store_->write(kResumeTokenKey, record.resume_token->bytes);
    } else {
        store_->remove(kResumeTokenKey);
    }
    logger()->debug("Persisted resume record for {} ({} / {} bytes, token: {})",
                    record.source_url, record.downloaded_bytes, record.total_bytes,
                    record.resume_token ? "yes" : "no");
}

void ResumeRecordStore::rememberSource(const std::string& url) {
    store_->write(kSourceUrlKey, url);
}

void ResumeRecordStore::purge() {
    store_->remove(kResumeTokenKey);
    store_->remove(kDownloadedBytesKey);
    store_->remove(kTotalBytesKey);
    store_->remove(kSourceUrlKey);
    logger()->debug("Purged resume record");
}

} // namespace resumedl
