#pragma once

#include "download_job.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace resumedl {

class StateStore {
public:
    virtual ~StateStore() = default;

    virtual void write(const std::string& key, const std::string& bytes) = 0;
    [[nodiscard]] virtual std::optional<std::string> read(const std::string& key) const = 0;
    virtual void remove(const std::string& key) = 0;
};

using StateStorePtr = std::shared_ptr<StateStore>;

// One file per key under a directory. Writes go to a temporary sibling and
// are renamed into place, so a reader never sees a torn value.
class FileStateStore final : public StateStore {
public:
    explicit FileStateStore(std::filesystem::path directory);

    void write(const std::string& key, const std::string& bytes) override;
    [[nodiscard]] std::optional<std::string> read(const std::string& key) const override;
    void remove(const std::string& key) override;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }

private:
    [[nodiscard]] std::filesystem::path pathFor(const std::string& key) const;

    std::filesystem::path directory_;
    mutable std::mutex mutex_;
};

struct PersistedRecord {
    std::string source_url;
    std::optional<ResumeToken> resume_token;
    std::uint64_t downloaded_bytes{0};
    std::uint64_t total_bytes{0};
};

// Typed view of the keys the engine keeps in a StateStore.
class ResumeRecordStore {
public:
    static constexpr const char* kResumeTokenKey = "resume_token";
    static constexpr const char* kSourceUrlKey = "source_url";
    static constexpr const char* kDownloadedBytesKey = "downloaded_bytes";
    static constexpr const char* kTotalBytesKey = "total_bytes";

    explicit ResumeRecordStore(StateStorePtr store);

    [[nodiscard]] std::optional<PersistedRecord> load() const;
    void save(const PersistedRecord& record);
    void rememberSource(const std::string& url);
    void purge();

private:
    StateStorePtr store_;
};

} // namespace resumedl
