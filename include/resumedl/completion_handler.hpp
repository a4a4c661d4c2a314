#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace resumedl {

class CompletionHandler {
public:
    static constexpr const char* kDefaultFileName = "file.dat";

    explicit CompletionHandler(std::filesystem::path download_dir);

    // Moves the payload to <download_dir>/<name from source_url>, replacing any
    // file already there. A failure is logged and reported as nullopt; it is
    // not an error of the job.
    std::optional<std::filesystem::path> finalize(const std::filesystem::path& payload,
                                                  const std::string& source_url) const;

    [[nodiscard]] static std::string destinationName(const std::string& source_url);
    [[nodiscard]] const std::filesystem::path& downloadDir() const noexcept { return download_dir_; }

private:
    std::filesystem::path download_dir_;
};

} // namespace resumedl
