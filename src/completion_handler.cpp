#include "resumedl/completion_handler.hpp"

#include "resumedl/error.hpp"
#include "resumedl/logging.hpp"
#include "resumedl/url.hpp"

#include <system_error>
#include <utility>

namespace resumedl {

namespace fs = std::filesystem;

CompletionHandler::CompletionHandler(fs::path download_dir)
    : download_dir_(std::move(download_dir)) {}

std::string CompletionHandler::destinationName(const std::string& source_url) {
    std::string name = trailingSegment(source_url);
    if (name.empty()) {
        return kDefaultFileName;
    }
    return name;
}

std::optional<fs::path> CompletionHandler::finalize(const fs::path& payload,
                                                    const std::string& source_url) const {
    const fs::path destination = download_dir_ / destinationName(source_url);

    std::error_code ec;
    fs::create_directories(download_dir_, ec);
    if (ec) {
        logger()->error("{}: cannot create {}: {}", toString(ErrorKind::StorageFinalizeFailure),
                        download_dir_.string(), ec.message());
        return std::nullopt;
    }

    fs::remove(destination, ec);
    if (ec) {
        logger()->warn("Could not remove existing {}: {}", destination.string(), ec.message());
    }

    fs::rename(payload, destination, ec);
    if (ec == std::errc::cross_device_link) {
        // Staging and download directories live on different filesystems.
        ec.clear();
        fs::copy_file(payload, destination, fs::copy_options::overwrite_existing, ec);
        if (!ec) {
            std::error_code ignored;
            if (!fs::remove(payload, ignored) && ignored) {
                logger()->warn("Could not remove staged payload {}: {}", payload.string(),
                               ignored.message());
            }
        }
    }
    if (ec) {
        logger()->error("{}: moving {} to {} failed: {}",
                        toString(ErrorKind::StorageFinalizeFailure), payload.string(),
                        destination.string(), ec.message());
        return std::nullopt;
    }

    logger()->info("Saved to: {}", destination.string());
    return destination;
}

} // namespace resumedl
