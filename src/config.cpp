#include "resumedl/config.hpp"

#include <cstdlib>
#include <system_error>

namespace resumedl {

namespace fs = std::filesystem;

namespace {

fs::path stateRoot() {
    if (const char* xdg = std::getenv("XDG_STATE_HOME"); xdg && *xdg) {
        return fs::path(xdg) / "resumedl";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home) / ".local" / "state" / "resumedl";
    }
    std::error_code ec;
    const auto cwd = fs::current_path(ec);
    return (ec ? fs::path(".") : cwd) / ".resumedl";
}

} // namespace

EngineConfig EngineConfig::defaults() {
    EngineConfig config = underRoot(stateRoot());
    std::error_code ec;
    const auto cwd = fs::current_path(ec);
    config.download_dir = ec ? fs::path(".") : cwd;
    return config;
}

EngineConfig EngineConfig::underRoot(const fs::path& root) {
    EngineConfig config;
    config.state_dir = root / "state";
    config.staging_dir = root / "partial";
    config.download_dir = root / "downloads";
    return config;
}

} // namespace resumedl
