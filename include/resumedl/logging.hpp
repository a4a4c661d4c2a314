#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace resumedl {

struct LogConfig {
    spdlog::level::level_enum level{spdlog::level::info};
    std::string file_path;  // empty: stderr only
};

inline constexpr const char* kLoggerName = "resumedl";

// Replaces the engine logger. Safe to call more than once.
void initLogging(const LogConfig& config = LogConfig());

// The engine logger; created on first use with the default config.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

} // namespace resumedl
