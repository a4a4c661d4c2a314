#pragma once

#include <optional>
#include <string>

namespace resumedl {

struct SourceUrl {
    std::string normalized;
    std::string scheme;
    std::string host;
    std::string path;
};

// Only absolute http, https, ftp and file URLs are accepted.
[[nodiscard]] std::optional<SourceUrl> parseSourceUrl(const std::string& text);

// Last non-empty path segment, percent-decoded; empty when there is none.
[[nodiscard]] std::string trailingSegment(const std::string& url);

} // namespace resumedl
