#include "resumedl/url.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <memory>
#include <string_view>

namespace resumedl {

namespace {

struct UrlDeleter {
    void operator()(CURLU* url) const noexcept { curl_url_cleanup(url); }
};

using UrlHandle = std::unique_ptr<CURLU, UrlDeleter>;

std::optional<std::string> getPart(CURLU* url, CURLUPart part, unsigned int flags = 0) {
    char* value = nullptr;
    if (curl_url_get(url, part, &value, flags) != CURLUE_OK || !value) {
        return std::nullopt;
    }
    std::string out{value};
    curl_free(value);
    return out;
}

bool isSupportedScheme(std::string scheme) {
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    constexpr std::array<std::string_view, 4> supported{"http", "https", "ftp", "file"};
    return std::find(supported.begin(), supported.end(), scheme) != supported.end();
}

} // namespace

std::optional<SourceUrl> parseSourceUrl(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    if (std::any_of(text.begin(), text.end(),
                    [](unsigned char c) { return std::isspace(c) != 0; })) {
        return std::nullopt;
    }

    UrlHandle url{curl_url()};
    if (!url) {
        return std::nullopt;
    }
    // No CURLU_DEFAULT_SCHEME: "example.com/x" is not a source we accept.
    if (curl_url_set(url.get(), CURLUPART_URL, text.c_str(), 0) != CURLUE_OK) {
        return std::nullopt;
    }

    SourceUrl parsed;
    auto scheme = getPart(url.get(), CURLUPART_SCHEME);
    if (!scheme || !isSupportedScheme(*scheme)) {
        return std::nullopt;
    }
    parsed.scheme = *scheme;

    auto host = getPart(url.get(), CURLUPART_HOST);
    if (parsed.scheme != "file" && (!host || host->empty())) {
        return std::nullopt;
    }
    parsed.host = host.value_or("");
    parsed.path = getPart(url.get(), CURLUPART_PATH).value_or("/");

    auto normalized = getPart(url.get(), CURLUPART_URL);
    if (!normalized) {
        return std::nullopt;
    }
    parsed.normalized = *normalized;
    return parsed;
}

std::string trailingSegment(const std::string& url) {
    std::string path;
    if (const auto parsed = parseSourceUrl(url)) {
        path = parsed->path;
    } else {
        path = url;
        const auto cut = path.find_first_of("?#");
        if (cut != std::string::npos) {
            path.erase(cut);
        }
    }

    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    const auto slash = path.find_last_of('/');
    std::string segment = slash == std::string::npos ? path : path.substr(slash + 1);
    if (segment.empty()) {
        return segment;
    }

    int decoded_length = 0;
    char* decoded = curl_easy_unescape(nullptr, segment.c_str(),
                                       static_cast<int>(segment.size()), &decoded_length);
    if (decoded) {
        segment.assign(decoded, static_cast<std::size_t>(decoded_length));
        curl_free(decoded);
    }
    // A decoded separator must not turn into a directory component.
    if (segment.find('/') != std::string::npos || segment == "." || segment == "..") {
        return {};
    }
    return segment;
}

} // namespace resumedl
