#pragma once

#include <curl/curl.h>

#include <memory>

namespace resumedl::detail {

void ensureCurlInitialized();

struct CurlEasyDeleter {
    void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};

using CurlHandle = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlHeaderList = std::unique_ptr<curl_slist, CurlSlistDeleter>;

[[nodiscard]] CurlHandle makeCurlHandle();

// Errors after which the same request may succeed later from where it stopped.
[[nodiscard]] bool isTransientError(CURLcode code) noexcept;

} // namespace resumedl::detail
