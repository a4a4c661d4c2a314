#include <catch2/catch.hpp>

#include "resumedl/completion_handler.hpp"
#include "resumedl/url.hpp"

using namespace resumedl;

TEST_CASE("parseSourceUrl accepts absolute download URLs", "[url]") {
    const auto http = parseSourceUrl("http://x/file.bin");
    REQUIRE(http);
    CHECK(http->scheme == "http");
    CHECK(http->host == "x");
    CHECK(http->path == "/file.bin");

    CHECK(parseSourceUrl("https://example.com/a/b.iso?token=1"));
    CHECK(parseSourceUrl("ftp://mirror.example.org/pub/file.tar.gz"));
    CHECK(parseSourceUrl("file:///tmp/payload.bin"));
}

TEST_CASE("parseSourceUrl rejects what cannot be downloaded", "[url]") {
    CHECK_FALSE(parseSourceUrl("not a url"));
    CHECK_FALSE(parseSourceUrl(""));
    CHECK_FALSE(parseSourceUrl("example.com/file.bin"));
    CHECK_FALSE(parseSourceUrl("mailto:someone@example.com"));
    CHECK_FALSE(parseSourceUrl("http://"));
}

TEST_CASE("trailingSegment names the payload after the URL path", "[url]") {
    CHECK(trailingSegment("http://x/file.bin") == "file.bin");
    CHECK(trailingSegment("https://example.com/dir/b%20c.zip?x=1#frag") == "b c.zip");
    CHECK(trailingSegment("https://example.com/dir/") == "dir");
    CHECK(trailingSegment("https://example.com/").empty());
    CHECK(trailingSegment("https://example.com/a/%2F").empty());
}

TEST_CASE("destinationName falls back to a default", "[url][completion]") {
    CHECK(CompletionHandler::destinationName("http://x/file.bin") == "file.bin");
    CHECK(CompletionHandler::destinationName("http://x/") == CompletionHandler::kDefaultFileName);
    CHECK(CompletionHandler::destinationName("http://x") == CompletionHandler::kDefaultFileName);
}
