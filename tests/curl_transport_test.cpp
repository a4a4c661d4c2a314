#include <catch2/catch.hpp>

#include "resumedl/curl_transport.hpp"
#include "test_helpers.hpp"

#include <curl/curl.h>

#include <string>

using namespace resumedl;
using namespace resumedl::test;

namespace {

std::string fileUrl(const fs::path& path) { return "file://" + path.string(); }

struct TransportFixture {
    TempDir tmp;
    fs::path staging = tmp.path() / "partial";
    RecordingEvents events;
    CurlTransport transport{staging};

    TransportFixture() { transport.setEventSink(&events); }

    fs::path source(std::size_t size) {
        const auto path = tmp.path() / "origin" / "payload.bin";
        writeFile(path, patternBytes(size));
        return path;
    }
};

} // namespace

TEST_CASE("a fresh transfer delivers the whole payload", "[curl]") {
    TransportFixture f;
    const auto origin = f.source(64 * 1024);

    const auto identity = f.transport.issueNewTransfer(fileUrl(origin));
    REQUIRE(identity.valid());
    REQUIRE(f.events.waitForTerminal());

    REQUIRE(f.events.failures().empty());
    const auto completions = f.events.completions();
    REQUIRE(completions.size() == 1);
    CHECK(completions.front().first == identity);
    CHECK(fs::path(completions.front().second).parent_path() == f.staging);
    CHECK(readFile(completions.front().second) == patternBytes(64 * 1024));

    const auto progress = f.events.progress();
    REQUIRE_FALSE(progress.empty());
    CHECK(progress.back().received == 64 * 1024);
    CHECK(progress.back().expected == 64 * 1024);
    for (std::size_t i = 1; i < progress.size(); ++i) {
        CHECK(progress[i].received >= progress[i - 1].received);
    }

    REQUIRE(waitUntil([&]() { return f.transport.liveTransfers().empty(); }));
}

TEST_CASE("a resumed transfer continues from the token offset", "[curl]") {
    TransportFixture f;
    const std::size_t size = 32 * 1024;
    const std::size_t offset = 10000;
    const auto origin = f.source(size);

    const auto partial = f.staging / "earlier.part";
    writeFile(partial, patternBytes(size).substr(0, offset));

    CurlResumeState state;
    state.url = fileUrl(origin);
    state.partial_path = partial.string();
    state.offset = offset;
    state.total = size;

    f.transport.issueResumedTransfer(CurlTransport::encodeToken(state));
    REQUIRE(f.events.waitForTerminal());

    REQUIRE(f.events.failures().empty());
    const auto completions = f.events.completions();
    REQUIRE(completions.size() == 1);
    CHECK(completions.front().second == partial.string());
    CHECK(readFile(partial) == patternBytes(size));

    for (const auto& update : f.events.progress()) {
        CHECK(update.received >= offset);
    }
    CHECK(f.events.progress().back().received == size);
}

TEST_CASE("a token that already covers the payload completes at once", "[curl]") {
    TransportFixture f;
    const auto partial = f.staging / "whole.part";
    writeFile(partial, patternBytes(500));

    CurlResumeState state;
    state.url = fileUrl(f.tmp.path() / "gone.bin");
    state.partial_path = partial.string();
    state.offset = 500;
    state.total = 500;

    f.transport.issueResumedTransfer(CurlTransport::encodeToken(state));
    REQUIRE(f.events.waitForTerminal());
    REQUIRE(f.events.completions().size() == 1);
    CHECK(readFile(partial) == patternBytes(500));
}

TEST_CASE("unusable resume data fails without a token", "[curl]") {
    TransportFixture f;
    const auto identity = f.transport.issueResumedTransfer(ResumeToken{"not a token"});
    REQUIRE(f.events.waitForTerminal());

    const auto failures = f.events.failures();
    REQUIRE(failures.size() == 1);
    CHECK(failures.front().first == identity);
    CHECK(failures.front().second.code == CURLE_BAD_DOWNLOAD_RESUME);
    CHECK_FALSE(failures.front().second.resume_token);
    CHECK_FALSE(failures.front().second.cancelled);
}

TEST_CASE("a missing source fails without a token and leaves no partial file", "[curl]") {
    TransportFixture f;
    f.transport.issueNewTransfer(fileUrl(f.tmp.path() / "absent.bin"));
    REQUIRE(f.events.waitForTerminal());

    const auto failures = f.events.failures();
    REQUIRE(failures.size() == 1);
    CHECK_FALSE(failures.front().second.resume_token);
    CHECK_FALSE(failures.front().second.cancelled);
    CHECK_FALSE(failures.front().second.message.empty());
    CHECK(f.events.completions().empty());
    CHECK(fs::is_empty(f.staging));
}

TEST_CASE("cancel with a token describes the bytes on disk", "[curl]") {
    TransportFixture f;
    const auto origin = f.source(4096);
    const auto identity = f.transport.issueNewTransfer(fileUrl(origin));
    REQUIRE(f.events.waitForTerminal());

    const auto token = f.transport.cancel(identity, true);
    REQUIRE(token);
    const auto state = CurlTransport::decodeToken(*token);
    REQUIRE(state);
    CHECK(state->url == fileUrl(origin));
    CHECK(state->offset == 4096);
    CHECK(fs::file_size(state->partial_path) == 4096);

    SECTION("cancelling again is a no-op") {
        CHECK_FALSE(f.transport.cancel(identity, true));
    }
    SECTION("discard removes the partial file") {
        f.transport.discard(*token);
        CHECK_FALSE(fs::exists(state->partial_path));
    }
    SECTION("the token finishes without reading the source again") {
        fs::remove(origin);
        f.transport.issueResumedTransfer(*token);
        REQUIRE(f.events.waitForTerminal(2));
        CHECK(f.events.failures().empty());
        REQUIRE(f.events.completions().size() == 2);
        CHECK(readFile(f.events.completions().back().second) == patternBytes(4096));
    }
}

TEST_CASE("cancel without a token removes the partial file", "[curl]") {
    TransportFixture f;
    const auto origin = f.source(4096);
    const auto identity = f.transport.issueNewTransfer(fileUrl(origin));
    REQUIRE(f.events.waitForTerminal());

    CHECK_FALSE(f.transport.cancel(identity, false));
    CHECK(fs::is_empty(f.staging));
}

TEST_CASE("discard never touches files outside the staging directory", "[curl]") {
    TransportFixture f;
    const auto outside = f.tmp.path() / "keep.bin";
    writeFile(outside, "precious");

    CurlResumeState state;
    state.url = "file:///dev/null";
    state.partial_path = outside.string();
    state.offset = 8;
    f.transport.discard(CurlTransport::encodeToken(state));
    CHECK(readFile(outside) == "precious");

    f.transport.discard(ResumeToken{"garbage"});
}

TEST_CASE("resume tokens reject malformed text", "[curl]") {
    CHECK_FALSE(CurlTransport::decodeToken(ResumeToken{}));
    CHECK_FALSE(CurlTransport::decodeToken(ResumeToken{"offset=10\n"}));
    CHECK_FALSE(CurlTransport::decodeToken(ResumeToken{"resumedl-resume 1\nurl=http://x/a\n"}));
    CHECK_FALSE(CurlTransport::decodeToken(
        ResumeToken{"resumedl-resume 1\nurl=http://x/a\npartial=/tmp/a\noffset=-4\n"}));

    CurlResumeState state;
    state.url = "http://x/a";
    state.partial_path = "/tmp/a.part";
    state.offset = 12;
    state.total = 40;
    state.etag = "\"abc\"";
    const auto decoded = CurlTransport::decodeToken(CurlTransport::encodeToken(state));
    REQUIRE(decoded);
    CHECK(decoded->offset == 12);
    CHECK(decoded->total == 40);
    CHECK(decoded->etag == "\"abc\"");
    CHECK(decoded->last_modified.empty());
}
