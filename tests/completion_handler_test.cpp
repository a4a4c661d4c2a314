#include <catch2/catch.hpp>

#include "resumedl/completion_handler.hpp"
#include "test_helpers.hpp"

#include <filesystem>

using namespace resumedl;
using resumedl::test::readFile;
using resumedl::test::TempDir;
using resumedl::test::writeFile;

namespace fs = std::filesystem;

TEST_CASE("finalize moves the payload under the URL's name", "[completion]") {
    TempDir tmp;
    const auto payload = tmp.path() / "staging" / "transfer-1.part";
    writeFile(payload, "payload");

    CompletionHandler handler(tmp.path() / "downloads" / "nested");
    const auto saved = handler.finalize(payload, "http://x/file.bin");

    REQUIRE(saved);
    CHECK(*saved == tmp.path() / "downloads" / "nested" / "file.bin");
    CHECK(readFile(*saved) == "payload");
    CHECK_FALSE(fs::exists(payload));
}

TEST_CASE("finalize replaces an older file of the same name", "[completion]") {
    TempDir tmp;
    const auto payload = tmp.path() / "new.part";
    writeFile(payload, "new contents");
    writeFile(tmp.path() / "downloads" / "file.dat", "old contents that are longer");

    CompletionHandler handler(tmp.path() / "downloads");
    const auto saved = handler.finalize(payload, "http://x/");

    REQUIRE(saved);
    CHECK(saved->filename() == "file.dat");
    CHECK(readFile(*saved) == "new contents");
}

TEST_CASE("finalize reports a failed move without throwing", "[completion]") {
    TempDir tmp;
    CompletionHandler handler(tmp.path() / "downloads");
    std::optional<fs::path> saved;
    REQUIRE_NOTHROW(saved = handler.finalize(tmp.path() / "missing.part", "http://x/file.bin"));
    CHECK_FALSE(saved);
    CHECK_FALSE(fs::exists(tmp.path() / "downloads" / "file.bin"));
}
