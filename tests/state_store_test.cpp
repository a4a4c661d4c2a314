#include <catch2/catch.hpp>

#include "resumedl/state_store.hpp"
#include "test_helpers.hpp"

#include <memory>
#include <stdexcept>

using namespace resumedl;
using resumedl::test::TempDir;

TEST_CASE("FileStateStore reads back what it wrote", "[state_store]") {
    TempDir tmp;
    FileStateStore store(tmp.path() / "state");

    CHECK_FALSE(store.read("resume_token"));

    store.write("resume_token", std::string("a\0b\nc", 5));
    const auto value = store.read("resume_token");
    REQUIRE(value);
    CHECK(*value == std::string("a\0b\nc", 5));

    store.write("resume_token", "second");
    CHECK(store.read("resume_token").value() == "second");

    store.remove("resume_token");
    CHECK_FALSE(store.read("resume_token"));
    store.remove("resume_token");
}

TEST_CASE("FileStateStore survives being reopened", "[state_store]") {
    TempDir tmp;
    {
        FileStateStore store(tmp.path() / "state");
        store.write("source_url", "http://x/file.bin");
    }
    FileStateStore reopened(tmp.path() / "state");
    CHECK(reopened.read("source_url").value() == "http://x/file.bin");
}

TEST_CASE("FileStateStore refuses keys that are not plain names", "[state_store]") {
    TempDir tmp;
    FileStateStore store(tmp.path());
    CHECK_THROWS_AS(store.write("../escape", "x"), std::invalid_argument);
    CHECK_THROWS_AS(store.read(""), std::invalid_argument);
    CHECK_THROWS_AS(store.remove(".hidden"), std::invalid_argument);
}

TEST_CASE("ResumeRecordStore keeps URL, token and offsets together", "[state_store]") {
    TempDir tmp;
    auto store = std::make_shared<FileStateStore>(tmp.path());
    ResumeRecordStore records(store);

    CHECK_FALSE(records.load());

    PersistedRecord record;
    record.source_url = "http://x/file.bin";
    record.resume_token = ResumeToken{"opaque"};
    record.downloaded_bytes = 50;
    record.total_bytes = 100;
    records.save(record);

    ResumeRecordStore reloaded(std::make_shared<FileStateStore>(tmp.path()));
    const auto loaded = reloaded.load();
    REQUIRE(loaded);
    CHECK(loaded->source_url == "http://x/file.bin");
    REQUIRE(loaded->resume_token);
    CHECK(loaded->resume_token->bytes == "opaque");
    CHECK(loaded->downloaded_bytes == 50);
    CHECK(loaded->total_bytes == 100);

    reloaded.purge();
    CHECK_FALSE(records.load());
}

TEST_CASE("ResumeRecordStore without a token reports no offsets", "[state_store]") {
    TempDir tmp;
    auto store = std::make_shared<FileStateStore>(tmp.path());
    ResumeRecordStore records(store);

    records.rememberSource("http://x/file.bin");
    store->write(ResumeRecordStore::kDownloadedBytesKey, "12");

    const auto loaded = records.load();
    REQUIRE(loaded);
    CHECK_FALSE(loaded->resume_token);
    CHECK(loaded->downloaded_bytes == 0);
}

TEST_CASE("ResumeRecordStore tolerates garbage counts", "[state_store]") {
    TempDir tmp;
    auto store = std::make_shared<FileStateStore>(tmp.path());
    ResumeRecordStore records(store);

    store->write(ResumeRecordStore::kSourceUrlKey, "http://x/file.bin");
    store->write(ResumeRecordStore::kResumeTokenKey, "opaque");
    store->write(ResumeRecordStore::kDownloadedBytesKey, "not-a-number");

    const auto loaded = records.load();
    REQUIRE(loaded);
    CHECK(loaded->resume_token);
    CHECK(loaded->downloaded_bytes == 0);
}
