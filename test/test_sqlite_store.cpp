#include <doctest/doctest.h>

#include <certchain/storage/sqlite_store.hpp>
#include <filesystem>

using namespace certchain;
using namespace certchain::storage;

namespace {
    dp::ByteBuf bytes(const std::string &text) { return dp::ByteBuf(text.begin(), text.end()); }
    std::string text(const dp::ByteBuf &buf) { return std::string(buf.begin(), buf.end()); }

    void removeDatabase(const std::string &path) {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
} // namespace

TEST_SUITE("SQLite Store Tests") {
    TEST_CASE("Open in memory") {
        SqliteStore store;
        auto opened = store.open(":memory:");
        REQUIRE(opened.is_ok());
        CHECK(store.isOpen());
        store.close();
        CHECK_FALSE(store.isOpen());
    }

    TEST_CASE("Operations fail when closed") {
        SqliteStore store;
        auto got = store.get("certificates", "0x01");
        CHECK(got.is_err());
        CHECK(got.error().code == ERR_STORE_FAILED);
    }

    TEST_CASE("Upsert keeps first-write order") {
        SqliteStore store;
        REQUIRE(store.open(":memory:").is_ok());

        REQUIRE(store.put("institutions", "a", bytes("1")).is_ok());
        REQUIRE(store.put("institutions", "b", bytes("2")).is_ok());
        REQUIRE(store.put("institutions", "a", bytes("3")).is_ok());
        REQUIRE(store.put("certificates", "a", bytes("cert")).is_ok());

        CHECK(text(store.get("institutions", "a").value()) == "3");
        CHECK(store.count("institutions").value() == 2);

        auto all = store.listAll("institutions");
        REQUIRE(all.is_ok());
        REQUIRE(all.value().size() == 2);
        CHECK(text(all.value()[0]) == "3");
        CHECK(text(all.value()[1]) == "2");

        CHECK(text(store.get("certificates", "a").value()) == "cert");
    }

    TEST_CASE("Missing documents report not found") {
        SqliteStore store;
        REQUIRE(store.open(":memory:").is_ok());

        auto missing = store.get("certificates", "0xnope");
        CHECK(missing.is_err());
        CHECK(missing.error().code == ERR_DOCUMENT_NOT_FOUND);

        auto present = store.contains("certificates", "0xnope");
        REQUIRE(present.is_ok());
        CHECK_FALSE(present.value());
    }

    TEST_CASE("Binary bodies round-trip") {
        SqliteStore store;
        REQUIRE(store.open(":memory:").is_ok());

        dp::ByteBuf body;
        for (int i = 0; i < 256; i++)
            body.push_back(static_cast<dp::u8>(i));
        REQUIRE(store.put("certificates", "0xbin", body).is_ok());

        auto got = store.get("certificates", "0xbin");
        REQUIRE(got.is_ok());
        REQUIRE(got.value().size() == 256);
        CHECK(got.value()[0] == 0);
        CHECK(got.value()[255] == 255);
    }

    TEST_CASE("Records survive reopen") {
        const std::string path = "test_sqlite_reopen.db";
        removeDatabase(path);

        {
            SqliteStore store;
            REQUIRE(store.open(path).is_ok());
            REQUIRE(store.put("certificates", "0x01", bytes("persisted")).is_ok());
        }

        SqliteStore reopened;
        REQUIRE(reopened.open(path).is_ok());
        CHECK(text(reopened.get("certificates", "0x01").value()) == "persisted");
        reopened.close();
        removeDatabase(path);
    }

    TEST_CASE("Opening again switches to the new database") {
        const std::string first = "test_sqlite_switch_a.db";
        const std::string second = "test_sqlite_switch_b.db";
        removeDatabase(first);
        removeDatabase(second);

        SqliteStore store;
        REQUIRE(store.open(first).is_ok());
        REQUIRE(store.put("institutions", "inst-a", bytes("in a")).is_ok());

        REQUIRE(store.open(second).is_ok());
        CHECK(store.isOpen());
        CHECK(store.get("institutions", "inst-a").error().code == ERR_DOCUMENT_NOT_FOUND);
        REQUIRE(store.put("institutions", "inst-b", bytes("in b")).is_ok());

        REQUIRE(store.open(first).is_ok());
        CHECK(text(store.get("institutions", "inst-a").value()) == "in a");
        CHECK_FALSE(store.contains("institutions", "inst-b").value());
        store.close();

        removeDatabase(first);
        removeDatabase(second);
    }
}
