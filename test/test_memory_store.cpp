#include <certchain/storage/memory_store.hpp>
#include <doctest/doctest.h>
#include <string>

using namespace certchain;
using namespace certchain::storage;

namespace {
    dp::ByteBuf bytes(const std::string &text) { return dp::ByteBuf(text.begin(), text.end()); }
    std::string text(const dp::ByteBuf &buf) { return std::string(buf.begin(), buf.end()); }
} // namespace

TEST_SUITE("Memory Store Tests") {
    TEST_CASE("Put then get") {
        MemoryStore store;
        REQUIRE(store.put("institutions", "inst-1", bytes("acme")).is_ok());

        auto got = store.get("institutions", "inst-1");
        REQUIRE(got.is_ok());
        CHECK(text(got.value()) == "acme");
    }

    TEST_CASE("Missing documents report not found") {
        MemoryStore store;
        auto missing = store.get("certificates", "0xnope");
        CHECK(missing.is_err());
        CHECK(missing.error().code == ERR_DOCUMENT_NOT_FOUND);
        CHECK(isNotFound(missing.error()));

        auto present = store.contains("certificates", "0xnope");
        REQUIRE(present.is_ok());
        CHECK_FALSE(present.value());
    }

    TEST_CASE("Overwrite keeps first-insertion order") {
        MemoryStore store;
        REQUIRE(store.put("c", "a", bytes("1")).is_ok());
        REQUIRE(store.put("c", "b", bytes("2")).is_ok());
        REQUIRE(store.put("c", "a", bytes("3")).is_ok());

        auto all = store.listAll("c");
        REQUIRE(all.is_ok());
        REQUIRE(all.value().size() == 2);
        CHECK(text(all.value()[0]) == "3");
        CHECK(text(all.value()[1]) == "2");
        CHECK(store.size("c") == 2);
    }

    TEST_CASE("Collections are independent") {
        MemoryStore store;
        REQUIRE(store.put("institutions", "k", bytes("inst")).is_ok());
        REQUIRE(store.put("certificates", "k", bytes("cert")).is_ok());

        CHECK(text(store.get("institutions", "k").value()) == "inst");
        CHECK(text(store.get("certificates", "k").value()) == "cert");
        CHECK(store.listAll("empty").value().empty());
    }
}
