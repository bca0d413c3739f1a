#include <algorithm>
#include <cctype>
#include <certchain/ledger/hasher.hpp>
#include <doctest/doctest.h>

using namespace certchain::ledger;

namespace {
    std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
        return s;
    }
} // namespace

TEST_SUITE("Hasher Tests") {
    TEST_CASE("SHA-256 of known input") {
        auto result = Hasher::hashText("abc");
        REQUIRE(result.is_ok());
        CHECK(lower(result.value()) == "0xba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    }

    TEST_CASE("Hashes are 0x-prefixed and 64 hex digits") {
        auto result = Hasher::hashText("certificate");
        REQUIRE(result.is_ok());
        CHECK(result.value().size() == Hasher::HEX_LENGTH);
        CHECK(Hasher::looksLikeHash(result.value()));
        CHECK_FALSE(Hasher::looksLikeHash("0x1234"));
        CHECK_FALSE(Hasher::looksLikeHash("zz" + result.value().substr(2)));
    }

    TEST_CASE("Hashing is deterministic and order independent") {
        auto a = CanonicalValue::object();
        a.setText("recipient_name", "Ada")
            .setText("course_name", "Systems 101")
            .setText("completion_date", "2024-01-01")
            .setText("institution_id", "inst-1");

        auto b = CanonicalValue::object();
        b.setText("institution_id", "inst-1")
            .setText("completion_date", "2024-01-01")
            .setText("course_name", "Systems 101")
            .setText("recipient_name", "Ada");

        auto hash_a = Hasher::hash(a);
        auto hash_b = Hasher::hash(b);
        REQUIRE(hash_a.is_ok());
        REQUIRE(hash_b.is_ok());
        CHECK(hash_a.value() == hash_b.value());
        CHECK(hash_a.value() == Hasher::hash(a).value());
    }

    TEST_CASE("Different content yields a different hash") {
        auto a = CanonicalValue::object();
        a.setText("recipient_name", "Ada");
        auto b = CanonicalValue::object();
        b.setText("recipient_name", "Grace");

        CHECK(Hasher::hash(a).value() != Hasher::hash(b).value());
    }

    TEST_CASE("Hash of a value equals hash of its serialization") {
        auto value = CanonicalValue::object();
        value.setInteger("block_number", 7).setText("previous_hash", "0x00");
        CHECK(Hasher::hash(value).value() == Hasher::hashText(value.serialize()).value());
    }
}
