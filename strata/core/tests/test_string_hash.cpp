#include <catch2/catch_test_macros.hpp>
#include <strata/core/string_hash.hpp>

using namespace strata::core;

TEST_CASE("hash_string is deterministic", "[core][hash]") {
    REQUIRE(hash_string("button") == hash_string("button"));
    REQUIRE(hash_string("button") != hash_string("Button"));
    REQUIRE(hash_string("") == detail::FNV_OFFSET_BASIS);

    static_assert(hash_string("abc") == detail::fnv1a_hash("abc", 3));
}

TEST_CASE("SequentialHash is order sensitive", "[core][hash]") {
    SECTION("Swapping values changes the result") {
        auto a = SequentialHash().add(uint64_t{1}).add(uint64_t{2}).value();
        auto b = SequentialHash().add(uint64_t{2}).add(uint64_t{1}).value();
        REQUIRE(a != b);
    }

    SECTION("Same sequence gives the same result") {
        auto a = SequentialHash(7).add("row").add(uint64_t{3}).value();
        auto b = SequentialHash(7).add("row").add(uint64_t{3}).value();
        REQUIRE(a == b);
    }

    SECTION("Strings are length prefixed") {
        auto a = SequentialHash().add("ab").add("c").value();
        auto b = SequentialHash().add("a").add("bc").value();
        REQUIRE(a != b);
    }

    SECTION("Seed participates") {
        REQUIRE(SequentialHash(1).add("x").value() != SequentialHash(2).add("x").value());
    }
}
