/**
 * @file test_core.cpp
 * @brief Tests for perfdict core types, errors and key helpers
 */

#include <catch2/catch_test_macros.hpp>

#include <perfdict/core.hpp>
#include <perfdict/hashers.hpp>
#include <cstring>
#include <set>
#include <string>
#include <type_traits>

using namespace perfdict;

// ===== STRONG TYPES TESTS =====

TEST_CASE("slot_index behavior", "[core][strong_types]") {
    SECTION("Construction and conversion") {
        slot_index idx{42};
        REQUIRE(idx.value == 42);
        REQUIRE(static_cast<uint64_t>(idx) == 42);
    }

    SECTION("Explicit construction only") {
        STATIC_REQUIRE_FALSE(std::is_convertible_v<uint64_t, slot_index>);
        STATIC_REQUIRE(std::is_constructible_v<slot_index, uint64_t>);
    }

    SECTION("Equality") {
        REQUIRE(slot_index{10} == slot_index{10});
        REQUIRE_FALSE(slot_index{10} == slot_index{20});
    }
}

TEST_CASE("slot_count and hash_value are distinct types", "[core][strong_types]") {
    STATIC_REQUIRE_FALSE(std::is_convertible_v<slot_count, slot_index>);
    STATIC_REQUIRE_FALSE(std::is_convertible_v<hash_value, slot_index>);
    STATIC_REQUIRE_FALSE(std::is_convertible_v<uint64_t, hash_value>);

    REQUIRE(slot_count{7} == slot_count{7});
    REQUIRE(hash_value{0}.value == 0);
}

TEST_CASE("vertex_pair equality is ordered", "[core]") {
    REQUIRE(vertex_pair{1, 2} == vertex_pair{1, 2});
    REQUIRE_FALSE(vertex_pair{1, 2} == vertex_pair{2, 1});
}

// ===== ERROR TESTS =====

TEST_CASE("Every error has a distinct message", "[core][error]") {
    const error all[] = {
        error::success, error::duplicate_key, error::construction_exhausted,
        error::missing_key, error::invalid_config, error::too_many_keys,
        error::size_mismatch, error::invalid_format, error::io_error
    };

    std::set<std::string_view> messages;
    for (auto e : all) {
        auto msg = error_message(e);
        REQUIRE_FALSE(msg.empty());
        messages.insert(msg);
    }
    REQUIRE(messages.size() == std::size(all));
}

TEST_CASE("error_message is usable at compile time", "[core][error]") {
    constexpr auto msg = error_message(error::duplicate_key);
    STATIC_REQUIRE(!msg.empty());
}

TEST_CASE("result carries either a value or an error", "[core][error]") {
    result<int> ok{5};
    result<int> bad{std::unexpected(error::missing_key)};

    REQUIRE(ok);
    REQUIRE(*ok == 5);
    REQUIRE_FALSE(bad);
    REQUIRE(bad.error() == error::missing_key);

    status s{};
    REQUIRE(s);
}

// ===== KEY TESTS =====

TEST_CASE("as_key views the object representation", "[core][keys]") {
    uint64_t x = 0x0102030405060708ULL;
    auto k = as_key(x);

    REQUIRE(k.size() == sizeof(x));
    REQUIRE(std::memcmp(k.data(), &x, sizeof(x)) == 0);

    SECTION("Equal values give equal keys") {
        uint64_t y = x;
        REQUIRE(as_key(y) == k);
    }

    SECTION("Different values give different keys") {
        uint64_t z = x + 1;
        REQUIRE(as_key(z) != k);
    }
}

TEST_CASE("max_key_count bounds vertex ids", "[core]") {
    STATIC_REQUIRE(max_key_count == (uint64_t{1} << 31));
    STATIC_REQUIRE(sizeof(vertex_id) == 4);
}

// ===== CONCEPT TESTS =====

struct not_a_family {
    uint64_t hash64(std::string_view) const { return 0; }
};

TEST_CASE("seeded_hash_family concept", "[core][concepts]") {
    STATIC_REQUIRE(seeded_hash_family<split_hash_family>);
    STATIC_REQUIRE(seeded_hash_family<dual_hash_family>);
    STATIC_REQUIRE_FALSE(seeded_hash_family<not_a_family>);
    STATIC_REQUIRE_FALSE(seeded_hash_family<int>);
}
