/**
 * @file test_hashers.cpp
 * @brief Tests for the seeded hash families
 *
 * Covers determinism, seed sensitivity, range reduction and a coarse
 * distribution check on the endpoint draws.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <perfdict/hashers.hpp>
#include <algorithm>
#include <random>
#include <string>
#include <unordered_set>
#include <vector>

using namespace perfdict;

namespace {

std::vector<std::string> make_keys(size_t n) {
    std::vector<std::string> keys;
    keys.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        keys.push_back("key_" + std::to_string(i));
    }
    return keys;
}

template<typename Family>
void check_family_basics() {
    Family f;

    SECTION("Deterministic for a fixed seed") {
        REQUIRE(f.hash64("hello", 7) == f.hash64("hello", 7));
        REQUIRE(f.vertices("hello", 7, 1000) == f.vertices("hello", 7, 1000));
    }

    SECTION("Seed changes the draw") {
        size_t differing = 0;
        for (const auto& k : make_keys(100)) {
            if (!(f.vertices(k, 1, 1u << 20) == f.vertices(k, 2, 1u << 20))) ++differing;
        }
        REQUIRE(differing > 95);
    }

    SECTION("Endpoints stay in range") {
        auto range = GENERATE(2u, 3u, 17u, 1000u, 1u << 31);
        for (const auto& k : make_keys(500)) {
            auto p = f.vertices(k, 3, range);
            REQUIRE(p.first < range);
            REQUIRE(p.second < range);
        }
    }

    SECTION("Empty key is hashable") {
        auto p = f.vertices("", 0, 10);
        REQUIRE(p.first < 10);
        REQUIRE(p.second < 10);
    }
}

} // namespace

TEST_CASE("split_hash_family basics", "[hashers]") {
    check_family_basics<split_hash_family>();
}

TEST_CASE("dual_hash_family basics", "[hashers]") {
    check_family_basics<dual_hash_family>();
}

TEST_CASE("Families are distinguished by id", "[hashers]") {
    STATIC_REQUIRE(split_hash_family::family_id != dual_hash_family::family_id);
    STATIC_REQUIRE(std::is_same_v<default_family, split_hash_family>);
}

TEST_CASE("hash64 is usable at compile time", "[hashers]") {
    constexpr auto h = split_hash_family{}.hash64("abc", 1);
    STATIC_REQUIRE(h.value == detail::hash_with_seed("abc", 1));
}

TEST_CASE("Distinct keys rarely collide in 64 bits", "[hashers]") {
    split_hash_family f;
    std::unordered_set<uint64_t> seen;
    for (const auto& k : make_keys(10000)) {
        seen.insert(f.hash64(k, 0).value);
    }
    REQUIRE(seen.size() == 10000);
}

TEST_CASE("reduce maps uniformly onto the range", "[hashers]") {
    REQUIRE(detail::reduce(0, 10) == 0);
    REQUIRE(detail::reduce(0xFFFFFFFFu, 10) == 9);
    REQUIRE(detail::reduce(0x80000000u, 10) == 5);
}

TEST_CASE("Endpoint draws are roughly uniform", "[hashers]") {
    constexpr uint64_t buckets = 16;
    constexpr size_t n = 16000;
    std::vector<size_t> first(buckets, 0), second(buckets, 0);

    split_hash_family f;
    for (const auto& k : make_keys(n)) {
        auto p = f.vertices(k, 11, buckets);
        ++first[p.first];
        ++second[p.second];
    }

    // Expected 1000 per bucket; allow a wide margin
    for (size_t b = 0; b < buckets; ++b) {
        REQUIRE(first[b] > 800);
        REQUIRE(first[b] < 1200);
        REQUIRE(second[b] > 800);
        REQUIRE(second[b] < 1200);
    }
}

TEST_CASE("Self-loops occur at about 1/m", "[hashers]") {
    constexpr uint64_t m = 100;
    constexpr size_t n = 20000;
    size_t loops = 0;

    split_hash_family f;
    for (const auto& k : make_keys(n)) {
        auto p = f.vertices(k, 5, m);
        if (p.first == p.second) ++loops;
    }

    // Expected 200
    REQUIRE(loops > 120);
    REQUIRE(loops < 300);
}
