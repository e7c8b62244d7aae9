/**
 * @file test_properties.cpp
 * @brief Property-based tests - invariants that must hold for any key set
 *
 * Key sets are drawn from fixed-seed generators so failures reproduce:
 * - Slots of build keys form a permutation of [0, n)
 * - Build keys always read back their own value
 * - Same keys and config give the same container
 * - Writes never change the size
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <perfdict/perfdict.hpp>
#include <algorithm>
#include <cmath>
#include <random>
#include <string>
#include <unordered_set>
#include <vector>

using namespace perfdict;

// ===== PROPERTY GENERATORS =====

// Distinct random strings of varying length, including some binary bytes
std::vector<std::string> generate_random_keys(size_t n, uint64_t seed) {
    std::mt19937_64 rng{seed};
    std::uniform_int_distribution<size_t> len_dist{0, 24};
    std::uniform_int_distribution<int> byte_dist{0, 255};

    std::unordered_set<std::string> seen;
    std::vector<std::string> keys;
    keys.reserve(n);
    while (keys.size() < n) {
        std::string k(len_dist(rng), '\0');
        for (auto& c : k) c = static_cast<char>(byte_dist(rng));
        if (seen.insert(k).second) {
            keys.push_back(std::move(k));
        }
    }
    return keys;
}

// ===== MPHF PROPERTIES =====

TEST_CASE("Property: slots of build keys are a permutation", "[properties]") {
    auto seed = GENERATE(1ull, 2ull, 3ull, 4ull, 5ull);
    auto n = GENERATE(1u, 7u, 64u, 999u, 4096u);
    auto keys = generate_random_keys(n, seed * 1000 + n);

    auto h = make_mphf(std::span<const std::string>{keys}, build_options{.seed = seed});
    REQUIRE(h);

    std::vector<uint64_t> slots;
    for (const auto& k : keys) slots.push_back(h->slot(k).value);
    std::sort(slots.begin(), slots.end());
    for (size_t i = 0; i < slots.size(); ++i) {
        REQUIRE(slots[i] == i);
    }
}

TEST_CASE("Property: vertex count is ceil(c * n)", "[properties]") {
    auto c = GENERATE(2.2, 2.5, 3.0, 4.0);
    auto keys = generate_random_keys(1000, 17);

    build_options options;
    options.load_factor = c;
    options.max_attempts = 200;
    auto h = make_mphf(std::span<const std::string>{keys}, options);
    REQUIRE(h);
    REQUIRE(h->vertex_count() == static_cast<uint64_t>(std::ceil(c * 1000)));
}

TEST_CASE("Property: construction is idempotent", "[properties]") {
    auto seed = GENERATE(0ull, 99ull, 123456789ull);
    auto keys = generate_random_keys(3000, seed);

    std::vector<std::pair<std::string, size_t>> pairs;
    for (size_t i = 0; i < keys.size(); ++i) pairs.emplace_back(keys[i], i);

    perfect_map_config cfg;
    cfg.seed = seed;
    auto a = perfect_map<size_t>::build(pairs, cfg);
    auto b = perfect_map<size_t>::build(pairs, cfg);
    REQUIRE(a);
    REQUIRE(b);
    REQUIRE(*a == *b);
    REQUIRE(a->serialize() == b->serialize());
}

TEST_CASE("Property: input order does not affect lookups", "[properties]") {
    auto keys = generate_random_keys(2000, 8);
    std::vector<std::pair<std::string, size_t>> pairs;
    for (size_t i = 0; i < keys.size(); ++i) pairs.emplace_back(keys[i], i);

    auto shuffled = pairs;
    std::mt19937_64 rng{8};
    std::shuffle(shuffled.begin(), shuffled.end(), rng);

    auto a = perfect_map<size_t>::build(pairs);
    auto b = perfect_map<size_t>::build(shuffled);
    REQUIRE(a);
    REQUIRE(b);
    for (const auto& [k, v] : pairs) {
        REQUIRE(a->get(k) == v);
        REQUIRE(b->get(k) == v);
    }
}

// ===== CONTAINER PROPERTIES =====

TEST_CASE("Property: every build key reads back its value", "[properties]") {
    auto seed = GENERATE(11ull, 22ull, 33ull);
    auto bits = GENERATE(0u, 4u, 16u);
    auto keys = generate_random_keys(2500, seed);

    std::vector<std::pair<std::string, uint32_t>> pairs;
    std::mt19937_64 rng{seed};
    for (const auto& k : keys) pairs.emplace_back(k, static_cast<uint32_t>(rng()));

    perfect_map_config cfg;
    cfg.fingerprint_bits = bits;
    auto m = perfect_map<uint32_t>::build(pairs, cfg);
    REQUIRE(m);
    REQUIRE(m->size() == pairs.size());
    for (const auto& [k, v] : pairs) {
        REQUIRE(m->contains(k));
        REQUIRE(m->get(k) == v);
    }
}

TEST_CASE("Property: random writes keep size and land on the right key", "[properties]") {
    auto keys = generate_random_keys(1000, 5);
    std::vector<std::pair<std::string, int>> pairs;
    for (const auto& k : keys) pairs.emplace_back(k, 0);

    auto m = perfect_map<int>::build(pairs);
    REQUIRE(m);

    std::vector<int> model(keys.size(), 0);
    std::mt19937_64 rng{5};
    for (int step = 0; step < 5000; ++step) {
        size_t i = rng() % keys.size();
        int v = static_cast<int>(rng() % 100000);
        m->set(keys[i], v);
        model[i] = v;
    }

    REQUIRE(m->size() == keys.size());
    for (size_t i = 0; i < keys.size(); ++i) {
        REQUIRE(m->get(keys[i]) == model[i]);
    }
}

TEST_CASE("Property: false positive rate tracks fingerprint width", "[properties]") {
    auto bits = GENERATE(2u, 4u, 6u);
    auto keys = generate_random_keys(4000, 77);
    std::vector<std::pair<std::string, int>> pairs;
    for (const auto& k : keys) pairs.emplace_back(k, 1);

    perfect_map_config cfg;
    cfg.fingerprint_bits = bits;
    auto m = perfect_map<int>::build(pairs, cfg);
    REQUIRE(m);

    std::unordered_set<std::string> members(keys.begin(), keys.end());
    constexpr size_t probes = 20000;
    size_t accepted = 0;
    size_t tried = 0;
    for (const auto& k : generate_random_keys(probes + 4000, 78)) {
        if (members.count(k)) continue;
        if (++tried > probes) break;
        if (m->contains(k)) ++accepted;
    }

    const double expected = probes * std::ldexp(1.0, -static_cast<int>(bits));
    REQUIRE(accepted > expected * 0.7);
    REQUIRE(accepted < expected * 1.3);
}
