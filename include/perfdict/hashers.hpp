/**
 * @file hashers.hpp
 * @brief Seeded hash families - the two per-key draws the graph is built from
 *
 * Each family models seeded_hash_family. The builder, solver and evaluator
 * only ever see the concept, so families can be swapped freely.
 */

#pragma once

#include "core.hpp"
#include <string_view>

namespace perfdict {

namespace detail {

inline constexpr uint64_t fnv_offset_basis = 14695981039346656037ULL;
inline constexpr uint64_t fnv_prime = 1099511628211ULL;
inline constexpr uint64_t golden_gamma = 0x9e3779b97f4a7c15ULL;

// splitmix64 finalizer
[[nodiscard]] constexpr uint64_t remix(uint64_t z) noexcept {
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

// FNV-1a over the key bytes starting from a seed-derived basis, then remixed
[[nodiscard]] constexpr uint64_t hash_with_seed(std::string_view key, uint64_t seed) noexcept {
    uint64_t h = fnv_offset_basis ^ remix(seed + golden_gamma);
    for (unsigned char c : key) {
        h ^= c;
        h *= fnv_prime;
    }
    return remix(h ^ key.size());
}

// Map a 32-bit draw onto [0, range) without division. range <= 2^32.
[[nodiscard]] constexpr vertex_id reduce(uint32_t h, uint64_t range) noexcept {
    return static_cast<vertex_id>((static_cast<uint64_t>(h) * range) >> 32);
}

} // namespace detail

// ===== HASH FAMILIES =====

/**
 * @class split_hash_family
 * @brief One seeded 64-bit hash sliced into two 32-bit endpoint draws
 *
 * Cheapest option: a single pass over the key per lookup. The low and high
 * halves of a well-mixed 64-bit value are independent enough for graph
 * construction.
 */
class split_hash_family {
public:
    static constexpr uint32_t family_id = 1;

    [[nodiscard]] constexpr hash_value hash64(std::string_view key, uint64_t seed) const noexcept {
        return hash_value{detail::hash_with_seed(key, seed)};
    }

    [[nodiscard]] constexpr vertex_pair vertices(std::string_view key, uint64_t seed, uint64_t range) const noexcept {
        uint64_t h = detail::hash_with_seed(key, seed);
        return vertex_pair{
            detail::reduce(static_cast<uint32_t>(h), range),
            detail::reduce(static_cast<uint32_t>(h >> 32), range)
        };
    }
};

/**
 * @class dual_hash_family
 * @brief Two full passes of the same mixing function at different seed offsets
 *
 * Each endpoint gets its own 64-bit hash, so a collision of one draw says
 * nothing about the other. Costs a second pass over the key.
 */
class dual_hash_family {
    static constexpr uint64_t second_offset = 0xCAFEBABE12345678ULL;

public:
    static constexpr uint32_t family_id = 2;

    [[nodiscard]] constexpr hash_value hash64(std::string_view key, uint64_t seed) const noexcept {
        return hash_value{detail::hash_with_seed(key, seed)};
    }

    [[nodiscard]] constexpr vertex_pair vertices(std::string_view key, uint64_t seed, uint64_t range) const noexcept {
        uint64_t a = detail::hash_with_seed(key, seed);
        uint64_t b = detail::hash_with_seed(key, seed ^ second_offset);
        return vertex_pair{
            detail::reduce(static_cast<uint32_t>(a >> 32), range),
            detail::reduce(static_cast<uint32_t>(b >> 32), range)
        };
    }
};

using default_family = split_hash_family;

static_assert(seeded_hash_family<split_hash_family>);
static_assert(seeded_hash_family<dual_hash_family>);

} // namespace perfdict
