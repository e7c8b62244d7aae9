/**
 * @file core.hpp
 * @brief Core types for perfdict - strong types, errors and concepts
 *
 * Everything else in the library builds on the vocabulary defined here.
 */

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <limits>
#include <string_view>
#include <type_traits>

namespace perfdict {

// ===== STRONG TYPES =====

/**
 * @struct slot_index
 * @brief Position in the dense value array, always in [0, n) for member keys
 */
struct slot_index {
    uint64_t value;

    explicit constexpr slot_index(uint64_t v) noexcept : value(v) {}
    explicit constexpr operator uint64_t() const noexcept { return value; }

    constexpr bool operator==(const slot_index&) const noexcept = default;
};

/**
 * @struct slot_count
 * @brief Number of slots (n for the value array)
 */
struct slot_count {
    uint64_t value;

    explicit constexpr slot_count(uint64_t v) noexcept : value(v) {}
    constexpr bool operator==(const slot_count&) const noexcept = default;
};

/**
 * @struct hash_value
 * @brief Raw 64-bit output of a seeded hash
 */
struct hash_value {
    uint64_t value;

    explicit constexpr hash_value(uint64_t v) noexcept : value(v) {}
    constexpr bool operator==(const hash_value&) const noexcept = default;
};

// Vertex ids of the construction graph. 32 bits bound n to 2^31 keys.
using vertex_id = uint32_t;

/**
 * @struct vertex_pair
 * @brief The two endpoints a key maps to for one seed
 */
struct vertex_pair {
    vertex_id first;
    vertex_id second;

    constexpr bool operator==(const vertex_pair&) const noexcept = default;
};

// Largest key set accepted by a builder
inline constexpr uint64_t max_key_count = uint64_t{1} << 31;

// ===== ERROR HANDLING =====

/**
 * @enum error
 * @brief Every failure the library reports
 */
enum class error {
    success,
    duplicate_key,           // Build input repeats a key
    construction_exhausted,  // No seed within the retry budget gave an acyclic graph
    missing_key,             // Fingerprint rejected the key
    invalid_config,          // Load factor, fingerprint width or budget out of range
    too_many_keys,           // More than max_key_count keys
    size_mismatch,           // Key and value sequences differ in length
    invalid_format,          // Blob is truncated or not ours
    io_error                 // File could not be read or written
};

template<typename T>
using result = std::expected<T, error>;

using status = std::expected<void, error>;

[[nodiscard]] constexpr std::string_view error_message(error e) noexcept {
    switch (e) {
        case error::success:                return "success";
        case error::duplicate_key:          return "duplicate key in build input";
        case error::construction_exhausted: return "no seed produced an acyclic graph; retry with a larger load factor";
        case error::missing_key:            return "key not in the build set";
        case error::invalid_config:         return "invalid configuration";
        case error::too_many_keys:          return "too many keys";
        case error::size_mismatch:          return "key and value counts differ";
        case error::invalid_format:         return "invalid serialized format";
        case error::io_error:               return "I/O error";
    }
    return "unknown error";
}

// ===== KEYS =====

/**
 * @brief View the object representation of a trivially copyable value as a key
 *
 * The returned view aliases @p v and must not outlive it.
 */
template<typename T>
    requires std::is_trivially_copyable_v<T> && (!std::is_convertible_v<const T&, std::string_view>)
[[nodiscard]] std::string_view as_key(const T& v) noexcept {
    return {reinterpret_cast<const char*>(&v), sizeof(T)};
}

// ===== CONCEPTS =====

/**
 * @concept seeded_hash_family
 * @brief A family of hash functions indexed by a seed
 *
 * hash64 is one seeded draw; vertices gives the two per-key endpoints in
 * [0, range), which must behave as independent draws for a fixed seed.
 */
template<typename F>
concept seeded_hash_family = std::copyable<F> &&
    requires(const F f, std::string_view key, uint64_t seed, uint64_t range) {
        { f.hash64(key, seed) } -> std::same_as<hash_value>;
        { f.vertices(key, seed, range) } -> std::same_as<vertex_pair>;
        { F::family_id } -> std::convertible_to<uint32_t>;
    };

} // namespace perfdict
