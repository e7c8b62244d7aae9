/**
 * @file perfect_map.hpp
 * @brief Fixed key set -> value container backed by a minimal perfect hash
 *
 * The key set is compiled into an MPHF at construction and then discarded.
 * What remains is the hash function, an optional fingerprint table and a
 * value array of exactly n entries in slot order.
 *
 * Sharp edges, all deliberate:
 * - Without fingerprints, get() on a key that was never inserted returns
 *   whatever value owns the slot that key hashes to.
 * - set() never validates: setting an unknown key overwrites the value of
 *   whichever build key owns that slot. Use update() for a checked write.
 * - Iteration yields values only; keys are not recoverable.
 *
 * Thread safety: get/find/contains/iteration only read and may run
 * concurrently. set() writes a single element, so writers to different
 * slots never interfere; writers to the same slot need external locking.
 */

#pragma once

#include "core.hpp"
#include "fingerprint.hpp"
#include "hashers.hpp"
#include "mphf.hpp"
#include "serialization.hpp"
#include <concepts>
#include <initializer_list>
#include <ranges>
#include <span>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace perfdict {

/**
 * @struct perfect_map_config
 * @brief Construction settings, aggregate so designated initializers work
 */
struct perfect_map_config {
    double load_factor{2.5};      // c: vertex space multiplier, > 1
    unsigned fingerprint_bits{16}; // b: 0 disables fingerprinting, at most 32
    uint64_t seed{0};             // First seed tried
    size_t max_attempts{32};      // Seed retry budget
    size_t threads{1};            // Solver threads (OpenMP builds)
};

/**
 * @struct perfect_map_stats
 * @brief Footprint of a built container
 */
struct perfect_map_stats {
    size_t key_count{0};
    uint64_t vertex_count{0};
    unsigned fingerprint_bits{0};
    size_t index_bytes{0};       // Labels plus fingerprints
    size_t value_bytes{0};
    double index_bits_per_key{0.0};
    double false_positive_rate{1.0};
};

template<typename P, typename V>
concept key_value_pair = requires(const P& p) {
    { std::get<0>(p) } -> std::convertible_to<std::string_view>;
    { std::get<1>(p) } -> std::convertible_to<const V&>;
};

template<typename V, seeded_hash_family Family = default_family>
class perfect_map {
    // std::vector<bool> packs bits, so writes to different slots would race
    static_assert(!std::is_same_v<V, bool>, "use uint8_t values instead of bool");

public:
    using value_type = V;
    using config = perfect_map_config;
    using hash_type = minimal_perfect_hash<Family>;
    using fingerprint_type = fingerprint_table<Family>;
    using const_iterator = typename std::vector<V>::const_iterator;

private:
    hash_type hash_;
    fingerprint_type fingerprints_;
    std::vector<V> values_;
    build_stats stats_;

    perfect_map(hash_type hash, fingerprint_type fingerprints, std::vector<V> values, build_stats stats)
        : hash_(std::move(hash))
        , fingerprints_(std::move(fingerprints))
        , values_(std::move(values))
        , stats_(stats) {}

    /**
     * @brief Common construction path
     * @param keys Key i owns by_key[i]
     * @param by_key Values in key order, consumed
     */
    [[nodiscard]] static result<perfect_map> assemble(
        std::span<const std::string_view> keys,
        std::vector<V> by_key,
        const config& cfg,
        build_stats* stats_out) {

        build_stats stats;
        auto finish = [&](auto&& r) {
            if (stats_out) *stats_out = stats;
            return std::forward<decltype(r)>(r);
        };

        if (cfg.fingerprint_bits > fingerprint_type::max_bits) {
            return finish(result<perfect_map>{std::unexpected(error::invalid_config)});
        }

        build_options options{
            .load_factor = cfg.load_factor,
            .seed = cfg.seed,
            .max_attempts = cfg.max_attempts,
            .threads = cfg.threads
        };

        auto built = construct(keys, options, Family{}, stats);
        if (!built) {
            return finish(result<perfect_map>{std::unexpected(built.error())});
        }

        const size_t n = keys.size();
        const auto& ranks = built->ranks;

        fingerprint_type fingerprints{n, cfg.fingerprint_bits, built->hash.seed()};
        for (size_t i = 0; i < n; ++i) {
            fingerprints.assign(slot_index{ranks[i]}, keys[i]);
        }

        // Slot s holds the value of the key ranked s
        std::vector<uint32_t> owner(n);
        for (size_t i = 0; i < n; ++i) {
            owner[ranks[i]] = static_cast<uint32_t>(i);
        }
        std::vector<V> values;
        values.reserve(n);
        for (size_t s = 0; s < n; ++s) {
            values.push_back(std::move(by_key[owner[s]]));
        }

        return finish(result<perfect_map>{perfect_map{
            std::move(built->hash), std::move(fingerprints), std::move(values), stats}});
    }

public:
    perfect_map() = default;

    // ===== CONSTRUCTION =====

    /**
     * @brief Build from a range of (key, value) pairs with distinct keys
     *
     * Keys are read only during the call. Fails with error::duplicate_key,
     * error::construction_exhausted, error::invalid_config or
     * error::too_many_keys; @p stats receives the attempt counters either way.
     */
    template<std::ranges::forward_range R>
        requires key_value_pair<std::ranges::range_value_t<R>, V> &&
                 std::is_lvalue_reference_v<std::ranges::range_reference_t<R>>
    [[nodiscard]] static result<perfect_map> build(
        const R& pairs, const config& cfg = config{}, build_stats* stats = nullptr) {

        std::vector<std::string_view> keys;
        std::vector<V> by_key;
        if constexpr (std::ranges::sized_range<R>) {
            keys.reserve(std::ranges::size(pairs));
            by_key.reserve(std::ranges::size(pairs));
        }
        for (const auto& p : pairs) {
            keys.emplace_back(std::get<0>(p));
            by_key.emplace_back(std::get<1>(p));
        }
        return assemble(keys, std::move(by_key), cfg, stats);
    }

    [[nodiscard]] static result<perfect_map> build(
        std::initializer_list<std::pair<std::string_view, V>> pairs,
        const config& cfg = config{},
        build_stats* stats = nullptr) {
        return build(std::span{pairs.begin(), pairs.size()}, cfg, stats);
    }

    /**
     * @brief Build from parallel key and value sequences
     * @return error::size_mismatch if the lengths differ
     */
    template<std::ranges::forward_range K, std::ranges::input_range Vs>
        requires std::convertible_to<std::ranges::range_reference_t<K>, std::string_view> &&
                 std::is_lvalue_reference_v<std::ranges::range_reference_t<K>> &&
                 std::convertible_to<std::ranges::range_reference_t<Vs>, V>
    [[nodiscard]] static result<perfect_map> build_from(
        const K& keys, Vs&& values, const config& cfg = config{}, build_stats* stats = nullptr) {

        std::vector<std::string_view> key_views;
        for (const auto& k : keys) {
            key_views.emplace_back(k);
        }
        std::vector<V> by_key;
        by_key.reserve(key_views.size());
        for (auto&& v : values) {
            by_key.emplace_back(std::forward<decltype(v)>(v));
        }
        if (by_key.size() != key_views.size()) {
            if (stats) *stats = build_stats{};
            return std::unexpected(error::size_mismatch);
        }
        return assemble(key_views, std::move(by_key), cfg, stats);
    }

    // ===== LOOKUP =====

    /**
     * @brief Slot a key hashes to; meaningful only for build keys
     */
    [[nodiscard]] slot_index slot_for(std::string_view key) const noexcept {
        return hash_.slot(key);
    }

    /**
     * @brief Pointer to the value for key, nullptr if fingerprinting rejects it
     */
    [[nodiscard]] const V* find(std::string_view key) const noexcept {
        if (values_.empty()) return nullptr;
        auto s = hash_.slot(key);
        if (!fingerprints_.matches(s, key)) return nullptr;
        return &values_[s.value];
    }

    /**
     * @brief Value for key
     * @return error::missing_key only when fingerprinting detects an absent key
     */
    [[nodiscard]] result<V> get(std::string_view key) const {
        if (const V* v = find(key)) {
            return *v;
        }
        return std::unexpected(error::missing_key);
    }

    [[nodiscard]] V get_or(std::string_view key, V default_value) const {
        if (const V* v = find(key)) {
            return *v;
        }
        return default_value;
    }

    /**
     * @brief Membership test; always true when fingerprinting is disabled
     */
    [[nodiscard]] bool contains(std::string_view key) const noexcept {
        return find(key) != nullptr;
    }

    /**
     * @brief Look up several keys, calling cb(key, value) for each one found
     */
    template<typename Callback>
    void get_batch(std::span<const std::string_view> keys, Callback&& cb) const {
        for (auto key : keys) {
            if (const V* v = find(key)) {
                cb(key, *v);
            }
        }
    }

    // ===== MUTATION =====

    /**
     * @brief Overwrite the value at slot(key), unconditionally
     *
     * No validation: an unknown key silently replaces the value of the build
     * key sharing its slot. Fingerprints are never touched.
     */
    void set(std::string_view key, V value) {
        if (values_.empty()) return;
        values_[hash_.slot(key).value] = std::move(value);
    }

    /**
     * @brief Overwrite the value for key only if fingerprinting accepts it
     * @return error::missing_key, with the container unchanged, otherwise
     */
    [[nodiscard]] status update(std::string_view key, V value) {
        if (values_.empty()) {
            return std::unexpected(error::missing_key);
        }
        auto s = hash_.slot(key);
        if (!fingerprints_.matches(s, key)) {
            return std::unexpected(error::missing_key);
        }
        values_[s.value] = std::move(value);
        return {};
    }

    /**
     * @brief Replace every value v with f(v); the length never changes
     */
    template<typename F>
        requires std::convertible_to<std::invoke_result_t<F&, const V&>, V>
    void transform_values(F&& f) {
        for (auto& v : values_) {
            v = f(std::as_const(v));
        }
    }

    // ===== ITERATION =====

    // Values in slot order; no key information
    [[nodiscard]] std::span<const V> values() const noexcept { return values_; }

    [[nodiscard]] const_iterator begin() const noexcept { return values_.cbegin(); }
    [[nodiscard]] const_iterator end() const noexcept { return values_.cend(); }

    // Value stored at a slot, or nullptr if the slot is out of range
    [[nodiscard]] const V* value_at(slot_index slot) const noexcept {
        return slot.value < values_.size() ? &values_[slot.value] : nullptr;
    }

    // ===== PROPERTIES =====

    [[nodiscard]] size_t size() const noexcept { return values_.size(); }
    [[nodiscard]] bool empty() const noexcept { return values_.empty(); }

    [[nodiscard]] const hash_type& hash_function() const noexcept { return hash_; }
    [[nodiscard]] const fingerprint_type& fingerprints() const noexcept { return fingerprints_; }
    [[nodiscard]] unsigned fingerprint_bits() const noexcept { return fingerprints_.bits(); }

    // Counters of the build that produced this map (zero after deserialize)
    [[nodiscard]] const build_stats& build_statistics() const noexcept { return stats_; }

    [[nodiscard]] perfect_map_stats statistics() const noexcept {
        auto h = hash_.statistics();
        size_t index_bytes = h.memory_bytes + fingerprints_.memory_bytes();
        return perfect_map_stats{
            .key_count = values_.size(),
            .vertex_count = h.vertex_count,
            .fingerprint_bits = fingerprints_.bits(),
            .index_bytes = index_bytes,
            .value_bytes = values_.size() * sizeof(V),
            .index_bits_per_key = values_.empty() ? 0.0 : (index_bytes * 8.0) / values_.size(),
            .false_positive_rate = fingerprints_.false_positive_rate()
        };
    }

    [[nodiscard]] bool operator==(const perfect_map& other) const
        requires std::equality_comparable<V> {
        return hash_ == other.hash_ && fingerprints_ == other.fingerprints_ && values_ == other.values_;
    }

    // ===== SERIALIZATION =====

    /**
     * @brief Encode seed, labels, fingerprints and values as one blob
     */
    [[nodiscard]] std::vector<std::byte> serialize() const
        requires serializable_value<V> {
        byte_writer w;
        w.put_header(blob_kind::perfect_map);
        hash_.serialize_into(w);
        fingerprints_.serialize_into(w);
        w.put(static_cast<uint64_t>(values_.size()));
        for (const auto& v : values_) {
            value_codec<V>::encode(w, v);
        }
        return std::move(w).take();
    }

    [[nodiscard]] static result<perfect_map> deserialize(std::span<const std::byte> data)
        requires serializable_value<V> {
        byte_reader r{data};
        if (!r.expect_header(blob_kind::perfect_map)) {
            return std::unexpected(error::invalid_format);
        }

        auto hash = hash_type::deserialize_from(r);
        if (!hash) return std::unexpected(hash.error());

        auto fingerprints = fingerprint_type::deserialize_from(r);
        if (!fingerprints) return std::unexpected(fingerprints.error());

        const uint64_t n = hash->key_count();
        if (fingerprints->enabled() ? fingerprints->size() != n : fingerprints->size() != 0) {
            return std::unexpected(error::invalid_format);
        }

        auto count = r.get<uint64_t>();
        if (!count || *count != n) {
            return std::unexpected(error::invalid_format);
        }

        std::vector<V> values;
        values.reserve(n);
        for (uint64_t i = 0; i < n; ++i) {
            auto v = value_codec<V>::decode(r);
            if (!v) return std::unexpected(error::invalid_format);
            values.push_back(std::move(*v));
        }

        if (!r.exhausted()) {
            return std::unexpected(error::invalid_format);
        }

        return perfect_map{std::move(*hash), std::move(*fingerprints), std::move(values), build_stats{}};
    }
};

} // namespace perfdict
