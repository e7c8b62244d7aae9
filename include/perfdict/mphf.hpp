/**
 * @file mphf.hpp
 * @brief Minimal perfect hash function: seeded graph construction with retry
 *
 * Maps each of n known keys to a distinct slot in [0, n):
 *
 *     slot(key) = (g[h1(key)] + g[h2(key)]) mod n
 *
 * where h1, h2 come from a seeded hash family and g is the label table
 * produced by the solver. Only the seed and g are kept; keys are not.
 *
 * Construction tries seeds base, base+1, ... until one yields an acyclic
 * graph, up to a caller-chosen budget.
 */

#pragma once

#include "core.hpp"
#include "graph.hpp"
#include "hashers.hpp"
#include "serialization.hpp"
#include "solver.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <expected>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace perfdict {

// ===== CONFIGURATION AND STATISTICS =====

/**
 * @struct build_options
 * @brief Tuning knobs for construction
 *
 * load_factor is c in m = ceil(c * n). Values just above 2 keep the label
 * table small; larger values make each attempt more likely to succeed.
 * For large n an attempt succeeds with probability about sqrt((c - 2) / c):
 * roughly 45% at c = 2.5 and 58% at c = 3. At c <= 2 it tends to zero as n
 * grows, so the retry budget has to carry the build.
 */
struct build_options {
    double load_factor{2.5};
    uint64_t seed{0};
    size_t max_attempts{32};
    size_t threads{1};
};

/**
 * @struct build_stats
 * @brief What happened during the last construction
 */
struct build_stats {
    size_t attempts{0};
    size_t self_loops{0};
    size_t duplicate_edges{0};
    size_t cyclic_components{0};
    uint64_t seed{0};           // Accepted seed
    uint64_t vertex_count{0};
    size_t component_count{0};
    size_t build_time_us{0};

    [[nodiscard]] constexpr size_t failures() const noexcept {
        return self_loops + duplicate_edges + cyclic_components;
    }
};

/**
 * @struct mphf_stats
 * @brief Size of a built function
 */
struct mphf_stats {
    size_t key_count{0};
    uint64_t vertex_count{0};
    size_t memory_bytes{0};
    double bits_per_key{0.0};
};

template<seeded_hash_family Family>
struct construction;

/**
 * @class minimal_perfect_hash
 * @brief Evaluator for a built MPHF
 *
 * slot() is total: keys outside the build set still land on some slot in
 * [0, n), which is meaningless for them.
 */
template<seeded_hash_family Family = default_family>
class minimal_perfect_hash {
public:
    class builder;
    using family_type = Family;

private:
    Family family_{};
    uint64_t seed_{0};
    uint64_t key_count_{0};
    std::vector<uint32_t> labels_;

    template<seeded_hash_family F>
    friend result<construction<F>> construct(
        std::span<const std::string_view>, const build_options&, const F&, build_stats&);

    minimal_perfect_hash(Family family, uint64_t seed, uint64_t key_count, std::vector<uint32_t> labels)
        : family_(std::move(family))
        , seed_(seed)
        , key_count_(key_count)
        , labels_(std::move(labels)) {}

    [[nodiscard]] uint64_t label(vertex_id v) const noexcept {
        uint32_t g = labels_[v];
        return g == unassigned_label ? 0 : g;
    }

public:
    minimal_perfect_hash() = default;

    /**
     * @brief Slot of a key
     * @return Index in [0, key_count()); unique among build keys
     */
    [[nodiscard]] slot_index slot(std::string_view key) const noexcept {
        if (key_count_ == 0) return slot_index{0};
        auto p = family_.vertices(key, seed_, labels_.size());
        return slot_index{(label(p.first) + label(p.second)) % key_count_};
    }

    [[nodiscard]] slot_index operator()(std::string_view key) const noexcept {
        return slot(key);
    }

    [[nodiscard]] uint64_t key_count() const noexcept { return key_count_; }
    [[nodiscard]] uint64_t vertex_count() const noexcept { return labels_.size(); }
    [[nodiscard]] uint64_t seed() const noexcept { return seed_; }
    [[nodiscard]] const Family& family() const noexcept { return family_; }
    [[nodiscard]] std::span<const uint32_t> labels() const noexcept { return labels_; }

    [[nodiscard]] mphf_stats statistics() const noexcept {
        size_t bytes = labels_.size() * sizeof(uint32_t) + sizeof(*this);
        return mphf_stats{
            .key_count = key_count_,
            .vertex_count = labels_.size(),
            .memory_bytes = bytes,
            .bits_per_key = key_count_ > 0 ? (bytes * 8.0) / key_count_ : 0.0
        };
    }

    [[nodiscard]] bool operator==(const minimal_perfect_hash& other) const noexcept {
        return seed_ == other.seed_ && key_count_ == other.key_count_ && labels_ == other.labels_;
    }

    // ===== SERIALIZATION =====

    void serialize_into(byte_writer& w) const {
        w.put_header(blob_kind::hash_function);
        w.put(static_cast<uint32_t>(Family::family_id));
        w.put(seed_);
        w.put(key_count_);
        w.put_array(std::span<const uint32_t>{labels_});
    }

    [[nodiscard]] std::vector<std::byte> serialize() const {
        byte_writer w;
        serialize_into(w);
        return std::move(w).take();
    }

    [[nodiscard]] static result<minimal_perfect_hash> deserialize_from(byte_reader& r) {
        if (!r.expect_header(blob_kind::hash_function)) {
            return std::unexpected(error::invalid_format);
        }

        auto family_id = r.get<uint32_t>();
        auto seed = r.get<uint64_t>();
        auto key_count = r.get<uint64_t>();
        if (!family_id || *family_id != Family::family_id || !seed || !key_count) {
            return std::unexpected(error::invalid_format);
        }

        auto labels = r.get_array<uint32_t>();
        if (!labels || labels->size() > std::numeric_limits<uint32_t>::max()) {
            return std::unexpected(error::invalid_format);
        }

        // m > n for any load factor above 1, and every assigned label is a
        // residue mod n
        bool sized = *key_count == 0 ? labels->empty()
                                     : labels->size() >= 2 && labels->size() > *key_count;
        if (!sized) {
            return std::unexpected(error::invalid_format);
        }
        for (uint32_t g : *labels) {
            if (g != unassigned_label && g >= *key_count) {
                return std::unexpected(error::invalid_format);
            }
        }

        return minimal_perfect_hash{Family{}, *seed, *key_count, std::move(*labels)};
    }

    [[nodiscard]] static result<minimal_perfect_hash> deserialize(std::span<const std::byte> data) {
        byte_reader r{data};
        auto hash = deserialize_from(r);
        if (hash && !r.exhausted()) {
            return std::unexpected(error::invalid_format);
        }
        return hash;
    }

    /**
     * @class builder
     * @brief Fluent front end over construct()
     */
    class builder {
        std::vector<std::string> keys_;
        build_options options_;
        Family family_;
        build_stats stats_;

    public:
        builder() = default;
        explicit builder(Family family) : family_(std::move(family)) {}

        builder& add(std::string_view key) {
            keys_.emplace_back(key);
            return *this;
        }

        builder& add_all(std::span<const std::string> keys) {
            keys_.insert(keys_.end(), keys.begin(), keys.end());
            return *this;
        }

        builder& with_load_factor(double c) {
            options_.load_factor = c;
            return *this;
        }

        builder& with_seed(uint64_t seed) {
            options_.seed = seed;
            return *this;
        }

        builder& with_max_attempts(size_t attempts) {
            options_.max_attempts = attempts;
            return *this;
        }

        builder& with_threads(size_t threads) {
            options_.threads = std::max(size_t{1}, threads);
            return *this;
        }

        builder& with_options(const build_options& options) {
            options_ = options;
            return *this;
        }

        [[nodiscard]] result<minimal_perfect_hash> build();

        // Statistics of the last build(), filled on failure too
        [[nodiscard]] const build_stats& stats() const noexcept { return stats_; }
    };
};

/**
 * @struct construction
 * @brief A built function together with the rank of every input key
 *
 * ranks[i] == hash.slot(keys[i]).value for every build key i.
 */
template<seeded_hash_family Family>
struct construction {
    minimal_perfect_hash<Family> hash;
    std::vector<uint32_t> ranks;
};

// ===== CONSTRUCTION =====

[[nodiscard]] inline status validate(const build_options& options) noexcept {
    if (!(options.load_factor > 1.0) || !std::isfinite(options.load_factor)) {
        return std::unexpected(error::invalid_config);
    }
    if (options.max_attempts == 0) {
        return std::unexpected(error::invalid_config);
    }
    return {};
}

/**
 * @brief Reject repeated keys
 * Sorts a copy of the views; no hashing involved.
 */
[[nodiscard]] inline status check_distinct(std::span<const std::string_view> keys) {
    std::vector<std::string_view> sorted(keys.begin(), keys.end());
    std::sort(sorted.begin(), sorted.end());
    if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end()) {
        return std::unexpected(error::duplicate_key);
    }
    return {};
}

/**
 * @brief One construction attempt for a single seed
 *
 * Pure: no state is shared between attempts, so a failing seed can be
 * replayed in isolation.
 */
template<seeded_hash_family Family>
[[nodiscard]] std::expected<assignment, attempt_failure> build_attempt(
    std::span<const std::string_view> keys,
    const Family& family,
    uint64_t seed,
    uint64_t vertex_count,
    size_t threads = 1) {

    auto graph = build_graph(keys, family, seed, vertex_count);
    if (!graph) {
        return std::unexpected(graph.error());
    }
    return assign_labels(*graph, threads);
}

/**
 * @brief Build an MPHF for distinct keys, retrying seeds within the budget
 *
 * @param keys Keys to hash; only read during the call
 * @param options Load factor, first seed, retry budget, threads
 * @param family Hash family instance
 * @param stats Filled with attempt counters whether or not the build succeeds
 * @return error::invalid_config, error::too_many_keys, error::duplicate_key or
 *         error::construction_exhausted on failure
 */
template<seeded_hash_family Family>
[[nodiscard]] result<construction<Family>> construct(
    std::span<const std::string_view> keys,
    const build_options& options,
    const Family& family,
    build_stats& stats) {

    auto start = std::chrono::steady_clock::now();
    stats = build_stats{};

    if (auto ok = validate(options); !ok) {
        return std::unexpected(ok.error());
    }
    if (keys.empty()) {
        return std::unexpected(error::invalid_config);
    }
    if (keys.size() >= max_key_count) {
        return std::unexpected(error::too_many_keys);
    }

    const uint64_t n = keys.size();
    const double scaled = std::ceil(options.load_factor * static_cast<double>(n));
    if (scaled > static_cast<double>(std::numeric_limits<vertex_id>::max())) {
        return std::unexpected(error::too_many_keys);
    }
    const auto m = std::max<uint64_t>(2, static_cast<uint64_t>(scaled));
    stats.vertex_count = m;

    if (auto ok = check_distinct(keys); !ok) {
        return std::unexpected(ok.error());
    }

    const size_t threads = std::max(size_t{1}, options.threads);
    for (size_t attempt = 0; attempt < options.max_attempts; ++attempt) {
        const uint64_t seed = options.seed + attempt;
        ++stats.attempts;

        auto solved = build_attempt(keys, family, seed, m, threads);
        if (!solved) {
            switch (solved.error()) {
                case attempt_failure::self_loop:        ++stats.self_loops; break;
                case attempt_failure::duplicate_edge:   ++stats.duplicate_edges; break;
                case attempt_failure::cyclic_component: ++stats.cyclic_components; break;
            }
            continue;
        }

        stats.seed = seed;
        stats.component_count = solved->component_count;
        stats.build_time_us = static_cast<size_t>(std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start).count());

        return construction<Family>{
            minimal_perfect_hash<Family>{family, seed, n, std::move(solved->labels)},
            std::move(solved->ranks)
        };
    }

    stats.build_time_us = static_cast<size_t>(std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start).count());
    return std::unexpected(error::construction_exhausted);
}

template<seeded_hash_family Family>
[[nodiscard]] result<construction<Family>> construct(
    std::span<const std::string_view> keys,
    const build_options& options = {},
    const Family& family = Family{}) {
    build_stats stats;
    return construct(keys, options, family, stats);
}

template<seeded_hash_family Family>
result<minimal_perfect_hash<Family>> minimal_perfect_hash<Family>::builder::build() {
    std::vector<std::string_view> views(keys_.begin(), keys_.end());
    auto built = construct(std::span<const std::string_view>{views}, options_, family_, stats_);
    if (!built) {
        return std::unexpected(built.error());
    }
    return std::move(built->hash);
}

// ===== FACTORY FUNCTIONS =====

/**
 * @brief Build an MPHF directly from a list of keys
 */
template<seeded_hash_family Family = default_family>
[[nodiscard]] result<minimal_perfect_hash<Family>>
make_mphf(std::span<const std::string> keys, const build_options& options = {}) {
    return typename minimal_perfect_hash<Family>::builder{}
        .add_all(keys)
        .with_options(options)
        .build();
}

} // namespace perfdict
