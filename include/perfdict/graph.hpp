/**
 * @file graph.hpp
 * @brief Construction graph - one edge per key between its two hash vertices
 *
 * For a fixed seed every key becomes an edge (h1(key), h2(key)) over m
 * vertices. The graph is accepted only if it is a forest: no self-loops, no
 * repeated edges and no cycles. Anything else is reported as an
 * attempt_failure and the caller retries with the next seed.
 *
 * The graph lives in flat arrays indexed by vertex id (CSR adjacency) and is
 * discarded once labels have been assigned.
 */

#pragma once

#include "core.hpp"
#include "disjoint_set.hpp"
#include <algorithm>
#include <expected>
#include <limits>
#include <span>
#include <string_view>
#include <vector>

namespace perfdict {

/**
 * @enum attempt_failure
 * @brief Why one seed was rejected
 */
enum class attempt_failure {
    self_loop,         // h1(key) == h2(key)
    duplicate_edge,    // two keys share the same unordered vertex pair
    cyclic_component   // some component has as many edges as vertices
};

[[nodiscard]] constexpr std::string_view to_string(attempt_failure f) noexcept {
    switch (f) {
        case attempt_failure::self_loop:        return "self_loop";
        case attempt_failure::duplicate_edge:   return "duplicate_edge";
        case attempt_failure::cyclic_component: return "cyclic_component";
    }
    return "unknown";
}

/**
 * @struct component
 * @brief A tree of the accepted forest
 *
 * Ranks [base, base + edge_count) belong to the keys of this component.
 */
struct component {
    vertex_id root;       // Lowest vertex id in the component
    uint32_t edge_count;
    uint32_t base;
};

/**
 * @class key_graph
 * @brief Accepted acyclic construction graph
 */
class key_graph {
    uint64_t vertex_count_{0};
    std::vector<vertex_pair> edges_;    // Edge i is key i
    std::vector<uint32_t> offsets_;     // vertex_count_ + 1 entries
    std::vector<uint32_t> incident_;    // Edge ids grouped by vertex
    std::vector<component> components_; // Ordered by root

    template<seeded_hash_family Family>
    friend std::expected<key_graph, attempt_failure> build_graph(
        std::span<const std::string_view>, const Family&, uint64_t, uint64_t);

public:
    key_graph() = default;

    [[nodiscard]] uint64_t vertex_count() const noexcept { return vertex_count_; }
    [[nodiscard]] size_t edge_count() const noexcept { return edges_.size(); }

    [[nodiscard]] vertex_pair edge(uint32_t e) const noexcept { return edges_[e]; }

    // Edge ids touching v, in key order
    [[nodiscard]] std::span<const uint32_t> incident(vertex_id v) const noexcept {
        return {incident_.data() + offsets_[v], incident_.data() + offsets_[v + 1]};
    }

    [[nodiscard]] uint32_t degree(vertex_id v) const noexcept {
        return offsets_[v + 1] - offsets_[v];
    }

    [[nodiscard]] vertex_id other_end(uint32_t e, vertex_id v) const noexcept {
        const auto& p = edges_[e];
        return p.first == v ? p.second : p.first;
    }

    [[nodiscard]] std::span<const component> components() const noexcept {
        return components_;
    }
};

/**
 * @brief Build and validate the construction graph for one seed
 *
 * Pure function of its arguments: the same keys, family, seed and vertex
 * count always give the same graph or the same failure.
 *
 * @param keys Distinct keys; key i becomes edge i
 * @param family Seeded hash family providing the two endpoints
 * @param seed Member of the family to use
 * @param vertex_count m, at least 2 and at most 2^32
 */
template<seeded_hash_family Family>
[[nodiscard]] std::expected<key_graph, attempt_failure> build_graph(
    std::span<const std::string_view> keys,
    const Family& family,
    uint64_t seed,
    uint64_t vertex_count) {

    key_graph g;
    g.vertex_count_ = vertex_count;
    g.edges_.reserve(keys.size());

    for (auto key : keys) {
        auto p = family.vertices(key, seed, vertex_count);
        if (p.first == p.second) {
            return std::unexpected(attempt_failure::self_loop);
        }
        g.edges_.push_back(p);
    }

    // Repeated unordered pairs
    {
        std::vector<uint64_t> packed;
        packed.reserve(g.edges_.size());
        for (const auto& p : g.edges_) {
            uint64_t lo = std::min(p.first, p.second);
            uint64_t hi = std::max(p.first, p.second);
            packed.push_back((lo << 32) | hi);
        }
        std::sort(packed.begin(), packed.end());
        if (std::adjacent_find(packed.begin(), packed.end()) != packed.end()) {
            return std::unexpected(attempt_failure::duplicate_edge);
        }
    }

    // An edge joining two already connected vertices closes a cycle
    disjoint_set sets(vertex_count);
    for (const auto& p : g.edges_) {
        if (!sets.unite(p.first, p.second)) {
            return std::unexpected(attempt_failure::cyclic_component);
        }
    }

    // CSR adjacency
    g.offsets_.assign(vertex_count + 1, 0);
    for (const auto& p : g.edges_) {
        ++g.offsets_[p.first + 1];
        ++g.offsets_[p.second + 1];
    }
    for (uint64_t v = 0; v < vertex_count; ++v) {
        g.offsets_[v + 1] += g.offsets_[v];
    }
    g.incident_.resize(2 * g.edges_.size());
    {
        std::vector<uint32_t> fill(g.offsets_.begin(), g.offsets_.end() - 1);
        for (uint32_t e = 0; e < g.edges_.size(); ++e) {
            g.incident_[fill[g.edges_[e].first]++] = e;
            g.incident_[fill[g.edges_[e].second]++] = e;
        }
    }

    // Components in order of their lowest vertex id. Vertices touched by no
    // edge belong to no component.
    constexpr uint32_t none = std::numeric_limits<uint32_t>::max();
    std::vector<uint32_t> component_of_root(vertex_count, none);
    for (uint64_t v = 0; v < vertex_count; ++v) {
        if (g.degree(static_cast<vertex_id>(v)) == 0) continue;
        vertex_id r = sets.find(static_cast<vertex_id>(v));
        if (component_of_root[r] == none) {
            component_of_root[r] = static_cast<uint32_t>(g.components_.size());
            g.components_.push_back(component{static_cast<vertex_id>(v), 0, 0});
        }
    }
    for (const auto& p : g.edges_) {
        ++g.components_[component_of_root[sets.find(p.first)]].edge_count;
    }

    uint32_t base = 0;
    for (auto& c : g.components_) {
        c.base = base;
        base += c.edge_count;
    }

    return g;
}

} // namespace perfdict
