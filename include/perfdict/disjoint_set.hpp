/**
 * @file disjoint_set.hpp
 * @brief Union-find over vertex ids, used to reject cyclic construction graphs
 */

#pragma once

#include "core.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace perfdict {

/**
 * @class disjoint_set
 * @brief Union by rank with iterative path compression
 *
 * Indices are 0..size()-1.
 */
class disjoint_set {
    std::vector<vertex_id> parent_;
    std::vector<uint8_t> rank_;
    size_t sets_{0};

public:
    disjoint_set() = default;

    explicit disjoint_set(size_t n) { reset(n); }

    void reset(size_t n) {
        parent_.resize(n);
        rank_.assign(n, 0);
        sets_ = n;
        for (size_t i = 0; i < n; ++i) {
            parent_[i] = static_cast<vertex_id>(i);
        }
    }

    [[nodiscard]] size_t size() const noexcept { return parent_.size(); }

    // Number of disjoint sets, singletons included
    [[nodiscard]] size_t sets() const noexcept { return sets_; }

    [[nodiscard]] vertex_id find(vertex_id x) noexcept {
        vertex_id root = x;
        while (parent_[root] != root) {
            root = parent_[root];
        }
        while (parent_[x] != root) {
            vertex_id next = parent_[x];
            parent_[x] = root;
            x = next;
        }
        return root;
    }

    /**
     * @brief Merge the sets holding a and b
     * @return false if a and b were already in the same set
     */
    bool unite(vertex_id a, vertex_id b) noexcept {
        vertex_id ra = find(a);
        vertex_id rb = find(b);
        if (ra == rb) return false;

        if (rank_[ra] < rank_[rb]) {
            parent_[ra] = rb;
        } else if (rank_[ra] > rank_[rb]) {
            parent_[rb] = ra;
        } else {
            parent_[rb] = ra;
            ++rank_[ra];
        }
        --sets_;
        return true;
    }

    [[nodiscard]] bool same(vertex_id a, vertex_id b) noexcept {
        return find(a) == find(b);
    }
};

} // namespace perfdict
