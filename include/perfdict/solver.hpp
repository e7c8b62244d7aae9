/**
 * @file solver.hpp
 * @brief Label assignment over an accepted forest
 *
 * Each tree is walked breadth-first from its lowest vertex. Every edge
 * discovered towards an unlabeled vertex gets the next rank of its
 * component, and the new vertex's label is solved so that
 *
 *     (g[u] + g[v]) mod n == rank(edge)
 *
 * Components own disjoint rank ranges [base, base + edges), so the ranks of
 * all n keys are exactly {0, ..., n-1}.
 */

#pragma once

#include "core.hpp"
#include "graph.hpp"
#include <cstdint>
#include <limits>
#include <vector>

#ifdef PERFDICT_HAS_OPENMP
#include <omp.h>
#endif

namespace perfdict {

// Label of a vertex touched by no edge
inline constexpr uint32_t unassigned_label = std::numeric_limits<uint32_t>::max();

/**
 * @struct assignment
 * @brief Solver output: one label per vertex, one rank per key
 */
struct assignment {
    std::vector<uint32_t> labels;
    std::vector<uint32_t> ranks;
    size_t component_count{0};
};

namespace detail {

inline void solve_component(
    const key_graph& g,
    const component& c,
    uint64_t n,
    std::vector<uint32_t>& labels,
    std::vector<uint32_t>& ranks,
    std::vector<vertex_id>& queue) {

    uint32_t next_rank = c.base;
    labels[c.root] = 0;
    queue.clear();
    queue.push_back(c.root);

    for (size_t head = 0; head < queue.size(); ++head) {
        vertex_id u = queue[head];
        for (uint32_t e : g.incident(u)) {
            vertex_id w = g.other_end(e, u);
            if (labels[w] != unassigned_label) continue;  // parent edge

            uint32_t rank = next_rank++;
            ranks[e] = rank;
            labels[w] = static_cast<uint32_t>((rank + n - labels[u]) % n);
            queue.push_back(w);
        }
    }
}

} // namespace detail

/**
 * @brief Assign labels to every vertex of an acyclic graph
 *
 * The result does not depend on @p threads: components share no vertices or
 * edges and their rank ranges are fixed before solving starts.
 *
 * @param g Accepted graph from build_graph
 * @param threads Components solved in parallel when built with OpenMP
 */
[[nodiscard]] inline assignment assign_labels(const key_graph& g, size_t threads = 1) {
    const uint64_t n = g.edge_count();
    assignment out;
    out.labels.assign(g.vertex_count(), unassigned_label);
    out.ranks.assign(n, 0);

    auto comps = g.components();
    out.component_count = comps.size();

#ifdef PERFDICT_HAS_OPENMP
    if (threads > 1 && comps.size() > 1) {
        const auto count = static_cast<int64_t>(comps.size());
        #pragma omp parallel num_threads(static_cast<int>(threads))
        {
            std::vector<vertex_id> queue;

            #pragma omp for schedule(dynamic, 256)
            for (int64_t i = 0; i < count; ++i) {
                detail::solve_component(g, comps[i], n, out.labels, out.ranks, queue);
            }
        }
        return out;
    }
#else
    (void)threads;
#endif

    std::vector<vertex_id> queue;
    for (const auto& c : comps) {
        detail::solve_component(g, c, n, out.labels, out.ranks, queue);
    }
    return out;
}

} // namespace perfdict
