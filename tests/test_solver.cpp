/**
 * @file test_solver.cpp
 * @brief Tests for label assignment over accepted graphs
 */

#include <catch2/catch_test_macros.hpp>

#include <perfdict/graph.hpp>
#include <perfdict/hashers.hpp>
#include <perfdict/solver.hpp>
#include "test_mock_family.hpp"
#include <algorithm>
#include <numeric>
#include <string>
#include <string_view>
#include <vector>

using namespace perfdict;

namespace {

// Slot of edge e from the assigned labels, treating unassigned as 0
uint64_t slot_of(const key_graph& g, const assignment& a, uint32_t e) {
    auto label = [&](vertex_id v) -> uint64_t {
        return a.labels[v] == unassigned_label ? 0 : a.labels[v];
    };
    auto p = g.edge(e);
    return (label(p.first) + label(p.second)) % g.edge_count();
}

key_graph forest_for(const std::vector<std::string_view>& keys, uint64_t m) {
    for (uint64_t seed = 0;; ++seed) {
        auto g = build_graph(std::span<const std::string_view>{keys}, split_hash_family{}, seed, m);
        if (g) return std::move(*g);
    }
}

} // namespace

TEST_CASE("Hand-built forest gets consistent labels", "[solver]") {
    std::vector<std::string> keys{"0-1", "1-2", "3-4"};
    std::vector<std::string_view> v(keys.begin(), keys.end());
    auto g = build_graph(std::span<const std::string_view>{v}, explicit_edge_family{}, 0, 6);
    REQUIRE(g);

    auto a = assign_labels(*g);
    REQUIRE(a.component_count == 2);
    REQUIRE(a.labels.size() == 6);
    REQUIRE(a.ranks.size() == 3);

    SECTION("Roots are labeled zero, isolated vertices stay unassigned") {
        REQUIRE(a.labels[0] == 0);
        REQUIRE(a.labels[3] == 0);
        REQUIRE(a.labels[5] == unassigned_label);
    }

    SECTION("Ranks follow BFS order within each component range") {
        REQUIRE(a.ranks[0] == 0);
        REQUIRE(a.ranks[1] == 1);
        REQUIRE(a.ranks[2] == 2);
    }

    SECTION("Every edge evaluates to its rank") {
        for (uint32_t e = 0; e < 3; ++e) {
            REQUIRE(slot_of(*g, a, e) == a.ranks[e]);
        }
    }
}

TEST_CASE("Ranks are a permutation of 0..n-1", "[solver]") {
    std::vector<std::string> keys;
    for (int i = 0; i < 5000; ++i) keys.push_back("solver_key_" + std::to_string(i));
    std::vector<std::string_view> v(keys.begin(), keys.end());

    auto g = forest_for(v, 12500);
    auto a = assign_labels(g);

    std::vector<uint32_t> sorted = a.ranks;
    std::sort(sorted.begin(), sorted.end());
    std::vector<uint32_t> expected(keys.size());
    std::iota(expected.begin(), expected.end(), 0u);
    REQUIRE(sorted == expected);

    for (uint32_t e = 0; e < keys.size(); ++e) {
        REQUIRE(slot_of(g, a, e) == a.ranks[e]);
    }

    SECTION("Assigned labels are residues mod n") {
        for (auto label : a.labels) {
            if (label != unassigned_label) {
                REQUIRE(label < keys.size());
            }
        }
    }
}

TEST_CASE("Thread count does not change the result", "[solver]") {
    std::vector<std::string> keys;
    for (int i = 0; i < 20000; ++i) keys.push_back("parallel_" + std::to_string(i));
    std::vector<std::string_view> v(keys.begin(), keys.end());

    auto g = forest_for(v, 50000);
    auto serial = assign_labels(g, 1);
    auto parallel = assign_labels(g, 4);

    REQUIRE(serial.labels == parallel.labels);
    REQUIRE(serial.ranks == parallel.ranks);
    REQUIRE(serial.component_count == parallel.component_count);
}

TEST_CASE("Single edge graph", "[solver]") {
    std::vector<std::string> keys{"0-1"};
    std::vector<std::string_view> v(keys.begin(), keys.end());
    auto g = build_graph(std::span<const std::string_view>{v}, explicit_edge_family{}, 0, 2);
    REQUIRE(g);

    auto a = assign_labels(*g);
    REQUIRE(a.ranks[0] == 0);
    REQUIRE(slot_of(*g, a, 0) == 0);
}
