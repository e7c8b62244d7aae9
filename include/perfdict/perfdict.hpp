/**
 * @file perfdict.hpp
 * @brief Main header for perfdict - compact dictionaries over a fixed key set
 *
 * Pulls in every component. Most users only need perfect_map:
 *
 *     auto m = perfdict::perfect_map<int>::build({{"alice", 1}, {"bob", 2}});
 *     if (m) { auto v = m->get("alice"); }
 */

#pragma once

#include "core.hpp"
#include "hashers.hpp"
#include "disjoint_set.hpp"
#include "graph.hpp"
#include "solver.hpp"
#include "mphf.hpp"
#include "packed_array.hpp"
#include "fingerprint.hpp"
#include "serialization.hpp"
#include "perfect_map.hpp"
