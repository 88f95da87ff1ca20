#pragma once

#include <hetfeat/constants.hpp>
#include <hetfeat/network.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace hetfeat
{

//! Progress of one permutation run at a checkpoint. The four rejection rates
//! are per attempt since the previous checkpoint.
struct PermutationStat
{
    uint64_t cumulative_attempts = 0;
    uint64_t attempts = 0;
    double complete = 0;
    //! Fraction of the original edges still present.
    double unchanged = 0;
    double self_loop = 0;
    double duplicate = 0;
    double undirected_duplicate = 0;
    double excluded = 0;
    std::string edge_type;
};

struct PermutationResult
{
    EdgeTable edges;
    std::vector<PermutationStat> stats;
};

//! Degree preserving XSwap over the edges of a single type. Every accepted
//! swap replaces (s0, e0), (s1, e1) by (s0, e1), (s1, e0) so every node keeps
//! its in- and out-degree. Swaps creating a self loop, an existing edge, the
//! reverse of an existing edge (undirected types only) or an excluded pair are
//! rejected. The same seed and input always give the same result.
//!
//! Throws MultipleEdgeTypesInPermutation and PrecomputedDuplicateEdge on bad
//! input. Fewer than two edges are returned as they are, without statistics.
PermutationResult permute_edges(EdgeTable const& edges,
                                bool directed,
                                double multiplier = default_permutation_multiplier,
                                EdgeTable const& excluded = {},
                                uint32_t seed = 0);

//! Permutes every edge type of edges on its own, types in order of first
//! appearance. A type is directed when its name contains '>' or '<' and is
//! seeded with seed + its edge count. Types run concurrently on worker_num
//! OpenMP threads (<= 0 for all available).
PermutationResult permute_graph(EdgeTable const& edges,
                                double multiplier = default_permutation_multiplier,
                                EdgeTable const& excluded = {},
                                uint32_t seed = 0,
                                int worker_num = 0);

} // namespace hetfeat
