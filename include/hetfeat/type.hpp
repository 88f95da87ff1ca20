#pragma once

#include <hetfeat/constants.hpp>

#include <Eigen/Sparse>

#include <cstdint>
#include <memory>

namespace hetfeat
{

using NodeIndex = uint32_t;
using edge_id_t = uint64_t;
using metanode_id_t = uint32_t;
using metaedge_id_t = uint32_t;
using real_t = double;
using degree_t = uint64_t;

//! All adjacency, weighted and product matrices are row-major so that
//! restricting a product to a set of start nodes walks whole rows.
using SparseMatrix = Eigen::SparseMatrix<real_t, Eigen::RowMajor, int64_t>;
using SharedMatrix = std::shared_ptr<SparseMatrix const>;

enum class Direction
{
    forward,
    backward,
    both
};

enum class Semantics
{
    path,
    walk
};

} // namespace hetfeat
