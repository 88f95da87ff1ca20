#pragma once

#include <hetfeat/adjacency.hpp>
#include <hetfeat/metapath.hpp>
#include <hetfeat/type.hpp>

#include <string>
#include <vector>

namespace hetfeat
{

//! Weighted matrices of the metaedges of mp in traversal order. Metaedges
//! walked backward resolve to the transposed matrix registered under the
//! inverse abbreviation. Throws UnknownMetaedge.
std::vector<SharedMatrix> get_matrices_to_multiply(Metapath const& mp, MatrixCache const& cache);

//! Plain left to right chain product (DWWC).
SparseMatrix count_walks(std::vector<SharedMatrix> const& to_multiply);

//! Degree weighted count of the walks that never visit a node twice (DWPC).
//! metanodes holds the node code of every position, to_multiply.size() + 1
//! entries.
//!
//! When position p repeats the code of position j (the most recent one), the
//! segment j..p is multiplied on its own, its diagonal zeroed, and the result
//! joined to the product up to j. A repeat of the start kind thus zeroes the
//! diagonal of the running product. This chain is exact as long as no code
//! occurs three times and the repeated spans do not cross (AlBlA, or
//! AlBf>C<fBlA with the B span nested inside). Otherwise, as in AlBlAlB,
//! the paths are enumerated depth first from every start row.
SparseMatrix count_paths(std::vector<SharedMatrix> const& to_multiply, std::vector<std::string> const& metanodes);

SparseMatrix count(Metapath const& mp, MatrixCache const& cache, Semantics semantics);

//! Removes the diagonal entries of mat in place.
void zero_diagonal(SparseMatrix& mat);

} // namespace hetfeat
