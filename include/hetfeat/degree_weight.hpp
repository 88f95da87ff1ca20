#pragma once

#include <hetfeat/type.hpp>

#include <vector>

namespace hetfeat
{

//! Number of non-zero entries per row of an unweighted matrix.
std::vector<degree_t> row_degrees(SparseMatrix const& adjacency);

//! Number of non-zero entries per column of an unweighted matrix.
std::vector<degree_t> column_degrees(SparseMatrix const& adjacency);

//! Returns D_row^-w * A * D_col^-w where the degrees are taken from the
//! unweighted adjacency matrix A. For an undirected matrix both degree vectors
//! are the row sums, for a directed one they are out- and in-degree. A node
//! with degree 0 gets factor 0, so w = 0 reproduces A exactly and isolated
//! nodes never produce NaN.
SparseMatrix weight_by_degree(SparseMatrix const& adjacency, real_t w, bool directed);

} // namespace hetfeat
