#include <hetfeat/degree_weight.hpp>

#include <cmath>
#include <stdexcept>

namespace hetfeat
{

namespace
{

std::vector<real_t> damping_factors(std::vector<degree_t> const& degrees, real_t w)
{
    std::vector<real_t> factors(degrees.size(), 0);
    for (size_t v_i = 0; v_i < degrees.size(); v_i++)
    {
        if (degrees[v_i] != 0)
        {
            factors[v_i] = std::pow(static_cast<real_t>(degrees[v_i]), -w);
        }
    }
    return factors;
}

} // namespace

std::vector<degree_t> row_degrees(SparseMatrix const& adjacency)
{
    std::vector<degree_t> degrees(adjacency.rows(), 0);
    for (int64_t r_i = 0; r_i < adjacency.outerSize(); r_i++)
    {
        for (SparseMatrix::InnerIterator it(adjacency, r_i); it; ++it)
        {
            if (it.value() != 0)
            {
                degrees[r_i]++;
            }
        }
    }
    return degrees;
}

std::vector<degree_t> column_degrees(SparseMatrix const& adjacency)
{
    std::vector<degree_t> degrees(adjacency.cols(), 0);
    for (int64_t r_i = 0; r_i < adjacency.outerSize(); r_i++)
    {
        for (SparseMatrix::InnerIterator it(adjacency, r_i); it; ++it)
        {
            if (it.value() != 0)
            {
                degrees[it.col()]++;
            }
        }
    }
    return degrees;
}

SparseMatrix weight_by_degree(SparseMatrix const& adjacency, real_t w, bool directed)
{
    if (!(w >= 0 && w <= 1))
    {
        throw std::invalid_argument("damping exponent must lie in [0, 1]");
    }

    std::vector<real_t> const row_factors = damping_factors(row_degrees(adjacency), w);
    std::vector<real_t> const column_factors =
        directed ? damping_factors(column_degrees(adjacency), w) : row_factors;

    SparseMatrix weighted = adjacency;
    for (int64_t r_i = 0; r_i < weighted.outerSize(); r_i++)
    {
        for (SparseMatrix::InnerIterator it(weighted, r_i); it; ++it)
        {
            it.valueRef() *= row_factors[it.row()] * column_factors[it.col()];
        }
    }
    return weighted;
}

} // namespace hetfeat
