#include <hetfeat/path_count.hpp>

#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace hetfeat
{

namespace
{

SparseMatrix multiply(SparseMatrix const& left, SparseMatrix const& right)
{
    SparseMatrix product = (left * right).pruned();
    return product;
}

//! True when every node code occurs at most twice and the spans between
//! repeated codes nest or are disjoint. chain_paths() is exact in that case.
bool repeats_factorize(std::vector<std::string> const& metanodes)
{
    std::unordered_map<std::string, size_t> first_seen;
    std::vector<std::pair<size_t, size_t>> spans;
    for (size_t p = 0; p < metanodes.size(); p++)
    {
        auto const found = first_seen.find(metanodes[p]);
        if (found == first_seen.end())
        {
            first_seen.emplace(metanodes[p], p);
            continue;
        }
        if (found->second == metanodes.size())
        {
            // third occurrence
            return false;
        }
        spans.emplace_back(found->second, p);
        found->second = metanodes.size();
    }

    for (auto const& outer : spans)
    {
        for (auto const& inner : spans)
        {
            if (outer.first < inner.first && inner.first < outer.second && outer.second < inner.second)
            {
                return false;
            }
        }
    }
    return true;
}

//! Product of the factors [begin, end), which join positions begin..end. When
//! position p repeats the code of position j, the segment j..p is multiplied
//! on its own, its diagonal zeroed, and joined to the product up to j.
SparseMatrix chain_paths(std::vector<SharedMatrix> const& to_multiply,
                         std::vector<std::string> const& metanodes,
                         size_t begin,
                         size_t end)
{
    // prefix[p - begin] is the corrected product from position begin to p.
    std::vector<SparseMatrix> prefix(end - begin + 1);
    SparseMatrix running = *to_multiply[begin];
    for (size_t p = begin + 1; p <= end; p++)
    {
        if (p != begin + 1)
        {
            running = multiply(running, *to_multiply[p - 1]);
        }

        size_t repeat = p;
        for (size_t q = p; q-- > begin;)
        {
            if (metanodes[q] == metanodes[p])
            {
                repeat = q;
                break;
            }
        }

        if (repeat == begin)
        {
            zero_diagonal(running);
        }
        else if (repeat != p)
        {
            SparseMatrix segment = chain_paths(to_multiply, metanodes, repeat, p);
            zero_diagonal(segment);
            running = multiply(prefix[repeat - begin], segment);
        }
        prefix[p - begin] = running;
    }
    return running;
}

//! Depth first enumeration of the node sequences along the factors that
//! never visit a node twice, summing the products of their weights.
class PathEnumerator
{
public:
    explicit PathEnumerator(std::vector<SharedMatrix> const& to_multiply)
    : m_to_multiply(to_multiply)
    , m_row(to_multiply.back()->cols(), 0)
    , m_hit(to_multiply.back()->cols(), false)
    {
        m_visited.reserve(to_multiply.size() + 1);
    }

    SparseMatrix run()
    {
        SparseMatrix const& first = *m_to_multiply.front();
        std::vector<Eigen::Triplet<real_t, int64_t>> entries;
        for (int64_t start = 0; start < first.outerSize(); start++)
        {
            m_visited.push_back(start);
            descend(0, start, 1);
            m_visited.pop_back();

            for (int64_t col : m_touched)
            {
                entries.emplace_back(start, col, m_row[col]);
                m_row[col] = 0;
                m_hit[col] = false;
            }
            m_touched.clear();
        }

        SparseMatrix ret(first.rows(), m_to_multiply.back()->cols());
        ret.setFromTriplets(entries.begin(), entries.end());
        return ret;
    }

private:
    void descend(size_t step, int64_t node, real_t weight)
    {
        if (step == m_to_multiply.size())
        {
            if (!m_hit[node])
            {
                m_hit[node] = true;
                m_touched.push_back(node);
            }
            m_row[node] += weight;
            return;
        }

        SparseMatrix const& factor = *m_to_multiply[step];
        for (SparseMatrix::InnerIterator it(factor, node); it; ++it)
        {
            int64_t const next = it.col();
            if (std::find(m_visited.begin(), m_visited.end(), next) != m_visited.end())
            {
                continue;
            }
            m_visited.push_back(next);
            descend(step + 1, next, weight * it.value());
            m_visited.pop_back();
        }
    }

    std::vector<SharedMatrix> const& m_to_multiply;
    std::vector<int64_t> m_visited;
    std::vector<real_t> m_row;
    std::vector<bool> m_hit;
    std::vector<int64_t> m_touched;
};

} // namespace

void zero_diagonal(SparseMatrix& mat)
{
    mat.prune([](Eigen::Index const& row, Eigen::Index const& col, real_t const&) { return row != col; });
}

std::vector<SharedMatrix> get_matrices_to_multiply(Metapath const& mp, MatrixCache const& cache)
{
    std::vector<SharedMatrix> ret;
    ret.reserve(mp.edge_abbrevs.size());
    for (std::string const& abbrev : mp.edge_abbrevs)
    {
        ret.push_back(cache.get_weighted(abbrev));
    }
    return ret;
}

SparseMatrix count_walks(std::vector<SharedMatrix> const& to_multiply)
{
    if (to_multiply.empty())
    {
        throw std::invalid_argument("cannot count walks along an empty metapath");
    }

    SparseMatrix product = *to_multiply.front();
    for (size_t m_i = 1; m_i < to_multiply.size(); m_i++)
    {
        product = multiply(product, *to_multiply[m_i]);
    }
    return product;
}

SparseMatrix count_paths(std::vector<SharedMatrix> const& to_multiply, std::vector<std::string> const& metanodes)
{
    if (to_multiply.empty())
    {
        throw std::invalid_argument("cannot count paths along an empty metapath");
    }
    if (metanodes.size() != to_multiply.size() + 1)
    {
        throw std::invalid_argument("expected one node code per metapath position");
    }

    if (repeats_factorize(metanodes))
    {
        return chain_paths(to_multiply, metanodes, 0, to_multiply.size());
    }
    return PathEnumerator(to_multiply).run();
}

SparseMatrix count(Metapath const& mp, MatrixCache const& cache, Semantics semantics)
{
    std::vector<SharedMatrix> const to_multiply = get_matrices_to_multiply(mp, cache);
    if (semantics == Semantics::walk)
    {
        return count_walks(to_multiply);
    }
    return count_paths(to_multiply, mp.metanode_abbrevs());
}

} // namespace hetfeat
