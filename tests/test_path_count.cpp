#include <gtest/gtest.h>

#include "test.hpp"

#include <hetfeat/adjacency.hpp>
#include <hetfeat/error.hpp>
#include <hetfeat/metapath.hpp>
#include <hetfeat/path_count.hpp>
#include <hetfeat/schema.hpp>

#include <algorithm>
#include <cmath>
#include <functional>
#include <memory>

namespace
{

using DenseMatrix = std::vector<std::vector<real_t>>;

//! Sum over every node sequence along the factors without a repeated node,
//! taken from dense copies.
DenseMatrix brute_force_paths(std::vector<SharedMatrix> const& to_multiply)
{
    std::vector<DenseMatrix> factors;
    for (SharedMatrix const& mat : to_multiply)
    {
        factors.push_back(to_dense(*mat));
    }

    size_t const n = factors.front().size();
    DenseMatrix ret(n, std::vector<real_t>(n, 0));
    std::vector<size_t> visited;
    std::function<void(size_t, real_t)> descend = [&](size_t step, real_t weight) {
        size_t const node = visited.back();
        if (step == factors.size())
        {
            ret[visited.front()][node] += weight;
            return;
        }
        for (size_t next = 0; next < n; next++)
        {
            real_t const value = factors[step][node][next];
            if (value == 0 || std::find(visited.begin(), visited.end(), next) != visited.end())
            {
                continue;
            }
            visited.push_back(next);
            descend(step + 1, weight * value);
            visited.pop_back();
        }
    };
    for (size_t start = 0; start < n; start++)
    {
        visited.assign(1, start);
        descend(0, 1);
    }
    return ret;
}

Metapath reversed(Metapath const& mp)
{
    Metapath ret;
    for (auto it = mp.edge_abbrevs.rbegin(); it != mp.edge_abbrevs.rend(); ++it)
    {
        ret.edge_abbrevs.push_back(inverse_abbrev(*it));
    }
    ret.abbrev = metapath_abbrev(ret.edge_abbrevs);
    ret.length = mp.length;
    return ret;
}

} // namespace

class PathCountTest : public ::testing::Test
{
protected:
    PathCountTest()
    : network(toy_network())
    , metagraph(build_metagraph(network))
    , unweighted(MatrixCache::build(network, metagraph, 0))
    , weighted(MatrixCache::build(network, metagraph, 0.5))
    {
    }

    Metapath only_metapath(std::string const& start, std::string const& end, uint32_t length)
    {
        std::vector<Metapath> metapaths = metagraph.extract_metapaths(start, end, length);
        for (Metapath const& mp : metapaths)
        {
            if (mp.length == length)
            {
                return mp;
            }
        }
        ADD_FAILURE() << "no metapath of length " << length;
        return Metapath();
    }

    HetNetwork network;
    MetaGraph metagraph;
    MatrixCache unweighted;
    MatrixCache weighted;
};

TEST_F(PathCountTest, unweighted_counts)
{
    Metapath const mp = only_metapath("Alpha", "Gamma", 2);
    for (Semantics semantics : { Semantics::path, Semantics::walk })
    {
        SparseMatrix const product = count(mp, unweighted, semantics);
        EXPECT_EQ(entry(product, network, "a1", "c1"), 2);
        EXPECT_EQ(entry(product, network, "a1", "c2"), 1);
        EXPECT_EQ(entry(product, network, "a2", "c1"), 1);
        EXPECT_EQ(entry(product, network, "a2", "c2"), 2);
    }
}

TEST_F(PathCountTest, degree_weighted_counts)
{
    Metapath const mp = only_metapath("Alpha", "Gamma", 2);
    SparseMatrix const product = count(mp, weighted, Semantics::path);
    EXPECT_NEAR(entry(product, network, "a1", "c1"), 0.75, 1e-12);
    EXPECT_NEAR(entry(product, network, "a1", "c2"), 0.25, 1e-12);
    EXPECT_NEAR(entry(product, network, "a2", "c1"), 0.25, 1e-12);
    EXPECT_NEAR(entry(product, network, "a2", "c2"), 0.75, 1e-12);
}

TEST_F(PathCountTest, repeated_start_kind_drops_returns)
{
    Metapath const mp = only_metapath("Alpha", "Alpha", 2);
    EXPECT_EQ(mp.abbrev, "AlBlA");

    SparseMatrix const walks = count(mp, unweighted, Semantics::walk);
    EXPECT_EQ(entry(walks, network, "a1", "a1"), 2);
    EXPECT_EQ(entry(walks, network, "a1", "a2"), 1);
    EXPECT_EQ(entry(walks, network, "a2", "a2"), 2);

    SparseMatrix const paths = count(mp, unweighted, Semantics::path);
    EXPECT_EQ(entry(paths, network, "a1", "a1"), 0);
    EXPECT_EQ(entry(paths, network, "a2", "a2"), 0);
    EXPECT_EQ(entry(paths, network, "a1", "a2"), 1);
    EXPECT_EQ(entry(paths, network, "a2", "a1"), 1);
}

TEST_F(PathCountTest, repeat_inside_the_metapath)
{
    // A l B l A l B: b -> a -> b returns count as walks only.
    Metapath const mp = only_metapath("Alpha", "Beta", 3);
    EXPECT_EQ(mp.abbrev, "AlBlAlB");

    SparseMatrix const walks = count(mp, unweighted, Semantics::walk);
    SparseMatrix const paths = count(mp, unweighted, Semantics::path);
    // a1-b1-a1-b2 is a walk but not a path, a1-b2-a2-b3 is both.
    EXPECT_GT(entry(walks, network, "a1", "b2"), entry(paths, network, "a1", "b2"));
    EXPECT_EQ(entry(paths, network, "a1", "b3"), 1);
    EXPECT_EQ(entry(walks, network, "a1", "b3"), 1);
}

TEST_F(PathCountTest, walks_bound_paths)
{
    for (auto const& kinds : std::vector<std::pair<std::string, std::string>>{
             { "Alpha", "Gamma" }, { "Alpha", "Alpha" }, { "Gamma", "Gamma" }, { "Beta", "Alpha" } })
    {
        for (Metapath const& mp : metagraph.extract_metapaths(kinds.first, kinds.second, 4))
        {
            auto const walks = to_dense(count(mp, weighted, Semantics::walk));
            auto const paths = to_dense(count(mp, weighted, Semantics::path));
            for (size_t r = 0; r < walks.size(); r++)
            {
                for (size_t c = 0; c < walks[r].size(); c++)
                {
                    EXPECT_GE(paths[r][c], 0) << mp.abbrev;
                    EXPECT_LE(paths[r][c], walks[r][c] + 1e-12) << mp.abbrev;
                }
            }
        }
    }
}

TEST_F(PathCountTest, crossing_repeats_drop_every_revisit)
{
    Metapath const mp = only_metapath("Alpha", "Beta", 3);
    EXPECT_EQ(mp.abbrev, "AlBlAlB");

    // a2-b2-a2-b3 and a2-b3-a2-b3 both come back to a2.
    SparseMatrix const walks = count(mp, unweighted, Semantics::walk);
    SparseMatrix const paths = count(mp, unweighted, Semantics::path);
    EXPECT_EQ(entry(walks, network, "a2", "b3"), 2);
    EXPECT_EQ(entry(paths, network, "a2", "b3"), 0);
    EXPECT_EQ(entry(walks, network, "a1", "b2"), 3);
    EXPECT_EQ(entry(paths, network, "a1", "b2"), 0);
    EXPECT_EQ(entry(paths, network, "a1", "b3"), 1);
    EXPECT_EQ(entry(paths, network, "a2", "b1"), 1);
    EXPECT_EQ(paths.nonZeros(), 2);

    SparseMatrix const backward = count(reversed(mp), unweighted, Semantics::path);
    EXPECT_EQ(entry(backward, network, "b3", "a2"), 0);
    EXPECT_EQ(entry(backward, network, "b3", "a1"), 1);
    EXPECT_EQ(entry(backward, network, "b1", "a2"), 1);
    EXPECT_EQ(backward.nonZeros(), 2);
}

TEST_F(PathCountTest, reverse_metapath_is_transpose)
{
    Metapath const forward = only_metapath("Alpha", "Gamma", 2);
    Metapath const backward = only_metapath("Gamma", "Alpha", 2);
    EXPECT_EQ(reversed(forward).abbrev, backward.abbrev);

    for (auto const& kinds : std::vector<std::pair<std::string, std::string>>{
             { "Alpha", "Gamma" }, { "Alpha", "Beta" }, { "Alpha", "Alpha" }, { "Gamma", "Gamma" } })
    {
        for (Metapath const& mp : metagraph.extract_metapaths(kinds.first, kinds.second, 4))
        {
            for (Semantics semantics : { Semantics::path, Semantics::walk })
            {
                SparseMatrix const product = count(mp, weighted, semantics);
                auto const expected = to_dense(SparseMatrix(product.transpose()));
                auto const actual = to_dense(count(reversed(mp), weighted, semantics));
                for (size_t r = 0; r < expected.size(); r++)
                {
                    for (size_t c = 0; c < expected[r].size(); c++)
                    {
                        EXPECT_NEAR(actual[r][c], expected[r][c], 1e-12) << mp.abbrev;
                    }
                }
            }
        }
    }
}

TEST_F(PathCountTest, paths_never_revisit_a_node)
{
    for (auto const& kinds : std::vector<std::pair<std::string, std::string>>{
             { "Alpha", "Gamma" }, { "Alpha", "Beta" }, { "Alpha", "Alpha" }, { "Beta", "Beta" } })
    {
        for (Metapath const& mp : metagraph.extract_metapaths(kinds.first, kinds.second, 4))
        {
            auto const expected = brute_force_paths(get_matrices_to_multiply(mp, weighted));
            auto const actual = to_dense(count(mp, weighted, Semantics::path));
            for (size_t r = 0; r < expected.size(); r++)
            {
                for (size_t c = 0; c < expected[r].size(); c++)
                {
                    EXPECT_NEAR(actual[r][c], expected[r][c], 1e-12) << mp.abbrev;
                }
            }
        }
    }
}

TEST_F(PathCountTest, unknown_metaedge)
{
    Metapath mp = only_metapath("Alpha", "Gamma", 2);
    mp.edge_abbrevs[1] = "Bx>C";
    EXPECT_THROW(count(mp, weighted, Semantics::walk), UnknownMetaedge);
}

TEST(PathCount, argument_checks)
{
    EXPECT_THROW(count_walks({}), std::invalid_argument);
    EXPECT_THROW(count_paths({}, { "A" }), std::invalid_argument);

    SharedMatrix const mat = std::make_shared<SparseMatrix const>(SparseMatrix(2, 2));
    EXPECT_THROW(count_paths({ mat }, { "A" }), std::invalid_argument);
    EXPECT_NO_THROW(count_paths({ mat }, { "A", "B" }));
}

TEST(ZeroDiagonal, keeps_off_diagonal)
{
    SparseMatrix mat(3, 3);
    std::vector<Eigen::Triplet<real_t, int64_t>> entries = { { 0, 0, 1 }, { 0, 1, 2 }, { 1, 1, 3 }, { 2, 0, 4 } };
    mat.setFromTriplets(entries.begin(), entries.end());
    zero_diagonal(mat);
    EXPECT_EQ(mat.nonZeros(), 2);
    EXPECT_EQ(mat.coeff(0, 0), 0);
    EXPECT_EQ(mat.coeff(0, 1), 2);
    EXPECT_EQ(mat.coeff(1, 1), 0);
    EXPECT_EQ(mat.coeff(2, 0), 4);
}

GTEST_API_ int main(int argc, char* argv[])
{
    MPI_Instance mpi_instance(&argc, &argv);
    ::testing::InitGoogleTest(&argc, argv);
    mute_nonroot_gtest_events();
    int result = RUN_ALL_TESTS();
    return result;
}
