#pragma once

#include <hetfeat/mpi_helper.hpp>
#include <hetfeat/network.hpp>
#include <hetfeat/type.hpp>

#include <gtest/gtest.h>

#include <cstdio>
#include <string>
#include <vector>

using namespace hetfeat;

//temporary files written by the storage and catalog tests, one per rank
const char* test_data_file = "746123_hetfeat_test_temp_data";

std::string temp_path(std::string const& suffix = "")
{
    return std::string(test_data_file) + suffix + "_" + std::to_string(get_mpi_rank());
}

// Toy network used across tests: Alpha(a1, a2) - links - Beta(b1, b2, b3)
// undirected, Beta > feeds > Gamma(c1, c2) forward.
//
//   a1 - b1, a1 - b2, a2 - b2, a2 - b3
//   b1 > c1, b2 > c1, b2 > c2, b3 > c2
NodeTable toy_nodes()
{
    return NodeTable{ { "a1", "Alpha" }, { "a2", "Alpha" }, { "b1", "Beta" }, { "b2", "Beta" },
                      { "b3", "Beta" },  { "c1", "Gamma" }, { "c2", "Gamma" } };
}

EdgeTable toy_edges()
{
    return EdgeTable{ { "a1", "b1", "links_AlB" }, { "a1", "b2", "links_AlB" }, { "a2", "b2", "links_AlB" },
                      { "a2", "b3", "links_AlB" }, { "b1", "c1", "feeds_Bf>C" }, { "b2", "c1", "feeds_Bf>C" },
                      { "b2", "c2", "feeds_Bf>C" }, { "b3", "c2", "feeds_Bf>C" } };
}

HetNetwork toy_network() { return HetNetwork(toy_nodes(), toy_edges()); }

//! Dense copy of mat, for entrywise comparisons in small tests.
std::vector<std::vector<real_t>> to_dense(SparseMatrix const& mat)
{
    std::vector<std::vector<real_t>> ret(mat.rows(), std::vector<real_t>(mat.cols(), 0));
    for (Eigen::Index r = 0; r < mat.outerSize(); r++)
    {
        for (SparseMatrix::InnerIterator it(mat, r); it; ++it)
        {
            ret[it.row()][it.col()] = it.value();
        }
    }
    return ret;
}

real_t entry(SparseMatrix const& mat, HetNetwork const& network, std::string const& row_id, std::string const& col_id)
{
    return mat.coeff(network.index_of(row_id), network.index_of(col_id));
}

void mute_nonroot_gtest_events()
{
    ::testing::TestEventListeners& listeners = ::testing::UnitTest::GetInstance()->listeners();
    if (get_mpi_rank() != 0)
    {
        delete listeners.Release(listeners.default_result_printer());
    }
}
