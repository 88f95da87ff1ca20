#include "option_helper.hpp"

#include <hetfeat/mpi_helper.hpp>
#include <hetfeat/network.hpp>
#include <hetfeat/permute.hpp>
#include <hetfeat/storage.hpp>
#include <hetfeat/util.hpp>

#include <cstdio>
#include <exception>

using namespace hetfeat;

void run(PermuteOptionHelper const& opt)
{
    Timer timer;
    EdgeTable const edges = read_edge_table(opt.edges_path);
    EdgeTable const excluded = opt.excluded_path.empty() ? EdgeTable() : read_edge_pairs(opt.excluded_path);

    PermutationResult const result = permute_graph(edges, opt.multiplier, excluded, opt.seed, opt.thread_num);

    write_edge_table(result.edges, opt.output_prefix + "_edges.csv");
    write_permutation_stats(result.stats, opt.output_prefix + "_stats.csv");
    printf("permuted %zu edges in %lfs\n", result.edges.size(), timer.duration());
}

int main(int argc, char** argv)
{
    MPI_Instance mpi_instance(&argc, &argv);

    PermuteOptionHelper opt;
    opt.parse(argc, argv);

    // Permutation is not distributed, the other ranks have nothing to do.
    if (!is_master_process())
    {
        return 0;
    }

    try
    {
        run(opt);
    }
    catch (std::exception const& e)
    {
        fprintf(stderr, "[error] %s\n", e.what());
        return 1;
    }
    return 0;
}
