#include "option_helper.hpp"

#include <hetfeat/extractor.hpp>
#include <hetfeat/metapath.hpp>
#include <hetfeat/mpi_helper.hpp>
#include <hetfeat/storage.hpp>
#include <hetfeat/util.hpp>

#include <cstdio>
#include <exception>
#include <utility>

using namespace hetfeat;

void run(ExtractOptionHelper const& opt)
{
    Timer timer;
    HetNetwork network(read_node_table(opt.nodes_path), read_edge_table(opt.edges_path));
    if (opt.verbose && is_master_process())
    {
        printf("loaded %u nodes and %zu edges in %lfs\n", network.get_node_num(), network.edges().size(),
               timer.duration());
    }

    ExtractorConfig conf;
    conf.start_kind = opt.start_kind;
    conf.end_kind = opt.end_kind;
    conf.max_length = opt.max_length;
    conf.w = opt.damping;
    conf.catalog_path = opt.catalog_path;
    conf.parallel.worker_num = opt.thread_num;
    conf.parallel.fail_fast = opt.fail_fast;
    conf.verbose = opt.verbose;
    FeatureExtractor extractor(std::move(network), conf);

    if (opt.verbose && is_master_process())
    {
        printf("%zu metapaths from %s to %s\n", extractor.get_metapaths().size(), opt.start_kind.c_str(),
               opt.end_kind.c_str());
    }
    // Output is written by the master only. run_on_master() lets the other
    // ranks fail with it instead of waiting in the next extraction.
    if (!opt.write_catalog_path.empty())
    {
        run_on_master([&]() { write_metapath_catalog(extractor.get_metapaths(), opt.write_catalog_path); });
    }

    NodeSelector const start = NodeSelector::of_kind(opt.start_kind);
    NodeSelector const end = NodeSelector::of_kind(opt.end_kind);
    for (std::string const& feature : opt.features)
    {
        std::string const path = opt.output_prefix + "_" + feature + ".csv";
        if (feature == "degrees")
        {
            DegreeTable const table = extractor.extract_degrees(start, end);
            run_on_master([&]() { write_degree_table(table, path); });
            continue;
        }

        FeatureTable const table = feature == "dwpc" ? extractor.extract_dwpc(start, end) : extractor.extract_dwwc(start, end);
        run_on_master([&]() { write_feature_table(table, path); });
    }

    if (opt.verbose && is_master_process())
    {
        printf("total time %lfs\n", timer.duration());
    }
}

int main(int argc, char** argv)
{
    MPI_Instance mpi_instance(&argc, &argv);

    ExtractOptionHelper opt;
    opt.parse(argc, argv);

    try
    {
        run(opt);
    }
    catch (std::exception const& e)
    {
        // Every rank fails with the same error.
        if (is_master_process())
        {
            fprintf(stderr, "[error] %s\n", e.what());
        }
        return 1;
    }
    return 0;
}
