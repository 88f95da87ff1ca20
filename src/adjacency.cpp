#include <hetfeat/adjacency.hpp>
#include <hetfeat/degree_weight.hpp>
#include <hetfeat/error.hpp>
#include <hetfeat/mpi_helper.hpp>
#include <hetfeat/util.hpp>

#include <algorithm>
#include <cstdio>
#include <memory>

namespace hetfeat
{

SparseMatrix build_adjacency_matrix(HetNetwork const& network, std::string const& edge_type, bool directed)
{
    EdgeTable const& edges = network.edges_of_type(edge_type);

    std::vector<Eigen::Triplet<real_t, int64_t>> entries;
    entries.reserve(directed ? edges.size() : edges.size() * 2);
    for (Edge const& e : edges)
    {
        NodeIndex const src = network.index_of(e.start_id);
        NodeIndex const dst = network.index_of(e.end_id);
        entries.emplace_back(src, dst, 1);
        if (!directed)
        {
            entries.emplace_back(dst, src, 1);
        }
    }

    int64_t const v_num = network.get_node_num();
    SparseMatrix mat(v_num, v_num);
    // Repeated edges collapse to a single 1.
    mat.setFromTriplets(entries.begin(), entries.end(), [](real_t const& a, real_t const&) { return a; });
    return mat;
}

MatrixCache MatrixCache::build(HetNetwork const& network, MetaGraph const& metagraph, real_t w, bool verbose)
{
    Timer timer;
    MatrixCache cache;
    cache.m_w = w;

    for (metaedge_id_t e_id : metagraph.get_declared_metaedges())
    {
        Metaedge const& edge = metagraph.get_metaedge(e_id);
        bool const directed = is_directed(edge.direction);

        auto adjacency = std::make_shared<SparseMatrix const>(build_adjacency_matrix(network, edge.edge_type, directed));
        auto weighted = std::make_shared<SparseMatrix const>(weight_by_degree(*adjacency, w, directed));
        cache.m_adjacency[edge.abbrev] = adjacency;
        cache.m_weighted[edge.abbrev] = weighted;

        if (edge.inverse == e_id)
        {
            continue;
        }
        std::string const& inverse = metagraph.get_metaedge(edge.inverse).abbrev;
        if (directed)
        {
            cache.m_adjacency[inverse] = std::make_shared<SparseMatrix const>(SparseMatrix(adjacency->transpose()));
            cache.m_weighted[inverse] = std::make_shared<SparseMatrix const>(SparseMatrix(weighted->transpose()));
        }
        else
        {
            // Symmetric, the inverse shares the instance.
            cache.m_adjacency[inverse] = adjacency;
            cache.m_weighted[inverse] = weighted;
        }
    }

    if (verbose && is_master_process())
    {
        printf("built %zu adjacency matrices (w = %.2f) in %lfs\n", cache.m_adjacency.size(), w, timer.duration());
    }
    return cache;
}

SharedMatrix const& MatrixCache::get_adjacency(std::string const& abbrev) const
{
    auto iter = m_adjacency.find(abbrev);
    if (iter == m_adjacency.end())
    {
        throw UnknownMetaedge(abbrev);
    }
    return iter->second;
}

SharedMatrix const& MatrixCache::get_weighted(std::string const& abbrev) const
{
    auto iter = m_weighted.find(abbrev);
    if (iter == m_weighted.end())
    {
        throw UnknownMetaedge(abbrev);
    }
    return iter->second;
}

std::vector<std::string> MatrixCache::get_abbrevs() const
{
    std::vector<std::string> ret;
    for (auto const& entry : m_adjacency)
    {
        ret.push_back(entry.first);
    }
    std::sort(ret.begin(), ret.end());
    return ret;
}

} // namespace hetfeat
