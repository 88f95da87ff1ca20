#include <hetfeat/degree_weight.hpp>
#include <hetfeat/error.hpp>
#include <hetfeat/extractor.hpp>
#include <hetfeat/mpi_helper.hpp>
#include <hetfeat/path_count.hpp>
#include <hetfeat/util.hpp>

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace hetfeat
{

FeatureExtractor::FeatureExtractor(HetNetwork network, ExtractorConfig conf)
: m_network(std::move(network))
, m_conf(std::move(conf))
, m_metagraph(build_metagraph(m_network))
, m_metapaths(load_metapaths())
, m_matrices(MatrixCache::build(m_network, m_metagraph, m_conf.w, m_conf.verbose))
{
    for (size_t m_i = 0; m_i < m_metapaths.size(); m_i++)
    {
        m_metapath_index.emplace(m_metapaths[m_i].abbrev, m_i);
    }
}

MetapathCatalog FeatureExtractor::load_metapaths() const
{
    if (!m_conf.catalog_path.empty())
    {
        return read_metapath_catalog(m_conf.catalog_path);
    }
    return m_metagraph.extract_metapaths(m_conf.start_kind, m_conf.end_kind, m_conf.max_length);
}

std::vector<std::string> FeatureExtractor::get_metapath_abbrevs() const
{
    std::vector<std::string> ret;
    ret.reserve(m_metapaths.size());
    for (Metapath const& mp : m_metapaths)
    {
        ret.push_back(mp.abbrev);
    }
    return ret;
}

Metapath const* FeatureExtractor::find_metapath(std::string const& abbrev) const
{
    auto iter = m_metapath_index.find(abbrev);
    return iter == m_metapath_index.end() ? nullptr : &m_metapaths[iter->second];
}

FeatureTable FeatureExtractor::extract_dwpc(NodeSelector const& start,
                                            NodeSelector const& end,
                                            std::vector<std::string> const& metapaths) const
{
    return extract(Semantics::path, start, end, metapaths);
}

FeatureTable FeatureExtractor::extract_dwwc(NodeSelector const& start,
                                            NodeSelector const& end,
                                            std::vector<std::string> const& metapaths) const
{
    return extract(Semantics::walk, start, end, metapaths);
}

FeatureTable FeatureExtractor::extract(Semantics semantics,
                                       NodeSelector const& start,
                                       NodeSelector const& end,
                                       std::vector<std::string> const& metapaths) const
{
    Timer timer;
    NodeSelection const start_sel = resolve_selector(m_network, start);
    NodeSelection const end_sel = resolve_selector(m_network, end);

    std::vector<std::string> const names = metapaths.empty() ? get_metapath_abbrevs() : metapaths;
    FeatureTable table(start_sel, end_sel, names);

    std::vector<size_t> local_columns;
    for (size_t c_i = 0; c_i < names.size(); c_i++)
    {
        if (is_local_task(c_i))
        {
            local_columns.push_back(c_i);
        }
    }

    auto results = parallel_map<std::vector<real_t>>(
        local_columns.size(),
        [&](size_t t_i)
        {
            std::string const& name = names[local_columns[t_i]];
            Metapath const* mp = find_metapath(name);
            if (mp == nullptr)
            {
                throw std::out_of_range("metapath is not known to this extractor");
            }
            return restrict_product(count(*mp, m_matrices, semantics), start_sel, end_sel);
        },
        m_conf.parallel);

    // failed_on[c] is 1 + the rank whose computation of column c failed
    std::vector<int> failed_on(names.size(), 0);
    std::vector<std::string> causes(names.size());
    for (size_t t_i = 0; t_i < local_columns.size(); t_i++)
    {
        size_t const c_i = local_columns[t_i];
        TaskResult<std::vector<real_t>> const& result = results[t_i];
        if (result.ok())
        {
            table.set_column(c_i, result.value);
        }
        else if (result.status == TaskStatus::failed)
        {
            failed_on[c_i] = get_mpi_rank() + 1;
            causes[c_i] = result.error;
        }
    }

    allreduce_in_place(table.values().data(), table.values().size(), MPI_SUM);
    allreduce_in_place(failed_on.data(), failed_on.size(), MPI_MAX);

    for (size_t c_i = 0; c_i < names.size(); c_i++)
    {
        if (failed_on[c_i] == 0)
        {
            continue;
        }
        int const rank = failed_on[c_i] - 1;
        throw MetapathComputationError(names[c_i], rank == get_mpi_rank()
                                                       ? causes[c_i]
                                                       : "computation failed on rank " + std::to_string(rank));
    }

    if (m_conf.verbose && is_master_process())
    {
        printf("computed %s for %zu metapaths x %zu node pairs in %lfs\n",
               semantics == Semantics::path ? "DWPC" : "DWWC", names.size(), table.get_row_num(), timer.duration());
    }
    return table;
}

DegreeTable FeatureExtractor::extract_degrees(NodeSelector const& start, NodeSelector const& end) const
{
    NodeSelection const start_sel = resolve_selector(m_network, start);
    NodeSelection const end_sel = resolve_selector(m_network, end);

    struct DegreeColumn
    {
        std::string name;
        bool start_side;
        std::vector<degree_t> degrees;
    };

    // Abbreviation of a metaedge read from kind, empty when kind is not an endpoint.
    auto abbrev_from = [&](Metaedge const& edge, std::string const& kind) -> std::string
    {
        if (m_metagraph.get_metanode(edge.source).kind == kind)
        {
            return edge.abbrev;
        }
        if (m_metagraph.get_metanode(edge.target).kind == kind)
        {
            return m_metagraph.get_metaedge(edge.inverse).abbrev;
        }
        return std::string();
    };

    bool const same_kind = start_sel.kind == end_sel.kind;
    std::vector<DegreeColumn> columns;
    for (metaedge_id_t e_i : m_metagraph.get_declared_metaedges())
    {
        Metaedge const& edge = m_metagraph.get_metaedge(e_i);
        std::string const start_abbrev = abbrev_from(edge, start_sel.kind);
        if (!start_abbrev.empty())
        {
            columns.push_back(DegreeColumn{ start_abbrev, true, row_degrees(*m_matrices.get_adjacency(start_abbrev)) });
        }
        std::string const end_abbrev = abbrev_from(edge, end_sel.kind);
        if (!end_abbrev.empty())
        {
            columns.push_back(DegreeColumn{ same_kind ? end_abbrev + "_end" : end_abbrev, false,
                                            row_degrees(*m_matrices.get_adjacency(end_abbrev)) });
        }
    }
    std::sort(columns.begin(), columns.end(),
              [](DegreeColumn const& a, DegreeColumn const& b) { return a.name < b.name; });

    std::vector<std::string> names;
    for (DegreeColumn const& column : columns)
    {
        names.push_back(column.name);
    }

    DegreeTable table(start_sel, end_sel, names);
    size_t const end_num = end_sel.indices.size();
    for (size_t c_i = 0; c_i < columns.size(); c_i++)
    {
        DegreeColumn const& column = columns[c_i];
        for (size_t r_i = 0; r_i < table.get_row_num(); r_i++)
        {
            NodeIndex const node = column.start_side ? start_sel.indices[r_i / end_num] : end_sel.indices[r_i % end_num];
            table.at(r_i, c_i) = column.degrees[node];
        }
    }
    return table;
}

} // namespace hetfeat
