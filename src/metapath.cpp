#include <hetfeat/error.hpp>
#include <hetfeat/metapath.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <stdexcept>
#include <unordered_set>

namespace hetfeat
{

std::vector<std::string> Metapath::metanode_abbrevs() const
{
    std::vector<std::string> ret;
    for (std::string const& edge_abbrev : edge_abbrevs)
    {
        MetaedgeAbbrev const parsed = parse_metaedge_abbrev(edge_abbrev);
        if (ret.empty())
        {
            ret.push_back(parsed.source);
        }
        else if (ret.back() != parsed.source)
        {
            throw SchemaParseError("metapath '" + abbrev + "' breaks at metaedge '" + edge_abbrev + "'");
        }
        ret.push_back(parsed.target);
    }
    return ret;
}

std::string metapath_abbrev(std::vector<std::string> const& edge_abbrevs)
{
    std::string ret;
    for (std::string const& edge_abbrev : edge_abbrevs)
    {
        if (ret.empty())
        {
            ret = edge_abbrev;
        }
        else
        {
            ret += edge_abbrev.substr(parse_metaedge_abbrev(edge_abbrev).source.size());
        }
    }
    return ret;
}

Metapath MetaGraph::get_metapath(std::vector<metaedge_id_t> const& edges) const
{
    Metapath mp;
    mp.length = static_cast<uint32_t>(edges.size());
    for (metaedge_id_t e_id : edges)
    {
        Metaedge const& edge = m_metaedges[e_id];
        mp.edges.push_back(edge.name);
        mp.edge_abbrevs.push_back(edge.abbrev);
        mp.standard_edge_abbrevs.push_back(edge.standard_abbrev);
    }
    mp.abbrev = metapath_abbrev(mp.edge_abbrevs);
    return mp;
}

std::vector<Metapath>
MetaGraph::extract_metapaths(std::string const& start_kind, std::string const& end_kind, uint32_t max_length) const
{
    if (max_length < 1)
    {
        throw std::invalid_argument("max_length must be at least 1");
    }

    std::vector<Metapath> ret;
    if (!has_metanode(start_kind) || !has_metanode(end_kind))
    {
        return ret;
    }
    metanode_id_t const end = get_metanode_id(end_kind);

    std::vector<std::vector<metaedge_id_t>> previous;
    for (metaedge_id_t e_id : m_metanodes[get_metanode_id(start_kind)].out_edges)
    {
        previous.push_back({ e_id });
    }

    // Length 1 metapaths are the prediction target itself, so collection
    // starts at depth 2.
    for (uint32_t depth = 2; depth <= max_length; depth++)
    {
        std::vector<std::vector<metaedge_id_t>> current;
        for (auto const& path : previous)
        {
            metanode_id_t const last = m_metaedges[path.back()].target;
            for (metaedge_id_t e_id : m_metanodes[last].out_edges)
            {
                current.push_back(path);
                current.back().push_back(e_id);
            }
        }
        for (auto const& path : current)
        {
            if (m_metaedges[path.back()].target == end)
            {
                ret.push_back(get_metapath(path));
            }
        }
        previous.swap(current);
    }
    return ret;
}

MetapathCatalog read_metapath_catalog(std::string const& path)
{
    std::ifstream input(path);
    if (!input)
    {
        throw StorageError("cannot open metapath catalog '" + path + "'");
    }

    nlohmann::json document;
    try
    {
        input >> document;
    }
    catch (nlohmann::json::parse_error const& e)
    {
        throw CatalogParseError(0, e.what());
    }
    if (!document.is_array())
    {
        throw CatalogParseError(0, "expected a list of metapaths");
    }

    MetapathCatalog catalog;
    std::unordered_set<std::string> seen;
    size_t record = 0;
    for (nlohmann::json const& entry : document)
    {
        record++;
        Metapath mp;
        try
        {
            mp.abbrev = entry.at("abbreviation").get<std::string>();
            mp.length = entry.at("length").get<uint32_t>();
            mp.edges = entry.at("edges").get<std::vector<std::string>>();
            mp.edge_abbrevs = entry.at("edge_abbreviations").get<std::vector<std::string>>();
            mp.standard_edge_abbrevs = entry.at("standard_edge_abbreviations").get<std::vector<std::string>>();
        }
        catch (nlohmann::json::exception const& e)
        {
            throw CatalogParseError(record, e.what());
        }

        if (mp.abbrev.empty() || mp.edges.size() != mp.length || mp.edge_abbrevs.size() != mp.length ||
            mp.standard_edge_abbrevs.size() != mp.length)
        {
            throw CatalogParseError(record, "metapath '" + mp.abbrev + "' does not list " +
                                                std::to_string(mp.length) + " metaedges");
        }
        if (!seen.insert(mp.abbrev).second)
        {
            throw CatalogParseError(record, "metapath '" + mp.abbrev + "' is listed twice");
        }
        catalog.push_back(std::move(mp));
    }
    return catalog;
}

void write_metapath_catalog(MetapathCatalog const& catalog, std::string const& path)
{
    nlohmann::json document = nlohmann::json::array();
    for (Metapath const& mp : catalog)
    {
        nlohmann::json entry;
        entry["abbreviation"] = mp.abbrev;
        entry["length"] = mp.length;
        entry["edges"] = mp.edges;
        entry["edge_abbreviations"] = mp.edge_abbrevs;
        entry["standard_edge_abbreviations"] = mp.standard_edge_abbrevs;
        document.push_back(entry);
    }

    std::ofstream output(path);
    if (!output)
    {
        throw StorageError("cannot open metapath catalog '" + path + "' for writing");
    }
    output << document.dump(2) << '\n';
    if (!output)
    {
        throw StorageError("failed writing metapath catalog '" + path + "'");
    }
}

} // namespace hetfeat
