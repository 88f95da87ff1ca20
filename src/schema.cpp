#include <hetfeat/error.hpp>
#include <hetfeat/metapath.hpp>
#include <hetfeat/schema.hpp>

namespace hetfeat
{

namespace
{

bool is_upper(char c) { return c >= 'A' && c <= 'Z'; }

bool is_lower(char c) { return c >= 'a' && c <= 'z'; }

std::string format_abbrev(std::string const& source, std::string const& kind, std::string const& target, Direction direction)
{
    switch (direction)
    {
    case Direction::forward:
        return source + kind + '>' + target;
    case Direction::backward:
        return source + '<' + kind + target;
    default:
        return source + kind + target;
    }
}

} // namespace

std::string MetaedgeAbbrev::str() const { return format_abbrev(source, kind, target, direction); }

MetaedgeAbbrev parse_metaedge_abbrev(std::string const& abbrev)
{
    size_t pos = 0;
    auto take = [&](bool (*accept)(char))
    {
        size_t const begin = pos;
        while (pos < abbrev.size() && accept(abbrev[pos]))
        {
            pos++;
        }
        return abbrev.substr(begin, pos - begin);
    };
    auto skip = [&](char marker)
    {
        if (pos < abbrev.size() && abbrev[pos] == marker)
        {
            pos++;
            return true;
        }
        return false;
    };

    MetaedgeAbbrev ret;
    ret.source = take(is_upper);
    bool const backward = skip('<');
    ret.kind = take(is_lower);
    bool const forward = skip('>');
    ret.target = take(is_upper);

    if (ret.source.empty() || ret.kind.empty() || ret.target.empty() || pos != abbrev.size() || (forward && backward))
    {
        throw SchemaParseError("cannot parse metaedge abbreviation '" + abbrev + "'");
    }
    ret.direction = forward ? Direction::forward : (backward ? Direction::backward : Direction::both);
    return ret;
}

EdgeTypeName parse_edge_type(std::string const& type)
{
    EdgeTypeName ret;
    size_t const split_pos = type.rfind('_');
    if (split_pos == std::string::npos)
    {
        ret.abbrev = type;
    }
    else
    {
        ret.name = type.substr(0, split_pos);
        ret.abbrev = type.substr(split_pos + 1);
    }

    try
    {
        ret.parsed = parse_metaedge_abbrev(ret.abbrev);
    }
    catch (SchemaParseError const&)
    {
        throw SchemaParseError("edge type '" + type + "' does not end in a metaedge abbreviation");
    }

    if (ret.name.empty())
    {
        ret.name = ret.parsed.kind;
    }
    return ret;
}

Direction inverse_direction(Direction direction)
{
    switch (direction)
    {
    case Direction::forward:
        return Direction::backward;
    case Direction::backward:
        return Direction::forward;
    default:
        return Direction::both;
    }
}

MetaedgeAbbrev inverse(MetaedgeAbbrev const& abbrev)
{
    return MetaedgeAbbrev{ abbrev.target, abbrev.kind, abbrev.source, inverse_direction(abbrev.direction) };
}

std::string inverse_abbrev(std::string const& abbrev) { return inverse(parse_metaedge_abbrev(abbrev)).str(); }

char const* direction_name(Direction direction)
{
    switch (direction)
    {
    case Direction::forward:
        return "forward";
    case Direction::backward:
        return "backward";
    default:
        return "both";
    }
}

metanode_id_t MetaGraph::add_metanode(std::string const& kind, std::string const& abbrev)
{
    auto kind_iter = m_kind_index.find(kind);
    if (kind_iter != m_kind_index.end())
    {
        Metanode const& known = m_metanodes[kind_iter->second];
        if (known.abbrev != abbrev)
        {
            throw SchemaParseError("node kind '" + kind + "' is abbreviated both as '" + known.abbrev + "' and '" +
                                   abbrev + "'");
        }
        return kind_iter->second;
    }

    auto abbrev_iter = m_node_abbrev_index.find(abbrev);
    if (abbrev_iter != m_node_abbrev_index.end())
    {
        throw SchemaParseError("node code '" + abbrev + "' is used by both '" + m_metanodes[abbrev_iter->second].kind +
                               "' and '" + kind + "'");
    }

    metanode_id_t const id = static_cast<metanode_id_t>(m_metanodes.size());
    m_metanodes.push_back(Metanode{ kind, abbrev, {} });
    m_kind_index.emplace(kind, id);
    m_node_abbrev_index.emplace(abbrev, id);
    return id;
}

std::string
MetaGraph::metaedge_name(metanode_id_t source, metanode_id_t target, std::string const& kind, Direction direction) const
{
    std::string const separator = direction == Direction::forward ? " > " : (direction == Direction::backward ? " < " : " - ");
    return m_metanodes[source].kind + separator + kind + separator + m_metanodes[target].kind;
}

void MetaGraph::register_abbrev(std::string const& abbrev, metaedge_id_t id)
{
    if (!m_edge_abbrev_index.emplace(abbrev, id).second)
    {
        throw SchemaParseError("metaedge abbreviation '" + abbrev + "' is declared twice");
    }
}

metaedge_id_t MetaGraph::add_metaedge(std::string const& source_kind,
                                      std::string const& target_kind,
                                      std::string const& kind,
                                      std::string const& kind_abbrev,
                                      Direction direction,
                                      std::string const& edge_type)
{
    metanode_id_t const source = get_metanode_id(source_kind);
    metanode_id_t const target = get_metanode_id(target_kind);

    MetaedgeAbbrev const declared_abbrev{ m_metanodes[source].abbrev, kind_abbrev, m_metanodes[target].abbrev, direction };
    MetaedgeAbbrev const inverted_abbrev = inverse(declared_abbrev);
    bool const self_inverse = source == target && direction == Direction::both;

    // Standard form of the pair is the one that does not read backward.
    std::string const standard_abbrev =
        direction == Direction::backward ? inverted_abbrev.str() : declared_abbrev.str();

    metaedge_id_t const declared_id = static_cast<metaedge_id_t>(m_metaedges.size());
    metaedge_id_t const inverse_id = self_inverse ? declared_id : declared_id + 1;

    if (m_edge_type_index.count(edge_type) != 0)
    {
        throw SchemaParseError("edge type '" + edge_type + "' is declared twice");
    }
    register_abbrev(declared_abbrev.str(), declared_id);
    if (!self_inverse)
    {
        register_abbrev(inverted_abbrev.str(), inverse_id);
    }
    m_edge_type_index.emplace(edge_type, declared_id);

    Metaedge declared;
    declared.source = source;
    declared.target = target;
    declared.kind = kind;
    declared.kind_abbrev = kind_abbrev;
    declared.direction = direction;
    declared.inverted = false;
    declared.inverse = inverse_id;
    declared.edge_type = edge_type;
    declared.abbrev = declared_abbrev.str();
    declared.standard_abbrev = standard_abbrev;
    declared.name = metaedge_name(source, target, kind, direction);
    m_metaedges.push_back(declared);
    m_metanodes[source].out_edges.push_back(declared_id);

    if (!self_inverse)
    {
        Metaedge inverted = declared;
        inverted.source = target;
        inverted.target = source;
        inverted.direction = inverted_abbrev.direction;
        inverted.inverted = true;
        inverted.inverse = declared_id;
        inverted.abbrev = inverted_abbrev.str();
        inverted.name = metaedge_name(target, source, kind, inverted_abbrev.direction);
        m_metaedges.push_back(inverted);
        m_metanodes[target].out_edges.push_back(inverse_id);
    }

    return declared_id;
}

metanode_id_t MetaGraph::get_metanode_id(std::string const& kind) const
{
    auto iter = m_kind_index.find(kind);
    if (iter == m_kind_index.end())
    {
        throw SchemaParseError("node kind '" + kind + "' is not part of the metagraph");
    }
    return iter->second;
}

Metaedge const* MetaGraph::find_metaedge(std::string const& abbrev) const
{
    auto iter = m_edge_abbrev_index.find(abbrev);
    return iter == m_edge_abbrev_index.end() ? nullptr : &m_metaedges[iter->second];
}

Metaedge const* MetaGraph::find_metaedge_by_type(std::string const& edge_type) const
{
    auto iter = m_edge_type_index.find(edge_type);
    return iter == m_edge_type_index.end() ? nullptr : &m_metaedges[iter->second];
}

std::vector<metaedge_id_t> MetaGraph::get_declared_metaedges() const
{
    std::vector<metaedge_id_t> ret;
    for (metaedge_id_t e_i = 0; e_i < m_metaedges.size(); e_i++)
    {
        if (!m_metaedges[e_i].inverted)
        {
            ret.push_back(e_i);
        }
    }
    return ret;
}

MetaGraph build_metagraph(HetNetwork const& network)
{
    MetaGraph metagraph;
    for (std::string const& type : network.edge_types())
    {
        EdgeTypeName const type_name = parse_edge_type(type);

        Edge const& first = network.edges_of_type(type).front();
        std::string const& start_kind = network.kind_of(network.index_of(first.start_id));
        std::string const& end_kind = network.kind_of(network.index_of(first.end_id));

        metagraph.add_metanode(start_kind, type_name.parsed.source);
        metagraph.add_metanode(end_kind, type_name.parsed.target);
        metagraph.add_metaedge(start_kind, end_kind, type_name.name, type_name.parsed.kind, type_name.parsed.direction,
                               type);
    }
    return metagraph;
}

} // namespace hetfeat
