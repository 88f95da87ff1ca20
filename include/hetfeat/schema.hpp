#pragma once

#include <hetfeat/network.hpp>
#include <hetfeat/type.hpp>

#include <string>
#include <unordered_map>
#include <vector>

namespace hetfeat
{

struct Metapath;

//! The three codes packed into a metaedge abbreviation such as "CbG",
//! "Gr>G" or "G<rG".
struct MetaedgeAbbrev
{
    std::string source;
    std::string kind;
    std::string target;
    Direction direction;

    std::string str() const;
};

struct EdgeTypeName
{
    //! Human readable predicate, everything before the final '_'.
    std::string name;
    std::string abbrev;
    MetaedgeAbbrev parsed;
};

//! The only place that understands the abbreviation convention
//! SUBJECT[<]predicate[>]OBJECT. Throws SchemaParseError on anything else.
MetaedgeAbbrev parse_metaedge_abbrev(std::string const& abbrev);

//! Splits "binds_CbG" into name "binds" and abbreviation "CbG". A type without
//! '_' is taken as a bare abbreviation and named after its predicate code.
EdgeTypeName parse_edge_type(std::string const& type);

MetaedgeAbbrev inverse(MetaedgeAbbrev const& abbrev);

std::string inverse_abbrev(std::string const& abbrev);

Direction inverse_direction(Direction direction);

char const* direction_name(Direction direction);

inline bool is_directed(Direction direction) { return direction != Direction::both; }

struct Metanode
{
    std::string kind;
    std::string abbrev;
    //! Declared metaedges and inverses whose source is this kind, in
    //! declaration order.
    std::vector<metaedge_id_t> out_edges;
};

struct Metaedge
{
    metanode_id_t source;
    metanode_id_t target;
    std::string kind;
    std::string kind_abbrev;
    Direction direction;
    bool inverted;
    metaedge_id_t inverse;
    //! Edge type string of the declared metaedge of this pair.
    std::string edge_type;
    std::string abbrev;
    std::string standard_abbrev;
    std::string name;
};

//! Schema graph: metanodes are node kinds, metaedges are edge types plus their
//! inverses. Metaedges live in an arena and refer to each other by index.
class MetaGraph
{
public:
    //! Returns the existing id when kind is already known with the same code.
    metanode_id_t add_metanode(std::string const& kind, std::string const& abbrev);

    //! Adds a declared metaedge and its inverse, returns the declared id. An
    //! undirected metaedge between a kind and itself is its own inverse.
    metaedge_id_t add_metaedge(std::string const& source_kind,
                               std::string const& target_kind,
                               std::string const& kind,
                               std::string const& kind_abbrev,
                               Direction direction,
                               std::string const& edge_type);

    size_t get_metanode_num() const { return m_metanodes.size(); }

    size_t get_metaedge_num() const { return m_metaedges.size(); }

    Metanode const& get_metanode(metanode_id_t id) const { return m_metanodes[id]; }

    Metaedge const& get_metaedge(metaedge_id_t id) const { return m_metaedges[id]; }

    bool has_metanode(std::string const& kind) const { return m_kind_index.count(kind) != 0; }

    metanode_id_t get_metanode_id(std::string const& kind) const;

    //! nullptr when no metaedge (declared or inverse) has this abbreviation.
    Metaedge const* find_metaedge(std::string const& abbrev) const;

    //! Declared metaedge of an edge type string such as "binds_CbG", nullptr
    //! when the type is unknown.
    Metaedge const* find_metaedge_by_type(std::string const& edge_type) const;

    //! Declared metaedges in declaration order, inverses excluded.
    std::vector<metaedge_id_t> get_declared_metaedges() const;

    Metapath get_metapath(std::vector<metaedge_id_t> const& edges) const;

    //! Every metapath of length 2..max_length from start_kind to end_kind,
    //! ordered by length, then by extension order. Empty when either kind
    //! has no metaedges.
    std::vector<Metapath> extract_metapaths(std::string const& start_kind,
                                            std::string const& end_kind,
                                            uint32_t max_length) const;

private:
    std::string metaedge_name(metanode_id_t source, metanode_id_t target, std::string const& kind, Direction direction) const;

    void register_abbrev(std::string const& abbrev, metaedge_id_t id);

    std::vector<Metanode> m_metanodes;
    std::vector<Metaedge> m_metaedges;
    std::unordered_map<std::string, metanode_id_t> m_kind_index;
    std::unordered_map<std::string, metanode_id_t> m_node_abbrev_index;
    std::unordered_map<std::string, metaedge_id_t> m_edge_abbrev_index;
    std::unordered_map<std::string, metaedge_id_t> m_edge_type_index;
};

//! Recovers the schema from the flat edge type vocabulary of a network. The
//! kinds behind the two node codes of a type come from its first edge.
MetaGraph build_metagraph(HetNetwork const& network);

} // namespace hetfeat
