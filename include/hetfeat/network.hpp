#pragma once

#include <hetfeat/type.hpp>

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hetfeat
{

struct Node
{
    std::string id;
    std::string kind;

    Node() {}

    Node(std::string _id, std::string _kind)
    : id(std::move(_id))
    , kind(std::move(_kind))
    {
    }
};

struct Edge
{
    std::string start_id;
    std::string end_id;
    std::string type;

    Edge() {}

    Edge(std::string _start_id, std::string _end_id, std::string _type)
    : start_id(std::move(_start_id))
    , end_id(std::move(_end_id))
    , type(std::move(_type))
    {
    }

    bool friend operator==(Edge const& a, Edge const& b)
    {
        return a.start_id == b.start_id && a.end_id == b.end_id && a.type == b.type;
    }
};

using NodeTable = std::vector<Node>;
using EdgeTable = std::vector<Edge>;

//! Heterogeneous network with a dense node index 0..N-1 in node table order.
//! Everything here is immutable after construction and shared read-only by
//! the schema, matrix and feature code.
class HetNetwork
{
public:
    HetNetwork(NodeTable nodes, EdgeTable edges);

    NodeIndex get_node_num() const { return static_cast<NodeIndex>(m_nodes.size()); }

    bool contains(std::string const& node_id) const { return m_id_to_index.count(node_id) != 0; }

    //! Throws UnknownNodeReference when node_id is not part of the network.
    NodeIndex index_of(std::string const& node_id) const;

    std::string const& id_of(NodeIndex index) const { return m_nodes[index].id; }

    std::string const& kind_of(NodeIndex index) const { return m_nodes[index].kind; }

    bool has_kind(std::string const& kind) const { return m_kind_indices.count(kind) != 0; }

    std::vector<NodeIndex> const& indices_of_kind(std::string const& kind) const;

    //! Node kinds in order of first appearance.
    std::vector<std::string> const& kinds() const { return m_kinds; }

    //! Edge types in order of first appearance.
    std::vector<std::string> const& edge_types() const { return m_edge_types; }

    EdgeTable const& edges_of_type(std::string const& type) const;

    EdgeTable const& edges() const { return m_edges; }

    NodeTable const& nodes() const { return m_nodes; }

private:
    NodeTable m_nodes;
    EdgeTable m_edges;

    std::unordered_map<std::string, NodeIndex> m_id_to_index;
    std::vector<std::string> m_kinds;
    std::unordered_map<std::string, std::vector<NodeIndex>> m_kind_indices;

    std::vector<std::string> m_edge_types;
    std::unordered_map<std::string, EdgeTable> m_typed_edges;
};

} // namespace hetfeat
