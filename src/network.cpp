#include <hetfeat/error.hpp>
#include <hetfeat/network.hpp>

#include <stdexcept>

namespace hetfeat
{

HetNetwork::HetNetwork(NodeTable nodes, EdgeTable edges)
: m_nodes(std::move(nodes))
, m_edges(std::move(edges))
{
    m_id_to_index.reserve(m_nodes.size());
    for (NodeIndex v_i = 0; v_i < m_nodes.size(); v_i++)
    {
        Node const& node = m_nodes[v_i];
        if (!m_id_to_index.emplace(node.id, v_i).second)
        {
            throw DuplicateNodeIdentifier(node.id);
        }

        auto kind_iter = m_kind_indices.find(node.kind);
        if (kind_iter == m_kind_indices.end())
        {
            m_kinds.push_back(node.kind);
            kind_iter = m_kind_indices.emplace(node.kind, std::vector<NodeIndex>{}).first;
        }
        kind_iter->second.push_back(v_i);
    }

    // Endpoints are not checked here, the adjacency builder reports them
    // together with the offending edge type.
    for (Edge const& e : m_edges)
    {
        auto type_iter = m_typed_edges.find(e.type);
        if (type_iter == m_typed_edges.end())
        {
            m_edge_types.push_back(e.type);
            type_iter = m_typed_edges.emplace(e.type, EdgeTable{}).first;
        }
        type_iter->second.push_back(e);
    }
}

NodeIndex HetNetwork::index_of(std::string const& node_id) const
{
    auto iter = m_id_to_index.find(node_id);
    if (iter == m_id_to_index.end())
    {
        throw UnknownNodeReference(node_id);
    }
    return iter->second;
}

std::vector<NodeIndex> const& HetNetwork::indices_of_kind(std::string const& kind) const
{
    auto iter = m_kind_indices.find(kind);
    if (iter == m_kind_indices.end())
    {
        throw std::out_of_range("unknown node kind '" + kind + "'");
    }
    return iter->second;
}

EdgeTable const& HetNetwork::edges_of_type(std::string const& type) const
{
    auto iter = m_typed_edges.find(type);
    if (iter == m_typed_edges.end())
    {
        throw std::out_of_range("unknown edge type '" + type + "'");
    }
    return iter->second;
}

} // namespace hetfeat
