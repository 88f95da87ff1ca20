#pragma once

#include <hetfeat/network.hpp>
#include <hetfeat/schema.hpp>
#include <hetfeat/type.hpp>

#include <string>
#include <unordered_map>
#include <vector>

namespace hetfeat
{

//! N x N 0/1 matrix over the full node index of network for the edges of one
//! type. Undirected types set (i, j) and (j, i). Throws UnknownNodeReference
//! when an edge endpoint is not a node of network.
SparseMatrix build_adjacency_matrix(HetNetwork const& network, std::string const& edge_type, bool directed);

//! Adjacency and degree-weighted matrices keyed by metaedge abbreviation,
//! inverse abbreviations included. Built once, afterwards only read, so the
//! counting workers share it without locking.
class MatrixCache
{
public:
    static MatrixCache build(HetNetwork const& network, MetaGraph const& metagraph, real_t w, bool verbose = false);

    bool contains(std::string const& abbrev) const { return m_adjacency.count(abbrev) != 0; }

    //! Throws UnknownMetaedge for an abbreviation without matrices.
    SharedMatrix const& get_adjacency(std::string const& abbrev) const;

    SharedMatrix const& get_weighted(std::string const& abbrev) const;

    real_t get_damping() const { return m_w; }

    //! Sorted abbreviations with matrices.
    std::vector<std::string> get_abbrevs() const;

private:
    MatrixCache() = default;

    real_t m_w = 0;
    std::unordered_map<std::string, SharedMatrix> m_adjacency;
    std::unordered_map<std::string, SharedMatrix> m_weighted;
};

} // namespace hetfeat
