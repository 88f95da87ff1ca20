#pragma once

#include <hetfeat/adjacency.hpp>
#include <hetfeat/constants.hpp>
#include <hetfeat/feature_table.hpp>
#include <hetfeat/metapath.hpp>
#include <hetfeat/network.hpp>
#include <hetfeat/parallel.hpp>
#include <hetfeat/schema.hpp>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace hetfeat
{

struct ExtractorConfig
{
    std::string start_kind;
    std::string end_kind;
    uint32_t max_length = default_max_length;
    //! Dampening exponent of the degree weighting.
    real_t w = default_damping;
    //! When set, the catalog replaces metapath enumeration and start_kind,
    //! end_kind and max_length are not used.
    std::string catalog_path;
    ParallelConfig parallel;
    bool verbose = false;
};

//! Degree-weighted path and walk counts of a network. The constructor does all
//! the shared work (schema, metapaths, matrices); the extract functions only
//! read it and may be called repeatedly.
//!
//! Every extract call is collective over MPI_COMM_WORLD: metapath i is
//! computed by rank i mod size and every rank returns the full table.
class FeatureExtractor
{
public:
    FeatureExtractor(HetNetwork network, ExtractorConfig conf);

    //! DWPC for the given metapaths, all known metapaths when empty. Throws
    //! InvalidSelector before computing anything, MetapathComputationError
    //! naming the first metapath (in request order) whose computation failed.
    FeatureTable extract_dwpc(NodeSelector const& start,
                              NodeSelector const& end,
                              std::vector<std::string> const& metapaths = {}) const;

    FeatureTable extract_dwwc(NodeSelector const& start,
                              NodeSelector const& end,
                              std::vector<std::string> const& metapaths = {}) const;

    //! Degree of every start and end node along each metaedge incident to the
    //! start or end kind. Columns sorted by name.
    DegreeTable extract_degrees(NodeSelector const& start, NodeSelector const& end) const;

    std::vector<std::string> get_metapath_abbrevs() const;

    MetapathCatalog const& get_metapaths() const { return m_metapaths; }

    Metapath const* find_metapath(std::string const& abbrev) const;

    HetNetwork const& get_network() const { return m_network; }

    MetaGraph const& get_metagraph() const { return m_metagraph; }

    MatrixCache const& get_matrices() const { return m_matrices; }

    ExtractorConfig const& get_config() const { return m_conf; }

private:
    FeatureTable extract(Semantics semantics,
                         NodeSelector const& start,
                         NodeSelector const& end,
                         std::vector<std::string> const& metapaths) const;

    MetapathCatalog load_metapaths() const;

    HetNetwork m_network;
    ExtractorConfig m_conf;
    MetaGraph m_metagraph;
    MetapathCatalog m_metapaths;
    std::unordered_map<std::string, size_t> m_metapath_index;
    MatrixCache m_matrices;
};

} // namespace hetfeat
