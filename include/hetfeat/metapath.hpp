#pragma once

#include <hetfeat/schema.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace hetfeat
{

struct Metapath
{
    std::string abbrev;
    uint32_t length;
    //! Display names such as "Compound - binds - Gene".
    std::vector<std::string> edges;
    std::vector<std::string> edge_abbrevs;
    //! Abbreviations of the forward form of each metaedge, used to match
    //! externally published metapath sets.
    std::vector<std::string> standard_edge_abbrevs;

    //! Node codes visited in order, length + 1 entries. Throws
    //! SchemaParseError when consecutive metaedges do not share a node code.
    std::vector<std::string> metanode_abbrevs() const;
};

using MetapathCatalog = std::vector<Metapath>;

//! "CbG", "GaD" -> "CbGaD": the node code shared by consecutive metaedges is
//! written once.
std::string metapath_abbrev(std::vector<std::string> const& edge_abbrevs);

//! Reads a metapaths.json catalog: a list of records with the keys
//! abbreviation, length, edges, edge_abbreviations and
//! standard_edge_abbreviations. Other keys are ignored. Records are taken as
//! they are, nothing is checked against a metagraph.
MetapathCatalog read_metapath_catalog(std::string const& path);

void write_metapath_catalog(MetapathCatalog const& catalog, std::string const& path);

} // namespace hetfeat
