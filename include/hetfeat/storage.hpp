#pragma once

#include <hetfeat/feature_table.hpp>
#include <hetfeat/network.hpp>
#include <hetfeat/permute.hpp>

#include <string>
#include <vector>

namespace hetfeat
{

//! Header of a neo4j import table to a plain column name: ":ID" -> "id",
//! ":START_ID" -> "start_id", "name:STRING" -> "name". Lower case.
std::string normalize_column_name(std::string const& column);

//! Splits one comma separated line. Fields may be double-quoted, a doubled
//! quote inside a quoted field is a literal quote.
std::vector<std::string> parse_csv_line(std::string const& line);

//! Needs columns id and label after normalization. Throws StorageError.
NodeTable read_node_table(std::string const& path);

//! Needs columns start_id, end_id and type after normalization. Rows with
//! one of them empty are dropped. Throws StorageError.
EdgeTable read_edge_table(std::string const& path);

//! Like read_edge_table() for tables matched on (start_id, end_id) only, such
//! as the excluded edges of a permutation. The type column is optional and
//! left empty when missing.
EdgeTable read_edge_pairs(std::string const& path);

void write_feature_table(FeatureTable const& table, std::string const& path);

void write_degree_table(DegreeTable const& table, std::string const& path);

//! Writes the neo4j import header ":START_ID,:END_ID,:TYPE".
void write_edge_table(EdgeTable const& edges, std::string const& path);

void write_permutation_stats(std::vector<PermutationStat> const& stats, std::string const& path);

} // namespace hetfeat
