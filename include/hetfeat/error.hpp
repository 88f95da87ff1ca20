#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace hetfeat
{

//! An edge type string or metaedge abbreviation does not follow the
//! SUBJECT[<]predicate[>]OBJECT convention, or the recovered node codes are
//! inconsistent.
class SchemaParseError : public std::runtime_error
{
public:
    explicit SchemaParseError(std::string const& what)
    : std::runtime_error(what)
    {
    }
};

class UnknownNodeReference : public std::runtime_error
{
public:
    explicit UnknownNodeReference(std::string const& node_id)
    : std::runtime_error("unknown node identifier '" + node_id + "'")
    , m_node_id(node_id)
    {
    }

    std::string const& node_id() const { return m_node_id; }

private:
    std::string m_node_id;
};

class DuplicateNodeIdentifier : public std::runtime_error
{
public:
    explicit DuplicateNodeIdentifier(std::string const& node_id)
    : std::runtime_error("node identifier '" + node_id + "' appears more than once")
    {
    }
};

class InvalidSelector : public std::invalid_argument
{
public:
    explicit InvalidSelector(std::string const& what)
    : std::invalid_argument(what)
    {
    }
};

class UnknownMetaedge : public std::runtime_error
{
public:
    explicit UnknownMetaedge(std::string const& abbrev)
    : std::runtime_error("no matrix for metaedge '" + abbrev + "'")
    {
    }
};

class PrecomputedDuplicateEdge : public std::invalid_argument
{
public:
    PrecomputedDuplicateEdge(std::string const& start_id, std::string const& end_id)
    : std::invalid_argument("duplicate edge " + start_id + " -> " + end_id + " in permutation input")
    {
    }
};

class MultipleEdgeTypesInPermutation : public std::invalid_argument
{
public:
    MultipleEdgeTypesInPermutation(std::string const& first, std::string const& second)
    : std::invalid_argument("permutation input mixes edge types '" + first + "' and '" + second + "'")
    {
    }
};

//! Raised by the extractor when the computation of one metapath failed. The
//! metapath name tells a bad metapath reference apart from a systemic issue.
class MetapathComputationError : public std::runtime_error
{
public:
    MetapathComputationError(std::string const& metapath, std::string const& cause)
    : std::runtime_error("metapath '" + metapath + "': " + cause)
    , m_metapath(metapath)
    , m_cause(cause)
    {
    }

    std::string const& metapath() const { return m_metapath; }
    std::string const& cause() const { return m_cause; }

private:
    std::string m_metapath;
    std::string m_cause;
};

//! record is the 1-based position of the offending metapath in the catalog
//! list, 0 when the document itself is not a list of metapaths.
class CatalogParseError : public std::runtime_error
{
public:
    CatalogParseError(size_t record, std::string const& what)
    : std::runtime_error("metapath catalog record " + std::to_string(record) + ": " + what)
    , m_record(record)
    {
    }

    size_t record() const { return m_record; }

private:
    size_t m_record;
};

class StorageError : public std::runtime_error
{
public:
    explicit StorageError(std::string const& what)
    : std::runtime_error(what)
    {
    }
};

} // namespace hetfeat
