#pragma once

#include <hetfeat/network.hpp>
#include <hetfeat/type.hpp>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace hetfeat
{

//! Which nodes a feature table starts or ends at: every node of a kind, or an
//! explicit list of identifiers or indices.
class NodeSelector
{
public:
    enum class Mode
    {
        kind,
        ids,
        indices
    };

    static NodeSelector of_kind(std::string kind);
    static NodeSelector of_ids(std::vector<std::string> ids);
    static NodeSelector of_indices(std::vector<NodeIndex> indices);

    Mode get_mode() const { return m_mode; }
    std::string const& get_kind() const { return m_kind; }
    std::vector<std::string> const& get_ids() const { return m_ids; }
    std::vector<NodeIndex> const& get_indices() const { return m_indices; }

private:
    Mode m_mode = Mode::kind;
    std::string m_kind;
    std::vector<std::string> m_ids;
    std::vector<NodeIndex> m_indices;
};

struct NodeSelection
{
    std::vector<NodeIndex> indices;
    std::vector<std::string> ids;
    //! Kind of the first selected node.
    std::string kind;
    //! "<kind in lower case>_id"
    std::string column_name;
};

//! Throws InvalidSelector for an unknown kind, an unknown identifier, an index
//! outside the network or an empty list.
NodeSelection resolve_selector(HetNetwork const& network, NodeSelector const& selector);

//! Long format table: one row per (start, end) pair, start major, and one value
//! column per feature.
template <typename value_t> class PairTable
{
public:
    PairTable() = default;

    PairTable(NodeSelection const& start, NodeSelection const& end, std::vector<std::string> columns)
    : m_start_column(start.column_name)
    , m_end_column(end.column_name)
    , m_columns(std::move(columns))
    {
        m_start_ids.reserve(start.ids.size() * end.ids.size());
        m_end_ids.reserve(start.ids.size() * end.ids.size());
        for (std::string const& start_id : start.ids)
        {
            for (std::string const& end_id : end.ids)
            {
                m_start_ids.push_back(start_id);
                m_end_ids.push_back(end_id);
            }
        }
        m_values.assign(m_start_ids.size() * m_columns.size(), value_t{});
    }

    size_t get_row_num() const { return m_start_ids.size(); }
    size_t get_column_num() const { return m_columns.size(); }

    std::string const& get_start_column() const { return m_start_column; }
    std::string const& get_end_column() const { return m_end_column; }
    std::vector<std::string> const& get_columns() const { return m_columns; }
    std::string const& get_start_id(size_t row) const { return m_start_ids[row]; }
    std::string const& get_end_id(size_t row) const { return m_end_ids[row]; }

    value_t at(size_t row, size_t column) const { return m_values[row * m_columns.size() + column]; }
    value_t& at(size_t row, size_t column) { return m_values[row * m_columns.size() + column]; }

    size_t column_index(std::string const& name) const
    {
        for (size_t c_i = 0; c_i < m_columns.size(); c_i++)
        {
            if (m_columns[c_i] == name)
            {
                return c_i;
            }
        }
        throw std::out_of_range("no column '" + name + "'");
    }

    std::vector<value_t> column(std::string const& name) const
    {
        size_t const c_i = column_index(name);
        std::vector<value_t> ret(get_row_num());
        for (size_t r_i = 0; r_i < ret.size(); r_i++)
        {
            ret[r_i] = at(r_i, c_i);
        }
        return ret;
    }

    //! block holds one value per row, in row order.
    void set_column(size_t column, std::vector<value_t> const& block)
    {
        if (block.size() != get_row_num())
        {
            throw std::invalid_argument("column block does not match the table rows");
        }
        for (size_t r_i = 0; r_i < block.size(); r_i++)
        {
            at(r_i, column) = block[r_i];
        }
    }

    //! Raw row-major storage, used to combine tables across MPI ranks.
    std::vector<value_t>& values() { return m_values; }
    std::vector<value_t> const& values() const { return m_values; }

private:
    std::string m_start_column;
    std::string m_end_column;
    std::vector<std::string> m_columns;
    std::vector<std::string> m_start_ids;
    std::vector<std::string> m_end_ids;
    std::vector<value_t> m_values;
};

using FeatureTable = PairTable<real_t>;
using DegreeTable = PairTable<degree_t>;

//! Dense start x end block of product, start major, matching the row order of
//! a PairTable built from the same selections.
std::vector<real_t> restrict_product(SparseMatrix const& product, NodeSelection const& start, NodeSelection const& end);

} // namespace hetfeat
