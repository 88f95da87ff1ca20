#include <hetfeat/error.hpp>
#include <hetfeat/storage.hpp>
#include <hetfeat/util.hpp>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <inttypes.h>

namespace hetfeat
{

namespace
{

std::vector<std::string> const reserved_columns = { "id", "label", "start_id", "end_id", "type" };

//! Reads the header and rows of a csv file, header names normalized.
class CsvReader
{
public:
    explicit CsvReader(std::string const& path)
    : m_path(path)
    , m_input(path)
    {
        if (!m_input)
        {
            throw StorageError("cannot open '" + path + "' for reading");
        }
        std::string line;
        if (!next_line(line))
        {
            throw StorageError("'" + path + "' has no header line");
        }
        for (std::string const& column : parse_csv_line(line))
        {
            m_columns.push_back(normalize_column_name(column));
        }
    }

    //! Position of column, or the column count when there is none.
    size_t find(std::string const& column) const
    {
        return std::find(m_columns.begin(), m_columns.end(), column) - m_columns.begin();
    }

    size_t require(std::string const& column) const
    {
        size_t const c_i = find(column);
        if (c_i == m_columns.size())
        {
            throw StorageError("'" + m_path + "' has no column '" + column + "'");
        }
        return c_i;
    }

    size_t column_num() const { return m_columns.size(); }

    //! False at the end of the file, blank lines are skipped.
    bool next_row(std::vector<std::string>& row)
    {
        std::string line;
        while (next_line(line))
        {
            if (line.empty())
            {
                continue;
            }
            row = parse_csv_line(line);
            if (row.size() != m_columns.size())
            {
                throw StorageError("'" + m_path + "' line " + std::to_string(m_line_num) + " has " +
                                   std::to_string(row.size()) + " fields, expected " +
                                   std::to_string(m_columns.size()));
            }
            return true;
        }
        return false;
    }

private:
    bool next_line(std::string& line)
    {
        if (!std::getline(m_input, line))
        {
            return false;
        }
        m_line_num++;
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        return true;
    }

    std::string m_path;
    std::ifstream m_input;
    std::vector<std::string> m_columns;
    size_t m_line_num = 0;
};

class CsvWriter
{
public:
    explicit CsvWriter(std::string const& path)
    : m_path(path)
    , m_file(fopen(path.c_str(), "w"))
    {
        if (m_file == NULL)
        {
            throw StorageError("cannot open '" + path + "' for writing");
        }
    }

    ~CsvWriter()
    {
        if (m_file != NULL)
        {
            fclose(m_file);
        }
    }

    CsvWriter(CsvWriter const&) = delete;
    CsvWriter& operator=(CsvWriter const&) = delete;

    FILE* get() const { return m_file; }

    void write_field(std::string const& field, bool first = false)
    {
        if (!first)
        {
            fputc(',', m_file);
        }
        if (field.find_first_of(",\"\n") == std::string::npos)
        {
            fputs(field.c_str(), m_file);
            return;
        }
        fputc('"', m_file);
        for (char c : field)
        {
            if (c == '"')
            {
                fputc('"', m_file);
            }
            fputc(c, m_file);
        }
        fputc('"', m_file);
    }

    void write_header(std::vector<std::string> const& columns)
    {
        for (size_t c_i = 0; c_i < columns.size(); c_i++)
        {
            write_field(columns[c_i], c_i == 0);
        }
        fputc('\n', m_file);
    }

    //! Flushes and closes, reporting errors hidden in the stdio buffer.
    void close()
    {
        int const ret = fclose(m_file);
        m_file = NULL;
        if (ret != 0)
        {
            throw StorageError("failed to write '" + m_path + "'");
        }
    }

private:
    std::string m_path;
    FILE* m_file;
};

template <typename value_t, typename Formatter>
void write_pair_table(PairTable<value_t> const& table, std::string const& path, Formatter format)
{
    CsvWriter writer(path);
    std::vector<std::string> header = { table.get_start_column(), table.get_end_column() };
    header.insert(header.end(), table.get_columns().begin(), table.get_columns().end());
    writer.write_header(header);

    for (size_t r_i = 0; r_i < table.get_row_num(); r_i++)
    {
        writer.write_field(table.get_start_id(r_i), true);
        writer.write_field(table.get_end_id(r_i));
        for (size_t c_i = 0; c_i < table.get_column_num(); c_i++)
        {
            format(writer.get(), table.at(r_i, c_i));
        }
        fputc('\n', writer.get());
    }
    writer.close();
}

} // namespace

std::string normalize_column_name(std::string const& column)
{
    std::string const lower = to_lower(column);
    size_t const colon = lower.find(':');
    if (colon == std::string::npos)
    {
        return lower;
    }
    std::string const name = lower.substr(0, colon);
    std::string const tag = lower.substr(colon + 1);
    for (std::string const& reserved : reserved_columns)
    {
        if (tag == reserved)
        {
            return tag;
        }
    }
    return name;
}

std::vector<std::string> parse_csv_line(std::string const& line)
{
    std::vector<std::string> ret(1);
    bool quoted = false;
    for (size_t c_i = 0; c_i < line.size(); c_i++)
    {
        char const c = line[c_i];
        if (quoted)
        {
            if (c != '"')
            {
                ret.back().push_back(c);
            }
            else if (c_i + 1 < line.size() && line[c_i + 1] == '"')
            {
                ret.back().push_back('"');
                c_i++;
            }
            else
            {
                quoted = false;
            }
        }
        else if (c == '"')
        {
            quoted = true;
        }
        else if (c == ',')
        {
            ret.emplace_back();
        }
        else
        {
            ret.back().push_back(c);
        }
    }
    return ret;
}

NodeTable read_node_table(std::string const& path)
{
    CsvReader reader(path);
    size_t const id_col = reader.require("id");
    size_t const label_col = reader.require("label");

    NodeTable ret;
    std::vector<std::string> row;
    while (reader.next_row(row))
    {
        if (row[id_col].empty())
        {
            throw StorageError("'" + path + "' has a node without identifier");
        }
        ret.emplace_back(row[id_col], row[label_col]);
    }
    return ret;
}

EdgeTable read_edge_table(std::string const& path)
{
    CsvReader reader(path);
    size_t const start_col = reader.require("start_id");
    size_t const end_col = reader.require("end_id");
    size_t const type_col = reader.require("type");

    EdgeTable ret;
    std::vector<std::string> row;
    while (reader.next_row(row))
    {
        if (row[start_col].empty() || row[end_col].empty() || row[type_col].empty())
        {
            continue;
        }
        ret.emplace_back(row[start_col], row[end_col], row[type_col]);
    }
    return ret;
}

EdgeTable read_edge_pairs(std::string const& path)
{
    CsvReader reader(path);
    size_t const start_col = reader.require("start_id");
    size_t const end_col = reader.require("end_id");
    size_t const type_col = reader.find("type");

    EdgeTable ret;
    std::vector<std::string> row;
    while (reader.next_row(row))
    {
        if (row[start_col].empty() || row[end_col].empty())
        {
            continue;
        }
        ret.emplace_back(row[start_col], row[end_col], type_col == reader.column_num() ? "" : row[type_col]);
    }
    return ret;
}

void write_feature_table(FeatureTable const& table, std::string const& path)
{
    write_pair_table(table, path, [](FILE* f, real_t value) { fprintf(f, ",%.15g", value); });
}

void write_degree_table(DegreeTable const& table, std::string const& path)
{
    write_pair_table(table, path, [](FILE* f, degree_t value) { fprintf(f, ",%" PRIu64, value); });
}

void write_edge_table(EdgeTable const& edges, std::string const& path)
{
    CsvWriter writer(path);
    writer.write_header({ ":START_ID", ":END_ID", ":TYPE" });
    for (Edge const& edge : edges)
    {
        writer.write_field(edge.start_id, true);
        writer.write_field(edge.end_id);
        writer.write_field(edge.type);
        fputc('\n', writer.get());
    }
    writer.close();
}

void write_permutation_stats(std::vector<PermutationStat> const& stats, std::string const& path)
{
    CsvWriter writer(path);
    writer.write_header({ "cumulative_attempts", "attempts", "complete", "unchanged", "self_loop", "duplicate",
                          "undirected_duplicate", "excluded", "edge_type" });
    for (PermutationStat const& stat : stats)
    {
        fprintf(writer.get(), "%" PRIu64 ",%" PRIu64 ",%.15g,%.15g,%.15g,%.15g,%.15g,%.15g", stat.cumulative_attempts,
                stat.attempts, stat.complete, stat.unchanged, stat.self_loop, stat.duplicate,
                stat.undirected_duplicate, stat.excluded);
        writer.write_field(stat.edge_type);
        fputc('\n', writer.get());
    }
    writer.close();
}

} // namespace hetfeat
