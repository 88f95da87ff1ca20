#include <hetfeat/error.hpp>
#include <hetfeat/feature_table.hpp>
#include <hetfeat/util.hpp>

namespace hetfeat
{

NodeSelector NodeSelector::of_kind(std::string kind)
{
    NodeSelector selector;
    selector.m_mode = Mode::kind;
    selector.m_kind = std::move(kind);
    return selector;
}

NodeSelector NodeSelector::of_ids(std::vector<std::string> ids)
{
    NodeSelector selector;
    selector.m_mode = Mode::ids;
    selector.m_ids = std::move(ids);
    return selector;
}

NodeSelector NodeSelector::of_indices(std::vector<NodeIndex> indices)
{
    NodeSelector selector;
    selector.m_mode = Mode::indices;
    selector.m_indices = std::move(indices);
    return selector;
}

NodeSelection resolve_selector(HetNetwork const& network, NodeSelector const& selector)
{
    NodeSelection selection;
    switch (selector.get_mode())
    {
    case NodeSelector::Mode::kind:
        if (!network.has_kind(selector.get_kind()))
        {
            throw InvalidSelector("unknown node kind '" + selector.get_kind() + "'");
        }
        selection.indices = network.indices_of_kind(selector.get_kind());
        break;
    case NodeSelector::Mode::ids:
        for (std::string const& id : selector.get_ids())
        {
            if (!network.contains(id))
            {
                throw InvalidSelector("unknown node identifier '" + id + "'");
            }
            selection.indices.push_back(network.index_of(id));
        }
        break;
    case NodeSelector::Mode::indices:
        for (NodeIndex index : selector.get_indices())
        {
            if (index >= network.get_node_num())
            {
                throw InvalidSelector("node index " + std::to_string(index) + " is out of range");
            }
            selection.indices.push_back(index);
        }
        break;
    }

    if (selection.indices.empty())
    {
        throw InvalidSelector("node selection is empty");
    }

    selection.ids.reserve(selection.indices.size());
    for (NodeIndex index : selection.indices)
    {
        selection.ids.push_back(network.id_of(index));
    }
    selection.kind = network.kind_of(selection.indices.front());
    selection.column_name = to_lower(selection.kind) + "_id";
    return selection;
}

std::vector<real_t> restrict_product(SparseMatrix const& product, NodeSelection const& start, NodeSelection const& end)
{
    size_t const end_num = end.indices.size();

    // Column positions of every end node; a node may be selected more than once.
    std::vector<std::vector<size_t>> end_positions(product.cols());
    for (size_t e_i = 0; e_i < end_num; e_i++)
    {
        end_positions[end.indices[e_i]].push_back(e_i);
    }

    std::vector<real_t> block(start.indices.size() * end_num, 0);
    for (size_t s_i = 0; s_i < start.indices.size(); s_i++)
    {
        for (SparseMatrix::InnerIterator it(product, start.indices[s_i]); it; ++it)
        {
            for (size_t e_i : end_positions[it.col()])
            {
                block[s_i * end_num + e_i] = it.value();
            }
        }
    }
    return block;
}

} // namespace hetfeat
