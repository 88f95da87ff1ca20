#include <hetfeat/error.hpp>
#include <hetfeat/permute.hpp>
#include <hetfeat/type.hpp>
#include <hetfeat/util.hpp>

#include <algorithm>
#include <cmath>
#include <exception>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include <omp.h>

namespace hetfeat
{

namespace
{

using InternedEdge = std::pair<uint32_t, uint32_t>;

edge_id_t edge_key(uint32_t start, uint32_t end) { return (static_cast<edge_id_t>(start) << 32) | end; }

//! Dense ids for the node identifiers of one permutation run.
class NodeInterner
{
public:
    uint32_t intern(std::string const& id)
    {
        auto iter = m_index.find(id);
        if (iter != m_index.end())
        {
            return iter->second;
        }
        uint32_t const ret = static_cast<uint32_t>(m_ids.size());
        m_index.emplace(id, ret);
        m_ids.push_back(id);
        return ret;
    }

    bool find(std::string const& id, uint32_t& ret) const
    {
        auto iter = m_index.find(id);
        if (iter == m_index.end())
        {
            return false;
        }
        ret = iter->second;
        return true;
    }

    std::string const& id_of(uint32_t index) const { return m_ids[index]; }

private:
    std::unordered_map<std::string, uint32_t> m_index;
    std::vector<std::string> m_ids;
};

//! step, 2 step, ... below n, then n - 1, without repeats.
std::vector<uint64_t> get_checkpoints(uint64_t n)
{
    std::vector<uint64_t> ret;
    if (n == 0)
    {
        return ret;
    }
    uint64_t const step = std::max<uint64_t>(1, n / permutation_checkpoint_num);
    for (uint64_t i = step; i < n; i += step)
    {
        ret.push_back(i);
    }
    if (ret.empty() || ret.back() != n - 1)
    {
        ret.push_back(n - 1);
    }
    return ret;
}

bool is_directed_type(std::string const& type)
{
    return type.find('>') != std::string::npos || type.find('<') != std::string::npos;
}

} // namespace

PermutationResult permute_edges(EdgeTable const& edges, bool directed, double multiplier, EdgeTable const& excluded, uint32_t seed)
{
    if (multiplier < 0)
    {
        throw std::invalid_argument("permutation multiplier must not be negative");
    }
    for (Edge const& edge : edges)
    {
        if (edge.type != edges.front().type)
        {
            throw MultipleEdgeTypesInPermutation(edges.front().type, edge.type);
        }
    }

    NodeInterner interner;
    std::vector<InternedEdge> edge_list;
    std::unordered_set<edge_id_t> edge_set;
    edge_list.reserve(edges.size());
    for (Edge const& edge : edges)
    {
        InternedEdge const interned{ interner.intern(edge.start_id), interner.intern(edge.end_id) };
        if (!edge_set.insert(edge_key(interned.first, interned.second)).second)
        {
            throw PrecomputedDuplicateEdge(edge.start_id, edge.end_id);
        }
        edge_list.push_back(interned);
    }

    PermutationResult result;
    if (edges.size() < 2)
    {
        result.edges = edges;
        return result;
    }
    std::string const& type = edges.front().type;
    std::unordered_set<edge_id_t> const orig_edge_set = edge_set;

    // Pairs with an endpoint outside this edge type can never be formed.
    std::unordered_set<edge_id_t> excluded_set;
    for (Edge const& edge : excluded)
    {
        uint32_t start, end;
        if (interner.find(edge.start_id, start) && interner.find(edge.end_id, end))
        {
            excluded_set.insert(edge_key(start, end));
        }
    }

    uint64_t const edge_num = edge_list.size();
    uint64_t const n_perm = static_cast<uint64_t>(std::floor(edge_num * multiplier));
    std::vector<uint64_t> const checkpoints = get_checkpoints(n_perm);
    size_t next_checkpoint = 0;

    uint64_t count_self_loop = 0;
    uint64_t count_duplicate = 0;
    uint64_t count_undir_dup = 0;
    uint64_t count_excluded = 0;

    RandomEngine<uint64_t> engine(seed);
    for (uint64_t i = 0; i < n_perm; i++)
    {
        uint64_t const i_0 = engine(0, edge_num - 1);
        uint64_t i_1 = i_0;
        while (i_1 == i_0)
        {
            i_1 = engine(0, edge_num - 1);
        }

        InternedEdge const edge_0 = edge_list[i_0];
        InternedEdge const edge_1 = edge_list[i_1];
        InternedEdge const swapped[2] = { { edge_0.first, edge_1.second }, { edge_1.first, edge_0.second } };

        bool valid = true;
        for (InternedEdge const& edge : swapped)
        {
            edge_id_t const key = edge_key(edge.first, edge.second);
            if (edge.first == edge.second)
            {
                count_self_loop++;
            }
            else if (edge_set.count(key) != 0)
            {
                count_duplicate++;
            }
            else if (!directed && edge_set.count(edge_key(edge.second, edge.first)) != 0)
            {
                count_undir_dup++;
            }
            else if (excluded_set.count(key) != 0)
            {
                count_excluded++;
            }
            else
            {
                continue;
            }
            valid = false;
            break;
        }

        if (valid)
        {
            edge_list[i_0] = swapped[0];
            edge_list[i_1] = swapped[1];
            edge_set.erase(edge_key(edge_0.first, edge_0.second));
            edge_set.erase(edge_key(edge_1.first, edge_1.second));
            edge_set.insert(edge_key(swapped[0].first, swapped[0].second));
            edge_set.insert(edge_key(swapped[1].first, swapped[1].second));
        }

        if (next_checkpoint < checkpoints.size() && checkpoints[next_checkpoint] == i)
        {
            uint64_t kept = 0;
            for (edge_id_t key : orig_edge_set)
            {
                kept += edge_set.count(key);
            }

            PermutationStat stat;
            stat.cumulative_attempts = i;
            stat.attempts = next_checkpoint == 0 ? i + 1 : i - checkpoints[next_checkpoint - 1];
            stat.complete = static_cast<double>(i + 1) / n_perm;
            stat.unchanged = static_cast<double>(kept) / edge_num;
            stat.self_loop = static_cast<double>(count_self_loop) / stat.attempts;
            stat.duplicate = static_cast<double>(count_duplicate) / stat.attempts;
            stat.undirected_duplicate = static_cast<double>(count_undir_dup) / stat.attempts;
            stat.excluded = static_cast<double>(count_excluded) / stat.attempts;
            stat.edge_type = type;
            result.stats.push_back(stat);

            count_self_loop = 0;
            count_duplicate = 0;
            count_undir_dup = 0;
            count_excluded = 0;
            next_checkpoint++;
        }
    }

    result.edges.reserve(edge_num);
    for (InternedEdge const& edge : edge_list)
    {
        result.edges.emplace_back(interner.id_of(edge.first), interner.id_of(edge.second), type);
    }
    return result;
}

PermutationResult permute_graph(EdgeTable const& edges, double multiplier, EdgeTable const& excluded, uint32_t seed, int worker_num)
{
    std::vector<std::string> types;
    std::unordered_map<std::string, EdgeTable> typed_edges;
    for (Edge const& edge : edges)
    {
        auto iter = typed_edges.find(edge.type);
        if (iter == typed_edges.end())
        {
            types.push_back(edge.type);
            iter = typed_edges.emplace(edge.type, EdgeTable()).first;
        }
        iter->second.push_back(edge);
    }

    std::vector<PermutationResult> results(types.size());
    std::vector<std::exception_ptr> errors(types.size());
    int const thread_num = worker_num > 0 ? worker_num : omp_get_max_threads();

#pragma omp parallel for schedule(dynamic, 1) num_threads(thread_num)
    for (int64_t t_i = 0; t_i < static_cast<int64_t>(types.size()); t_i++)
    {
        EdgeTable const& to_permute = typed_edges.at(types[t_i]);
        // Exceptions must not leave an OpenMP region, rethrown below.
        try
        {
            results[t_i] = permute_edges(to_permute, is_directed_type(types[t_i]), multiplier, excluded,
                                         seed + static_cast<uint32_t>(to_permute.size()));
        }
        catch (std::exception const&)
        {
            errors[t_i] = std::current_exception();
        }
    }

    PermutationResult ret;
    for (size_t t_i = 0; t_i < types.size(); t_i++)
    {
        if (errors[t_i])
        {
            std::rethrow_exception(errors[t_i]);
        }
        ret.edges.insert(ret.edges.end(), results[t_i].edges.begin(), results[t_i].edges.end());
        ret.stats.insert(ret.stats.end(), results[t_i].stats.begin(), results[t_i].stats.end());
    }
    return ret;
}

} // namespace hetfeat
