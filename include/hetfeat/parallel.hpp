#pragma once

#include <hetfeat/constants.hpp>

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <string>
#include <vector>

#include <omp.h>

namespace hetfeat
{

struct ParallelConfig
{
    //! Number of OpenMP threads, <= 0 picks omp_get_max_threads().
    int worker_num = 0;
    //! Skip tasks that have not started yet once one task failed.
    bool fail_fast = false;

    int get_worker_num() const { return worker_num > 0 ? worker_num : omp_get_max_threads(); }
};

enum class TaskStatus
{
    done,
    failed,
    skipped
};

template <typename result_t> struct TaskResult
{
    TaskStatus status = TaskStatus::skipped;
    result_t value{};
    std::string error;

    bool ok() const { return status == TaskStatus::done; }
};

//! Applies func to every task id in [0, task_num) on an OpenMP team and
//! returns the results indexed by task id, whatever order they finished in.
//! An exception thrown by func is kept in that task's result and does not
//! touch the other tasks.
template <typename result_t>
std::vector<TaskResult<result_t>>
parallel_map(size_t task_num, std::function<result_t(size_t)> const& func, ParallelConfig const& conf = ParallelConfig{})
{
    std::vector<TaskResult<result_t>> results(task_num);
    std::atomic<bool> failed{ false };

#pragma omp parallel for schedule(dynamic, parallel_chunk_size) num_threads(conf.get_worker_num())
    for (int64_t t_i = 0; t_i < static_cast<int64_t>(task_num); t_i++)
    {
        TaskResult<result_t>& result = results[t_i];
        if (conf.fail_fast && failed.load())
        {
            result.status = TaskStatus::skipped;
            continue;
        }
        try
        {
            result.value = func(static_cast<size_t>(t_i));
            result.status = TaskStatus::done;
        }
        catch (std::exception const& e)
        {
            result.status = TaskStatus::failed;
            result.error = e.what();
            failed.store(true);
        }
    }

    return results;
}

} // namespace hetfeat
