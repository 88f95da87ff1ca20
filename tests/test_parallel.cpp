#include <gtest/gtest.h>

#include "test.hpp"

#include <hetfeat/error.hpp>
#include <hetfeat/parallel.hpp>

#include <atomic>
#include <stdexcept>

TEST(ParallelMap, results_follow_task_order)
{
    for (int worker_num : { 1, 2, 4, 8 })
    {
        ParallelConfig conf;
        conf.worker_num = worker_num;
        auto const results = parallel_map<uint64_t>(
            100, [](size_t t_i) { return static_cast<uint64_t>(t_i * t_i); }, conf);
        ASSERT_EQ(results.size(), 100u);
        for (size_t t_i = 0; t_i < results.size(); t_i++)
        {
            EXPECT_TRUE(results[t_i].ok());
            EXPECT_EQ(results[t_i].value, t_i * t_i);
        }
    }
}

TEST(ParallelMap, failure_stays_with_its_task)
{
    ParallelConfig conf;
    conf.worker_num = 4;
    auto const results = parallel_map<int>(
        20,
        [](size_t t_i)
        {
            if (t_i == 7)
            {
                throw std::runtime_error("task seven");
            }
            return static_cast<int>(t_i);
        },
        conf);
    for (size_t t_i = 0; t_i < results.size(); t_i++)
    {
        if (t_i == 7)
        {
            EXPECT_EQ(results[t_i].status, TaskStatus::failed);
            EXPECT_EQ(results[t_i].error, "task seven");
        }
        else
        {
            EXPECT_TRUE(results[t_i].ok());
            EXPECT_EQ(results[t_i].value, static_cast<int>(t_i));
        }
    }
}

TEST(ParallelMap, fail_fast_skips_remaining_tasks)
{
    ParallelConfig conf;
    conf.worker_num = 1;
    conf.fail_fast = true;
    std::atomic<int> started{ 0 };
    auto const results = parallel_map<int>(
        10,
        [&](size_t t_i)
        {
            started++;
            if (t_i == 2)
            {
                throw std::runtime_error("stop");
            }
            return 1;
        },
        conf);
    EXPECT_EQ(started.load(), 3);
    EXPECT_TRUE(results[1].ok());
    EXPECT_EQ(results[2].status, TaskStatus::failed);
    for (size_t t_i = 3; t_i < results.size(); t_i++)
    {
        EXPECT_EQ(results[t_i].status, TaskStatus::skipped);
    }
}

TEST(ParallelMap, no_tasks)
{
    EXPECT_TRUE(parallel_map<int>(0, [](size_t) { return 0; }).empty());
}

TEST(MPIHelper, allreduce_in_place_spans_chunks)
{
    // Longer than the chunk capacity of a unit test build.
    std::vector<uint64_t> values(mpi_chunk_capacity * 3 + 5, 0);
    for (size_t i = 0; i < values.size(); i++)
    {
        if (is_local_task(i))
        {
            values[i] = i + 1;
        }
    }
    allreduce_in_place(values.data(), values.size(), MPI_SUM);
    for (size_t i = 0; i < values.size(); i++)
    {
        EXPECT_EQ(values[i], i + 1);
    }

    int local = get_mpi_rank();
    allreduce_in_place(&local, 1, MPI_MAX);
    EXPECT_EQ(local, get_mpi_size() - 1);
}

TEST(MPIHelper, master_failure_reaches_every_rank)
{
    int calls = 0;
    run_on_master([&calls]() { calls++; });
    EXPECT_EQ(calls, is_master_process() ? 1 : 0);

    try
    {
        run_on_master([]() { throw StorageError("cannot open 'features.csv' for writing"); });
        ADD_FAILURE() << "no rank may return normally";
    }
    catch (StorageError const& e)
    {
        EXPECT_TRUE(is_master_process());
        EXPECT_STREQ(e.what(), "cannot open 'features.csv' for writing");
    }
    catch (std::runtime_error const& e)
    {
        EXPECT_FALSE(is_master_process());
        EXPECT_STREQ(e.what(), "cannot open 'features.csv' for writing");
    }

    // All ranks still meet in the next collective.
    int ranks = 1;
    allreduce_in_place(&ranks, 1, MPI_SUM);
    EXPECT_EQ(ranks, get_mpi_size());
}

GTEST_API_ int main(int argc, char* argv[])
{
    MPI_Instance mpi_instance(&argc, &argv);
    ::testing::InitGoogleTest(&argc, argv);
    mute_nonroot_gtest_events();
    int result = RUN_ALL_TESTS();
    return result;
}
