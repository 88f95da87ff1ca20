#pragma once

#include <hetfeat/constants.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <type_traits>

#include <mpi.h>

namespace hetfeat
{

//! Simple wrapper to init and finalize MPI environment. Only the main thread
//! talks to MPI, OpenMP workers never do.
class MPI_Instance
{
public:
    MPI_Instance(int* argc, char*** argv);

    ~MPI_Instance() { MPI_Finalize(); }
};


//! Returns the corresponding MPI datatype given T at compile time. Only if the
//! type is not supported, this function will throw a std::invalid_argument
//! exception (at runtime).
template <typename T> constexpr MPI_Datatype deduce_mpi_data_type()
{
    if constexpr (std::is_same<T, char>::value)
    {
        return MPI_CHAR;
    }
    else if constexpr (std::is_same<T, int>::value)
    {
        return MPI_INT;
    }
    else if constexpr (std::is_same<T, unsigned int>::value)
    {
        return MPI_UNSIGNED;
    }
    else if constexpr (std::is_same<T, long>::value)
    {
        return MPI_LONG;
    }
    else if constexpr (std::is_same<T, unsigned long>::value)
    {
        return MPI_UNSIGNED_LONG;
    }
    else if constexpr (std::is_same<T, float>::value)
    {
        return MPI_FLOAT;
    }
    else if constexpr (std::is_same<T, double>::value)
    {
        return MPI_DOUBLE;
    }
    else if constexpr (std::is_same<T, long long int>::value)
    {
        return MPI_LONG_LONG_INT;
    }
    else if constexpr (std::is_same<T, unsigned long long>::value)
    {
        return MPI_UNSIGNED_LONG_LONG;
    }
    else
    {
        throw std::invalid_argument("Type not supported by MPI.");
    }
}

int get_mpi_rank();

int get_mpi_size();

bool is_master_process();

//! Runs func on the master rank only, then tells every rank whether it threw.
//! The master rethrows its own exception, the other ranks throw a
//! std::runtime_error with the same message. Every rank must call this.
void run_on_master(std::function<void()> const& func);

//! Round-robin ownership of independent work items across ranks.
inline bool is_local_task(size_t task_id) { return task_id % get_mpi_size() == static_cast<size_t>(get_mpi_rank()); }

//! MPI_Allreduce on a buffer that may exceed the int element count of a
//! single call. Every rank must call this with the same count.
template <typename T> void allreduce_in_place(T* data, size_t count, MPI_Op op)
{
    MPI_Datatype const data_type = deduce_mpi_data_type<T>();
    size_t offset = 0;
    while (offset < count)
    {
        size_t const chunk = std::min<size_t>(count - offset, mpi_chunk_capacity);
        int const ret = MPI_Allreduce(MPI_IN_PLACE, data + offset, static_cast<int>(chunk), data_type, op, MPI_COMM_WORLD);
        if (ret != MPI_SUCCESS)
        {
            throw std::runtime_error("MPI_Allreduce failed");
        }
        offset += chunk;
    }
}

} // namespace hetfeat
