#pragma once

#include <cstdint>

namespace hetfeat
{
constexpr uint32_t default_max_length = 4;

constexpr double default_damping = 0.4;

constexpr double default_permutation_multiplier = 10;

//! Number of evenly spaced statistic windows reported by a permutation run,
//! the final checkpoint comes on top of these.
constexpr uint32_t permutation_checkpoint_num = 10;

//! Metapaths handed to one OpenMP thread at a time. Chain products differ a
//! lot in cost, so keep this small.
constexpr uint32_t parallel_chunk_size = 1;

//! Largest element count passed to a single MPI collective call.
constexpr uint64_t mpi_chunk_capacity =
#ifdef UNIT_TEST
    16;
#else
    (1u << 30);
#endif

} // namespace hetfeat
