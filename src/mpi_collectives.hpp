#pragma once

#include "common.hpp"

#include <mpi.h>

#include <cstdint>

namespace wsnsim
{
    // Allreduce sum for int64 counters.
    // Intended to be used as MonteCarloConfig::reduceSum.
    inline std::int64_t mpi_allreduce_sum_i64(MPI_Comm comm, std::int64_t local)
    {
        std::int64_t out = 0;
        const int rc = MPI_Allreduce(&local, &out, 1, MPI_INT64_T, MPI_SUM, comm);
        if (rc != MPI_SUCCESS)
        {
            MPI_Abort(comm, 5);
        }
        return out;
    }

    // Allreduce XOR for u64 digests (order-independent combination across ranks).
    inline std::uint64_t mpi_allreduce_xor_u64(MPI_Comm comm, std::uint64_t local)
    {
        std::uint64_t out = 0;
        const int rc = MPI_Allreduce(&local, &out, 1, MPI_UINT64_T, MPI_BXOR, comm);
        if (rc != MPI_SUCCESS)
        {
            MPI_Abort(comm, 6);
        }
        return out;
    }
}
