#pragma once

#include <cstdint>
#include <type_traits>
#include <vector>

#include <mpi.h>

#include <laminar/communication/mpi_error.hpp>

namespace lam {
namespace mpi {

int rank(MPI_Comm);
int size(MPI_Comm);
void barrier(MPI_Comm);

#define MPI_OR_THROW(fn, ...)\
while (int r_ = fn(__VA_ARGS__)) throw mpi_error(r_, #fn)

// MPI datatypes of the arithmetic types used in collectives.
template <typename T>
struct mpi_traits;

#define LAM_MPI_TRAITS(T, M) \
template <> \
struct mpi_traits<T> { \
    static MPI_Datatype mpi_type() { return M; } \
};

LAM_MPI_TRAITS(double,             MPI_DOUBLE)
LAM_MPI_TRAITS(unsigned,           MPI_UNSIGNED)
LAM_MPI_TRAITS(unsigned long,      MPI_UNSIGNED_LONG)
LAM_MPI_TRAITS(unsigned long long, MPI_UNSIGNED_LONG_LONG)

#undef LAM_MPI_TRAITS

// Gather individual values of type T from each rank into a std::vector on
// the root rank.
template <typename T>
std::vector<T> gather(T value, int root, MPI_Comm comm) {
    auto buffer_size = (rank(comm)==root)? size(comm): 0;
    std::vector<T> buffer(buffer_size);

    MPI_OR_THROW(MPI_Gather,
                 &value,        1, mpi_traits<T>::mpi_type(), // send buffer
                 buffer.data(), 1, mpi_traits<T>::mpi_type(), // receive buffer
                 root, comm);

    return buffer;
}

// Reduce a value over all ranks; every rank receives the result.
template <typename T>
T reduce(T value, MPI_Op op, MPI_Comm comm) {
    T result;
    MPI_OR_THROW(MPI_Allreduce, &value, &result, 1, mpi_traits<T>::mpi_type(), op, comm);
    return result;
}

} // namespace mpi
} // namespace lam
