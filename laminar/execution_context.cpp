#include <memory>
#include <string>

#include <laminar/context.hpp>

#include "communication/distributed_context.hpp"
#include "execution_context.hpp"

#ifdef LAM_HAVE_MPI
#include <mpi.h>
#endif

namespace lam {

execution_context::execution_context():
    distributed(make_local_context())
{}

execution_context::execution_context(partition_info p):
    distributed(make_partition_context(p.index, p.count))
{}

context make_context() {
    return std::make_shared<execution_context>();
}

context make_context(partition_info p) {
    return std::make_shared<execution_context>(p);
}

#ifdef LAM_HAVE_MPI
template <>
execution_context::execution_context(MPI_Comm comm):
    distributed(make_mpi_context(comm))
{}

template <>
context make_context<MPI_Comm>(MPI_Comm comm) {
    return std::make_shared<execution_context>(comm);
}
#endif

std::string distribution_type(const context& ctx) {
    return ctx->distributed->name();
}

unsigned num_ranks(const context& ctx) {
    return ctx->distributed->size();
}

unsigned rank(const context& ctx) {
    return ctx->distributed->id();
}

bool has_mpi(const context& ctx) {
    return ctx->distributed->name() == "MPI";
}

} // namespace lam
