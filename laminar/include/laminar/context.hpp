#pragma once

#include <memory>
#include <string>

#include <laminar/common_types.hpp>

namespace lam {

// Requested partition of a network that is generated one partition per
// process without communication between them.
struct partition_info {
    partition_id_type index;
    unsigned count;
    partition_info(partition_id_type index, unsigned count):
        index(index),
        count(count) {}
};

// lam::execution_context encapsulates the resources used to generate a
// network, namely the distributed context that determines the partition
// and supplies collectives.

// Forward declare execution_context.
struct execution_context;

// lam::context is an opaque handle for the execution context for use
// in the public API, implemented as a shared pointer.
using context = std::shared_ptr<execution_context>;

// Non-distributed context: a single partition.
context make_context();

// Context for one partition of many. Collectives see only the local
// partition. Throws bad_partition if index is not less than count.
context make_context(partition_info p);

// Distributed context that uses MPI communicator comm.
template <typename Comm>
context make_context(Comm comm);

// Queries for properties of execution resources in a context.

std::string distribution_type(const context&);
bool has_mpi(const context&);
unsigned num_ranks(const context&);
unsigned rank(const context&);

} // namespace lam
