#pragma once

#include <laminar/context.hpp>

#include "communication/distributed_context.hpp"

namespace lam {

// execution_context is a simple container for the state relating to
// execution resources.
//
// Note: the public API uses an opaque handle lam::context for
// execution_context, to hide implementation details of the
// container and its constituent contexts from the public API.

struct execution_context {
    distributed_context_handle distributed;

    execution_context();
    explicit execution_context(partition_info p);

    // Use a template for constructing with a specific distributed context.
    // Specialised implementations are implemented in execution_context.cpp.
    template <typename Comm>
    explicit execution_context(Comm comm);
};

} // namespace lam
