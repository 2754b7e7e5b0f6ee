#pragma once

#include <functional>
#include <iosfwd>
#include <string>

#include <laminar/common_types.hpp>
#include <laminar/labels.hpp>

namespace lam {

// Non-fatal conditions found during network generation. These are valid
// outcomes for some parameterizations, so they are reported, not thrown.
enum class warning_kind {
    empty_population,       // no cells survived density pruning
    unconnected_class_pair  // no connection was realized between two top classes
};

struct generation_warning {
    warning_kind kind;
    std::string message;

    // Set for empty_population.
    population_id_type pop = 0;

    // Set for unconnected_class_pair.
    top_class pre = top_class::IT;
    top_class post = top_class::IT;
};

generation_warning empty_population_warning(population_id_type pop);
generation_warning unconnected_class_pair_warning(top_class pre, top_class post);

using warning_callback = std::function<void(const generation_warning&)>;

std::ostream& operator<<(std::ostream&, const generation_warning&);

} // namespace lam
