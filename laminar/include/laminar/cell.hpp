#pragma once

#include <iosfwd>

#include <laminar/common_types.hpp>
#include <laminar/labels.hpp>

namespace lam {

// Description of an individual cell.
//
// Descriptions are plain values that every partition can compute for every
// cell in the network; only the owning partition instantiates a unit for it.
struct cell_description {
    cell_gid_type gid = 0;
    population_id_type pop = 0;
    excitability ei = excitability::E;
    top_class top = top_class::IT;
    sub_class sub = sub_class::other;
    depth_type depth = 0;
    planar_point location;
    cell_model model = cell_model::izhi2007;
};

bool operator==(const cell_description&, const cell_description&);
bool operator!=(const cell_description&, const cell_description&);

std::ostream& operator<<(std::ostream&, const cell_description&);

} // namespace lam
