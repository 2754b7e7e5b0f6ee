#pragma once

#include <functional>
#include <iosfwd>
#include <vector>

#include <laminar/common_types.hpp>
#include <laminar/labels.hpp>

namespace lam {

// Cell density [cells/mm³] as a function of depth fraction.
using density_function = std::function<double(depth_type)>;

density_function constant_density(double density);

// density(y) = slope*y + intercept
density_function linear_density(double slope, double intercept = 0);

// Half-open interval [lo, hi) of depth fractions.
struct depth_range {
    depth_type lo = 0;
    depth_type hi = 1;

    depth_type thickness() const { return hi-lo; }
    bool contains(depth_type y) const { return y>=lo && y<hi; }
};

// Population-level description of a group of cells that share class labels,
// a depth range and a density profile.
//
// Populations are built once from a static table; generation only appends
// to cell_gids, which lists the gids owned by the local partition.
struct population {
    population_id_type id = 0;
    excitability ei = excitability::E;
    top_class top = top_class::IT;
    sub_class sub = sub_class::other;
    depth_range depth;
    density_function density;
    cell_model model = cell_model::izhi2007;

    std::vector<cell_gid_type> cell_gids;

    population() = default;
    population(population_id_type id, excitability ei, top_class top, sub_class sub,
               depth_range depth, density_function density, cell_model model);
};

// Checks labels, depth range and that a density function is present.
// Throws bad_population_table, bad_depth_range or bad_cell_model.
void validate(const population&);

// The 12 populations of the reference M1 microcircuit model: IT, PT and
// Pva/Sst interneuron populations across layers 2/3 to 6.
std::vector<population> default_populations();

std::ostream& operator<<(std::ostream&, const population&);

} // namespace lam
