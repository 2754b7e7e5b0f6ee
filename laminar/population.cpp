#include <iostream>
#include <utility>
#include <vector>

#include <laminar/labels.hpp>
#include <laminar/lamexcept.hpp>
#include <laminar/population.hpp>

#include "util/strprintf.hpp"

namespace lam {

density_function constant_density(double density) {
    return [density](depth_type) { return density; };
}

density_function linear_density(double slope, double intercept) {
    return [slope, intercept](depth_type y) { return slope*y + intercept; };
}

population::population(population_id_type id, excitability ei, top_class top, sub_class sub,
                       depth_range depth, density_function density, cell_model model):
    id(id), ei(ei), top(top), sub(sub), depth(depth), density(std::move(density)), model(model)
{}

void validate(const population& p) {
    if (!valid(p.ei))  throw bad_population_table(p.id, util::pprintf("invalid excitability {}", index(p.ei)));
    if (!valid(p.top)) throw bad_population_table(p.id, util::pprintf("invalid top class {}", index(p.top)));
    if (!valid(p.sub)) throw bad_population_table(p.id, util::pprintf("invalid sub class {}", index(p.sub)));
    if (!valid(p.model)) throw bad_cell_model(p.model);
    if (!p.density) throw bad_population_table(p.id, "no density function");

    const auto& d = p.depth;
    if (!(d.lo>=0 && d.lo<d.hi && d.hi<=1)) throw bad_depth_range(p.id, d.lo, d.hi);
}

std::vector<population> default_populations() {
    using E = excitability;
    using T = top_class;
    using S = sub_class;
    const auto izhi = cell_model::izhi2007;

    return {
        {0,  E::E, T::IT,  S::other,  {0.10, 0.26}, linear_density(2e3), izhi},  // L2/3 IT
        {1,  E::E, T::IT,  S::other,  {0.26, 0.31}, linear_density(2e3), izhi},  // L4 IT
        {2,  E::E, T::IT,  S::other,  {0.31, 0.52}, linear_density(2e3), izhi},  // L5A IT
        {3,  E::E, T::IT,  S::other,  {0.52, 0.77}, linear_density(1e3), izhi},  // L5B IT
        {4,  E::E, T::PT,  S::other,  {0.52, 0.77}, constant_density(1e3), izhi},  // L5B PT
        {5,  E::E, T::IT,  S::other,  {0.77, 1.00}, constant_density(1e3), izhi},  // L6 IT
        {6,  E::I, T::Pva, S::Basket, {0.10, 0.31}, constant_density(0.5e3), izhi},  // L2/3 Pva (FS)
        {7,  E::I, T::Sst, S::Marti,  {0.10, 0.31}, constant_density(0.5e3), izhi},  // L2/3 Sst (LTS)
        {8,  E::I, T::Pva, S::Basket, {0.31, 0.77}, constant_density(0.5e3), izhi},  // L5 Pva (FS)
        {9,  E::I, T::Sst, S::Marti,  {0.31, 0.77}, constant_density(0.5e3), izhi},  // L5 Sst (LTS)
        {10, E::I, T::Pva, S::Basket, {0.77, 1.00}, constant_density(0.5e3), izhi},  // L6 Pva (FS)
        {11, E::I, T::Sst, S::Marti,  {0.77, 1.00}, constant_density(0.5e3), izhi},  // L6 Sst (LTS)
    };
}

std::ostream& operator<<(std::ostream& o, const population& p) {
    return o << util::pprintf("(population {} {} {} {} (depth {} {}) {} (cells {}))",
                              p.id, p.ei, p.top, p.sub, p.depth.lo, p.depth.hi, p.model, p.cell_gids.size());
}

} // namespace lam
