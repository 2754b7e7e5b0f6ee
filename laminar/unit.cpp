#include <iostream>
#include <memory>

#include <laminar/lamexcept.hpp>
#include <laminar/unit.hpp>

#include "util/strprintf.hpp"

namespace lam {

bool operator==(const izhikevich_parameters& l, const izhikevich_parameters& r) {
    return l.C==r.C && l.k==r.k && l.vr==r.vr && l.vt==r.vt && l.vpeak==r.vpeak
        && l.a==r.a && l.b==r.b && l.c==r.c && l.d==r.d;
}

// Values from Izhikevich, Dynamical Systems in Neuroscience (2007), ch. 8.

izhikevich_parameters izhikevich_rs() {
    return {100, 0.7, -60, -40, 35, 0.03, -2, -50, 100};
}

izhikevich_parameters izhikevich_fs() {
    return {20, 1, -55, -40, 25, 0.2, -2, -45, -55};
}

izhikevich_parameters izhikevich_lts() {
    return {100, 1, -56, -42, 40, 0.03, 8, -53, 20};
}

izhikevich_parameters izhikevich_for(top_class c) {
    switch (c) {
    case top_class::IT:
    case top_class::PT:
    case top_class::CT:
    case top_class::HTR:
        return izhikevich_rs();
    case top_class::Pva:
        return izhikevich_fs();
    case top_class::Sst:
        return izhikevich_lts();
    }
    throw laminar_internal_error(util::pprintf("no Izhikevich parameters for top class {}", c));
}

std::unique_ptr<unit> make_unit(const cell_description& cell, double threshold) {
    switch (cell.model) {
    case cell_model::izhi2007:
        return std::make_unique<point_unit>(cell.gid, threshold, izhikevich_for(cell.top));
    case cell_model::friesen:
    case cell_model::hh:
        return std::make_unique<section_unit>(cell.gid, cell.model, threshold);
    }
    throw bad_cell_model(cell.model, cell.gid);
}

std::ostream& operator<<(std::ostream& o, const unit& u) {
    return o << util::pprintf("(unit {} {} (threshold {}){})",
                              u.gid(), u.model(), u.threshold(), u.has_section()? " (section soma)": "");
}

} // namespace lam
