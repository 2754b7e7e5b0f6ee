#include <iostream>

#include <laminar/warning.hpp>

#include "util/strprintf.hpp"

namespace lam {

generation_warning empty_population_warning(population_id_type pop) {
    generation_warning w{warning_kind::empty_population,
        util::pprintf("population {} has no cells", pop)};
    w.pop = pop;
    return w;
}

generation_warning unconnected_class_pair_warning(top_class pre, top_class post) {
    generation_warning w{warning_kind::unconnected_class_pair,
        util::pprintf("no connections were made from {} to {} cells", pre, post)};
    w.pre = pre;
    w.post = post;
    return w;
}

std::ostream& operator<<(std::ostream& o, const generation_warning& w) {
    return o << "warning: " << w.message;
}

} // namespace lam
