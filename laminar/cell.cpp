#include <iostream>

#include <laminar/cell.hpp>

#include "util/strprintf.hpp"

namespace lam {

bool operator==(const cell_description& a, const cell_description& b) {
    return a.gid==b.gid && a.pop==b.pop && a.ei==b.ei && a.top==b.top && a.sub==b.sub
        && a.depth==b.depth && a.location.x==b.location.x && a.location.z==b.location.z
        && a.model==b.model;
}

bool operator!=(const cell_description& a, const cell_description& b) {
    return !(a==b);
}

std::ostream& operator<<(std::ostream& o, const cell_description& c) {
    return o << util::pprintf("(cell {} (pop {}) {} {} {} (depth {:.4f}) (location {:.1f} {:.1f}) {})",
                              c.gid, c.pop, c.ei, c.top, c.sub, c.depth, c.location.x, c.location.z, c.model);
}

} // namespace lam
