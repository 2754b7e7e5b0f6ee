#include <string>

#include <laminar/common_types.hpp>
#include <laminar/lamexcept.hpp>

#include "util/strprintf.hpp"

namespace lam {

using util::pprintf;

laminar_exception::laminar_exception(const std::string& what):
    std::runtime_error{what}
{}

laminar_internal_error::laminar_internal_error(const std::string& what):
    std::logic_error(what)
{}

bad_parameter::bad_parameter(const std::string& name, const std::string& msg):
    laminar_exception(pprintf("Invalid network parameter {}: {}.", name, msg)),
    name(name)
{}

bad_depth_range::bad_depth_range(population_id_type pop, depth_type lo, depth_type hi):
    laminar_exception(pprintf("Population {}: depth range [{}, {}) must satisfy 0 <= lo < hi <= 1.", pop, lo, hi)),
    pop(pop), lo(lo), hi(hi)
{}

bad_density::bad_density(population_id_type pop, depth_type depth, double density):
    laminar_exception(pprintf("Population {}: density function is negative ({}) at depth {}.", pop, density, depth)),
    pop(pop), depth(depth), density(density)
{}

bad_cell_model::bad_cell_model(cell_model model):
    laminar_exception(pprintf("Cell model {} is not implemented.", model)),
    model(model)
{}

bad_cell_model::bad_cell_model(cell_model model, cell_gid_type gid):
    laminar_exception(pprintf("Cell {}: cell model {} is not implemented.", gid, model)),
    model(model)
{}

bad_population_table::bad_population_table(population_id_type pop, const std::string& msg):
    laminar_exception(pprintf("Invalid population table entry {}: {}.", pop, msg)),
    pop(pop)
{}

bad_partition::bad_partition(partition_id_type index, unsigned count):
    laminar_exception(pprintf("Partition index {} is not in the range [0, {}).", index, count)),
    index(index), count(count)
{}

bad_gid::bad_gid(cell_gid_type gid, cell_size_type num_cells):
    laminar_exception(pprintf("Cell gid {} is out of range: there are only {} cells in the network.", gid, num_cells)),
    gid(gid), num_cells(num_cells)
{}

unit_not_local::unit_not_local(cell_gid_type gid):
    laminar_exception(pprintf("Cell {} has no unit registered on this partition.", gid)),
    gid(gid)
{}

} // namespace lam
