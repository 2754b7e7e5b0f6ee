#include <algorithm>
#include <iterator>
#include <utility>
#include <vector>

#include <laminar/cell_generation.hpp>
#include <laminar/lamexcept.hpp>
#include <laminar/population_manager.hpp>

#include "util/strprintf.hpp"

namespace lam {

population_manager::population_manager(std::vector<population> pops,
                                       const network_parameters& params,
                                       partition_id_type partition,
                                       unsigned num_partitions):
    populations_(std::move(pops)),
    params_(params),
    partition_(partition),
    num_partitions_(num_partitions)
{
    if (num_partitions_==0 || partition_>=num_partitions_) {
        throw bad_partition(partition_, num_partitions_);
    }
    for (std::size_t i = 0; i<populations_.size(); ++i) {
        const auto& p = populations_[i];
        if (p.id!=i) {
            throw bad_population_table(p.id, util::pprintf("population id must equal its table position {}", i));
        }
        validate(p);
    }
}

std::vector<generation_warning> population_manager::generate(const cell_callback& on_local_cell) {
    if (generated_) {
        throw laminar_internal_error("population_manager::generate called twice");
    }

    std::vector<generation_warning> warnings;
    offsets_.clear();
    cell_gid_type next_gid = 0;

    for (auto& pop: populations_) {
        offsets_.push_back(next_gid);
        auto generated = generate_cells(pop, params_, next_gid, partition_, num_partitions_);

        if (generated.cells.empty()) {
            warnings.push_back(empty_population_warning(pop.id));
        }

        for (const auto& c: generated.local) {
            pop.cell_gids.push_back(c.gid);
            if (on_local_cell) on_local_cell(c);
        }

        std::move(generated.cells.begin(), generated.cells.end(), std::back_inserter(cells_));
        std::move(generated.local.begin(), generated.local.end(), std::back_inserter(local_));
        next_gid = generated.next_gid;
    }
    offsets_.push_back(next_gid);

    generated_ = true;
    return warnings;
}

cell_size_type population_manager::num_cells() const {
    return cells_.size();
}

const population& population_manager::get_population(population_id_type id) const {
    if (id>=populations_.size()) {
        throw bad_population_table(id, "no such population");
    }
    return populations_[id];
}

void population_manager::check_gid(cell_gid_type gid) const {
    if (gid>=num_cells()) throw bad_gid(gid, num_cells());
}

const cell_description& population_manager::cell(cell_gid_type gid) const {
    check_gid(gid);
    return cells_[gid];
}

population_id_type population_manager::population_of(cell_gid_type gid) const {
    check_gid(gid);
    // Last population whose first gid is not greater than gid; empty
    // populations share their offset with the next one.
    auto it = std::upper_bound(offsets_.begin(), offsets_.end()-1, gid);
    return population_id_type(std::distance(offsets_.begin(), it)-1);
}

partition_id_type population_manager::gid_partition(cell_gid_type gid) const {
    const auto pop = population_of(gid);
    return cell_partition(gid-offsets_[pop], num_partitions_);
}

cell_gid_type population_manager::first_gid(population_id_type id) const {
    get_population(id);
    if (!generated_) throw laminar_internal_error("population gids queried before generation");
    return offsets_[id];
}

cell_gid_type population_manager::last_gid(population_id_type id) const {
    get_population(id);
    if (!generated_) throw laminar_internal_error("population gids queried before generation");
    return offsets_[id+1];
}

} // namespace lam
