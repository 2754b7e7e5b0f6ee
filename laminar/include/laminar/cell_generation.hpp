#pragma once

#include <vector>

#include <laminar/cell.hpp>
#include <laminar/common_types.hpp>
#include <laminar/parameters.hpp>
#include <laminar/population.hpp>

namespace lam {

// Result of generating the cells of one population.
struct generated_cells {
    // Every cell of the population in gid order. Identical on all partitions.
    std::vector<cell_description> cells;

    // The subset of cells owned by the requesting partition.
    std::vector<cell_description> local;

    // Gid of the first cell and the gid offset for the next population.
    cell_gid_type first_gid = 0;
    cell_gid_type next_gid = 0;

    // Intermediate quantities of the density based pruning.
    double volume = 0;              // [mm³]
    double max_density = 0;         // [cells/mm³]
    cell_size_type max_cells = 0;   // number of candidates drawn

    cell_size_type num_cells() const { return next_gid-first_gid; }
};

// Partition that owns the i-th cell (in generation order) of a population.
inline partition_id_type cell_partition(cell_size_type i, unsigned num_partitions) {
    return i%num_partitions;
}

// Generate the cells of a population.
//
// Candidate depths are drawn uniformly over the population's depth range and
// pruned by rejection sampling against the density function. All draws come
// from random streams keyed only by the global seed, so every partition
// computes the same ordered cell list; cell i is assigned gid first_gid+i and
// is owned by partition i mod num_partitions.
//
// Throws bad_partition if partition >= num_partitions, bad_density if the
// density function is negative anywhere it is evaluated, and the validation
// errors of validate(population).
generated_cells generate_cells(const population& pop,
                               const network_parameters& params,
                               cell_gid_type first_gid,
                               partition_id_type partition,
                               unsigned num_partitions);

} // namespace lam
