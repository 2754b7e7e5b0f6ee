#pragma once

#include <functional>
#include <vector>

#include <laminar/cell.hpp>
#include <laminar/common_types.hpp>
#include <laminar/parameters.hpp>
#include <laminar/population.hpp>
#include <laminar/warning.hpp>

namespace lam {

// Owns the population table and assigns gids to the cells of every
// population, in population order, for one partition.
//
// Every partition generates the same cell descriptions, so the manager can
// answer ownership and lookup queries for any gid in the network without
// communication.
class population_manager {
public:
    // Called once for each cell owned by this partition, immediately after
    // it has been generated.
    using cell_callback = std::function<void(const cell_description&)>;

    // Validates the table: population ids must be dense and equal to their
    // position in the table. Throws bad_population_table or bad_partition.
    population_manager(std::vector<population> pops,
                       const network_parameters& params,
                       partition_id_type partition = 0,
                       unsigned num_partitions = 1);

    // Generate the cells of all populations, threading the gid offset from
    // one population to the next. Returns warnings for empty populations.
    std::vector<generation_warning> generate(const cell_callback& on_local_cell = {});

    bool generated() const { return generated_; }

    cell_size_type num_cells() const;
    cell_size_type num_local_cells() const { return local_.size(); }

    const std::vector<population>& populations() const { return populations_; }
    const population& get_population(population_id_type id) const;

    // Every cell in the network, in gid order.
    const std::vector<cell_description>& cells() const { return cells_; }

    // Cells owned by this partition, in gid order.
    const std::vector<cell_description>& local_cells() const { return local_; }

    // The following throw bad_gid if gid is not in the network.
    const cell_description& cell(cell_gid_type gid) const;
    population_id_type population_of(cell_gid_type gid) const;
    partition_id_type gid_partition(cell_gid_type gid) const;
    bool is_local(cell_gid_type gid) const { return gid_partition(gid)==partition_; }

    // Gid range [first, last) of a population.
    cell_gid_type first_gid(population_id_type id) const;
    cell_gid_type last_gid(population_id_type id) const;

    partition_id_type partition() const { return partition_; }
    unsigned num_partitions() const { return num_partitions_; }

private:
    void check_gid(cell_gid_type gid) const;

    std::vector<population> populations_;
    network_parameters params_;
    partition_id_type partition_;
    unsigned num_partitions_;
    bool generated_ = false;

    // offsets_[i] is the first gid of population i, offsets_.back() the number of cells.
    std::vector<cell_gid_type> offsets_;
    std::vector<cell_description> cells_;
    std::vector<cell_description> local_;
};

} // namespace lam
