#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include <laminar/cell.hpp>
#include <laminar/common_types.hpp>
#include <laminar/connectivity.hpp>
#include <laminar/context.hpp>
#include <laminar/engine.hpp>
#include <laminar/labels.hpp>
#include <laminar/parameters.hpp>
#include <laminar/population.hpp>
#include <laminar/warning.hpp>

namespace lam {

// Number of connections indexed by [pre top class][post top class].
using class_pair_counts = std::array<std::array<std::uint64_t, num_top_classes>, num_top_classes>;

// The part of a generated network owned by one partition.
struct network {
    // Total number of cells, and cells per population, over all partitions.
    cell_size_type num_cells = 0;
    std::vector<cell_size_type> population_sizes;

    // Cells owned by this partition, in gid order.
    std::vector<cell_description> cells;

    // Connections onto local cells, grouped by target in gid order.
    std::vector<connection> connections;

    // Local connection counts; summed over partitions they give the
    // network totals used for the unconnected class pair warnings.
    class_pair_counts class_connections = {};

    std::vector<generation_warning> warnings;
};

// Generate the cells of every population, register the locally owned cells
// and all connections onto them with the engine, and collect warnings.
//
// Warnings are forwarded to on_warning, if given, as they are found and
// also returned in network::warnings. Configuration errors are thrown.
network build_network(std::vector<population> pops,
                      const connectivity_rules& rules,
                      const network_parameters& params,
                      const context& ctx,
                      engine& eng,
                      const warning_callback& on_warning = {});

} // namespace lam
