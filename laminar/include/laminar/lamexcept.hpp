#pragma once

#include <stdexcept>
#include <string>

#include <laminar/common_types.hpp>
#include <laminar/labels.hpp>

// Laminar-specific exception hierarchy.

namespace lam {

// Laminar internal logic error (if these are thrown,
// there is a bug in the library.)

struct laminar_internal_error: std::logic_error {
    laminar_internal_error(const std::string&);
};

// Common base-class for laminar run-time errors.

struct laminar_exception: std::runtime_error {
    laminar_exception(const std::string&);
};

// Configuration errors:

struct bad_parameter: laminar_exception {
    bad_parameter(const std::string& name, const std::string& msg);
    std::string name;
};

struct bad_depth_range: laminar_exception {
    bad_depth_range(population_id_type pop, depth_type lo, depth_type hi);
    population_id_type pop;
    depth_type lo, hi;
};

struct bad_density: laminar_exception {
    bad_density(population_id_type pop, depth_type depth, double density);
    population_id_type pop;
    depth_type depth;
    double density;
};

struct bad_cell_model: laminar_exception {
    explicit bad_cell_model(cell_model model);
    bad_cell_model(cell_model model, cell_gid_type gid);
    cell_model model;
};

struct bad_population_table: laminar_exception {
    bad_population_table(population_id_type pop, const std::string& msg);
    population_id_type pop;
};

// Distribution errors:

struct bad_partition: laminar_exception {
    bad_partition(partition_id_type index, unsigned count);
    partition_id_type index;
    unsigned count;
};

struct bad_gid: laminar_exception {
    bad_gid(cell_gid_type gid, cell_size_type num_cells);
    cell_gid_type gid;
    cell_size_type num_cells;
};

struct unit_not_local: laminar_exception {
    explicit unit_not_local(cell_gid_type gid);
    cell_gid_type gid;
};

} // namespace lam
