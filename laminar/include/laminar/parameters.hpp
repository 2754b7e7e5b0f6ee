#pragma once

#include <array>
#include <iosfwd>

#include <laminar/common_types.hpp>
#include <laminar/labels.hpp>

namespace lam {

// Scale factors indexed by [presynaptic excitability][postsynaptic excitability].
using excitability_matrix = std::array<std::array<double, num_excitabilities>, num_excitabilities>;

// Per-receptor values, indexed by receptor.
using receptor_vector = std::array<double, num_receptors>;

// Global simulation and biological parameters.
//
// A network_parameters value is read-only input to every stage of network
// generation; construct it once (see default_parameters()), validate it, and
// pass it by const reference.
struct network_parameters {
    // Size of the simulation in thousands of cells.
    double scale = 1;

    // Duration of the simulation [ms] and the integration time step [ms].
    time_type duration = 1000;
    time_type dt = 0.5;

    // Global random seed; all random streams are derived from it.
    seed_type seed = 1;

    // Side length of the square model footprint [µm].
    double model_size = 1000;

    // Fraction of cells represented.
    double sparseness = 1;

    // Thickness of the cortex [µm], used to convert depth fractions to distances.
    double cortical_thickness = 1740;

    // Resolution at which density functions are sampled to find their maximum.
    depth_type depth_interval = 0.001;

    // Connection probability scale factors for EE, EI, IE and II pairs.
    excitability_matrix scale_conn_prob = {{{200, 200}, {200, 200}}};

    // Connection weight scale factors for EE, EI, IE and II pairs.
    excitability_matrix scale_conn_weight = {{{8, 4}, {8, 0.4}}};

    // Connection length constants [µm] for E and I presynaptic cells.
    std::array<double, num_excitabilities> conn_falloff = {200, 300};

    // Scale factor for each receptor.
    receptor_vector receptor_weight = {1, 1, 1, 1, 1};

    // Treat the model footprint as periodic.
    bool toroidal = false;

    // Minimum connection delay [ms] and conduction velocity [µm/ms].
    time_type min_delay = 2;
    double velocity = 100;

    // Spike detection threshold registered with each cell.
    double threshold = 10;
};

// Reference model parameters for a network of the given scale: the
// connection probability scale and the footprint follow the scale so that
// cell density stays fixed.
network_parameters default_parameters(double scale = 1);

// Throws bad_parameter naming the first field that is out of range.
void validate(const network_parameters&);

std::ostream& operator<<(std::ostream&, const network_parameters&);

} // namespace lam
