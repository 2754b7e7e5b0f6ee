#include <cmath>
#include <iostream>
#include <string>

#include <fmt/ranges.h>

#include <laminar/lamexcept.hpp>
#include <laminar/parameters.hpp>

#include "util/strprintf.hpp"

namespace lam {

network_parameters default_parameters(double scale) {
    if (!(scale>0)) throw bad_parameter("scale", "must be positive");

    network_parameters p;
    p.scale = scale;
    p.model_size = 1000*scale;
    for (auto& row: p.scale_conn_prob) {
        for (auto& x: row) x = 200/scale;
    }
    return p;
}

namespace {
void check(bool ok, const char* name, const char* msg) {
    if (!ok) throw bad_parameter(name, msg);
}

bool finite(double x) { return std::isfinite(x); }
} // namespace

void validate(const network_parameters& p) {
    check(finite(p.scale) && p.scale>0, "scale", "must be positive");
    check(finite(p.duration) && p.duration>=0, "duration", "must be non-negative");
    check(finite(p.dt) && p.dt>0, "dt", "must be positive");
    check(finite(p.model_size) && p.model_size>0, "model-size", "must be positive");
    check(finite(p.sparseness) && p.sparseness>0 && p.sparseness<=1, "sparseness", "must be in (0, 1]");
    check(finite(p.cortical_thickness) && p.cortical_thickness>0, "cortical-thickness", "must be positive");
    check(finite(p.depth_interval) && p.depth_interval>0 && p.depth_interval<=1, "depth-interval", "must be in (0, 1]");
    for (auto& row: p.scale_conn_prob) {
        for (auto x: row) check(finite(x) && x>=0, "scale-conn-prob", "entries must be non-negative");
    }
    for (auto& row: p.scale_conn_weight) {
        for (auto x: row) check(finite(x), "scale-conn-weight", "entries must be finite");
    }
    for (auto x: p.conn_falloff) check(finite(x) && x>0, "conn-falloff", "length constants must be positive");
    for (auto x: p.receptor_weight) check(finite(x), "receptor-weight", "entries must be finite");
    check(finite(p.min_delay) && p.min_delay>=0, "min-delay", "must be non-negative");
    check(finite(p.velocity) && p.velocity>0, "velocity", "must be positive");
    check(finite(p.threshold), "threshold", "must be finite");
}

std::ostream& operator<<(std::ostream& o, const network_parameters& p) {
    return o << util::pprintf(
        "(network-parameters (scale {}) (seed {}) (model-size {}) (sparseness {}) "
        "(cortical-thickness {}) (toroidal {}) (min-delay {}) (velocity {}) "
        "(scale-conn-prob {}) (scale-conn-weight {}) (conn-falloff {}) (receptor-weight {}))",
        p.scale, p.seed, p.model_size, p.sparseness,
        p.cortical_thickness, p.toroidal, p.min_delay, p.velocity,
        fmt::join(p.scale_conn_prob, " "), fmt::join(p.scale_conn_weight, " "),
        fmt::join(p.conn_falloff, " "), fmt::join(p.receptor_weight, " "));
}

} // namespace lam
