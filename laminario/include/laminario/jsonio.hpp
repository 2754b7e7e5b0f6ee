#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include <laminar/lamexcept.hpp>
#include <laminar/parameters.hpp>
#include <laminar/population.hpp>

#include <nlohmann/json.hpp>

namespace laminario {

struct jsonio_error: public lam::laminar_exception {
    jsonio_error(const std::string& msg);
};

// Input in JSON not used
struct jsonio_unused_input: jsonio_error {
    explicit jsonio_unused_input(const std::string& key);
};

struct jsonio_missing_field: jsonio_error {
    explicit jsonio_missing_field(const std::string& field);
};

// Value of a field has the wrong JSON type
struct jsonio_type_error: jsonio_error {
    jsonio_type_error(const std::string& field, const std::string& err);
};

// Label that does not name a value of its axis, e.g. an unknown top class
struct jsonio_bad_label: jsonio_error {
    jsonio_bad_label(const std::string& field, const std::string& label);
};

// Density description that is neither constant nor linear
struct jsonio_bad_density: jsonio_error {
    explicit jsonio_bad_density(const std::string& err);
};

// Network parameters: fields not present take the values of
// lam::default_parameters(scale), where scale is read first.
// The result is validated.
lam::network_parameters load_parameters(const nlohmann::json&);

// Population table from an array of population objects, e.g.
//
//   {"ei": "E", "top-class": "IT", "sub-class": "other", "depth": [0.1, 0.26],
//    "density": {"linear": 2000}, "cell-model": "Izhi2007"}
//
// "id" is optional and defaults to the position in the array; "sub-class"
// defaults to "other" and "cell-model" to "Izhi2007". A density is either
// {"constant": d} or {"linear": slope} or {"linear": [slope, intercept]}.
std::vector<lam::population> load_populations(const nlohmann::json&);

// A network description: {"parameters": {...}, "populations": [...]}.
// Both parts are optional; missing parts take the reference model values.
struct network_description {
    lam::network_parameters parameters;
    std::vector<lam::population> populations;
};

network_description load_network_description(const nlohmann::json&);
network_description load_network_description(std::istream&);

nlohmann::json write_json(const lam::network_parameters&);

} // namespace laminario
