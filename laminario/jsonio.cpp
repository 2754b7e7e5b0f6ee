#include <array>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <laminar/labels.hpp>
#include <laminar/parameters.hpp>
#include <laminar/population.hpp>

#include <laminario/jsonio.hpp>

#include "json_helpers.hpp"

namespace laminario {

using lam::excitability_matrix;
using lam::receptor_vector;

void throw_if_not_empty(const nlohmann::json& json) {
    if (!json.empty()) {
        throw jsonio_unused_input(json.begin().key());
    }
}

namespace {

nlohmann::json as_object(const nlohmann::json& j, const char* what) {
    if (!j.is_object()) {
        throw jsonio_type_error(what, "expected an object");
    }
    return j;
}

template <typename E>
std::optional<E> load_label(const char* field, nlohmann::json& j,
                            std::optional<E> (*parse)(std::string_view))
{
    auto name = find_and_remove_json<std::string>(field, j);
    if (!name) return std::nullopt;

    if (auto label = parse(*name)) return label;
    throw jsonio_bad_label(field, *name);
}

lam::density_function load_density(nlohmann::json j) {
    if (!j.is_object()) {
        throw jsonio_bad_density("expected an object with a \"constant\" or \"linear\" field");
    }
    if (j.size()!=1) {
        throw jsonio_bad_density("expected exactly one of \"constant\" and \"linear\"");
    }

    if (auto d = find_and_remove_json<double>("constant", j)) {
        return lam::constant_density(*d);
    }

    auto it = j.find("linear");
    if (it==j.end()) {
        throw jsonio_bad_density("unknown density kind \""+j.begin().key()+"\"");
    }
    if (it->is_array()) {
        auto coeffs = find_and_remove_json<std::array<double, 2>>("linear", j);
        return lam::linear_density((*coeffs)[0], (*coeffs)[1]);
    }
    auto slope = find_and_remove_json<double>("linear", j);
    return lam::linear_density(*slope);
}

lam::population load_population(const nlohmann::json& json, lam::population_id_type position) {
    auto j = as_object(json, "populations");
    lam::population p;

    p.id = find_and_remove_json<lam::population_id_type>("id", j).value_or(position);

    auto ei = load_label<lam::excitability>("ei", j, lam::parse_excitability);
    if (!ei) throw jsonio_missing_field("ei");
    p.ei = *ei;

    auto top = load_label<lam::top_class>("top-class", j, lam::parse_top_class);
    if (!top) throw jsonio_missing_field("top-class");
    p.top = *top;

    p.sub = load_label<lam::sub_class>("sub-class", j, lam::parse_sub_class).value_or(lam::sub_class::other);
    p.model = load_label<lam::cell_model>("cell-model", j, lam::parse_cell_model).value_or(lam::cell_model::izhi2007);

    auto depth = find_and_remove_required_json<std::array<double, 2>>("depth", j);
    p.depth = {depth[0], depth[1]};

    p.density = load_density(find_and_remove_required_json<nlohmann::json>("density", j));

    throw_if_not_empty(j);
    lam::validate(p);
    return p;
}

} // namespace

lam::network_parameters load_parameters(const nlohmann::json& json) {
    auto j = as_object(json, "parameters");

    auto scale = find_and_remove_json<double>("scale", j);
    auto params = lam::default_parameters(scale.value_or(1.));

    if (auto v = find_and_remove_json<double>("duration", j)) params.duration = *v;
    if (auto v = find_and_remove_json<double>("dt", j)) params.dt = *v;
    if (auto v = find_and_remove_json<lam::seed_type>("seed", j)) params.seed = *v;
    if (auto v = find_and_remove_json<double>("model-size", j)) params.model_size = *v;
    if (auto v = find_and_remove_json<double>("sparseness", j)) params.sparseness = *v;
    if (auto v = find_and_remove_json<double>("cortical-thickness", j)) params.cortical_thickness = *v;
    if (auto v = find_and_remove_json<double>("depth-interval", j)) params.depth_interval = *v;
    if (auto v = find_and_remove_json<excitability_matrix>("scale-conn-prob", j)) params.scale_conn_prob = *v;
    if (auto v = find_and_remove_json<excitability_matrix>("scale-conn-weight", j)) params.scale_conn_weight = *v;
    if (auto v = find_and_remove_json<std::array<double, lam::num_excitabilities>>("conn-falloff", j)) params.conn_falloff = *v;
    if (auto v = find_and_remove_json<receptor_vector>("receptor-weight", j)) params.receptor_weight = *v;
    if (auto v = find_and_remove_json<bool>("toroidal", j)) params.toroidal = *v;
    if (auto v = find_and_remove_json<double>("min-delay", j)) params.min_delay = *v;
    if (auto v = find_and_remove_json<double>("velocity", j)) params.velocity = *v;
    if (auto v = find_and_remove_json<double>("threshold", j)) params.threshold = *v;

    throw_if_not_empty(j);
    lam::validate(params);
    return params;
}

std::vector<lam::population> load_populations(const nlohmann::json& json) {
    if (!json.is_array()) {
        throw jsonio_type_error("populations", "expected an array");
    }

    std::vector<lam::population> pops;
    for (const auto& entry: json) {
        pops.push_back(load_population(entry, pops.size()));
    }
    return pops;
}

network_description load_network_description(const nlohmann::json& json) {
    auto j = as_object(json, "network");
    network_description desc;

    if (auto p = find_and_remove_json<nlohmann::json>("parameters", j)) {
        desc.parameters = load_parameters(*p);
    }
    else {
        desc.parameters = lam::default_parameters();
    }

    if (auto p = find_and_remove_json<nlohmann::json>("populations", j)) {
        desc.populations = load_populations(*p);
    }
    else {
        desc.populations = lam::default_populations();
    }

    throw_if_not_empty(j);
    return desc;
}

network_description load_network_description(std::istream& in) {
    nlohmann::json j;
    try {
        in >> j;
    }
    catch (nlohmann::json::parse_error& e) {
        throw jsonio_error(std::string("Unable to parse JSON: ")+e.what());
    }
    return load_network_description(j);
}

nlohmann::json write_json(const lam::network_parameters& params) {
    nlohmann::json j;
    j["scale"] = params.scale;
    j["duration"] = params.duration;
    j["dt"] = params.dt;
    j["seed"] = params.seed;
    j["model-size"] = params.model_size;
    j["sparseness"] = params.sparseness;
    j["cortical-thickness"] = params.cortical_thickness;
    j["depth-interval"] = params.depth_interval;
    j["scale-conn-prob"] = params.scale_conn_prob;
    j["scale-conn-weight"] = params.scale_conn_weight;
    j["conn-falloff"] = params.conn_falloff;
    j["receptor-weight"] = params.receptor_weight;
    j["toroidal"] = params.toroidal;
    j["min-delay"] = params.min_delay;
    j["velocity"] = params.velocity;
    j["threshold"] = params.threshold;
    return j;
}

jsonio_error::jsonio_error(const std::string& msg):
    laminar_exception(msg) {}

jsonio_unused_input::jsonio_unused_input(const std::string& key):
    jsonio_error("Unused input parameter: \"" + key + "\"")
{}

jsonio_missing_field::jsonio_missing_field(const std::string& field):
    jsonio_error("Missing \"" + field + "\" field.")
{}

jsonio_type_error::jsonio_type_error(const std::string& field, const std::string& err):
    jsonio_error("Field \"" + field + "\" has the wrong type: " + err)
{}

jsonio_bad_label::jsonio_bad_label(const std::string& field, const std::string& label):
    jsonio_error("Field \"" + field + "\": unknown label \"" + label + "\".")
{}

jsonio_bad_density::jsonio_bad_density(const std::string& err):
    jsonio_error("Invalid density: " + err)
{}

} // namespace laminario
