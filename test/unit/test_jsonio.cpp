#include <gtest/gtest.h>

#include <cstddef>
#include <fstream>
#include <sstream>
#include <string>

#include <laminar/labels.hpp>
#include <laminar/lamexcept.hpp>
#include <laminar/parameters.hpp>
#include <laminar/population.hpp>

#include <laminario/jsonio.hpp>

#include <nlohmann/json.hpp>

#ifndef DATADIR
#warning "DATADIR not set; defaulting to '.'"
#define DATADIR "."
#endif

using namespace laminario;
using nlohmann::json;

TEST(jsonio, parameters_defaults) {
    auto p = load_parameters(json::object());
    EXPECT_EQ(1., p.scale);
    EXPECT_EQ(1000., p.model_size);
    EXPECT_EQ(200., p.scale_conn_prob[1][1]);

    // Scale determines the defaults of the scale dependent fields.
    p = load_parameters(json{{"scale", 2}});
    EXPECT_EQ(2000., p.model_size);
    EXPECT_EQ(100., p.scale_conn_prob[0][0]);
}

TEST(jsonio, parameters) {
    auto j = R"({
        "seed": 17,
        "model-size": 500,
        "sparseness": 0.25,
        "toroidal": true,
        "min-delay": 1.5,
        "velocity": 250,
        "threshold": 0,
        "scale-conn-prob": [[1, 2], [3, 4]],
        "conn-falloff": [100, 150],
        "receptor-weight": [1, 0.5, 1, 1, 0]
    })"_json;

    auto p = load_parameters(j);
    EXPECT_EQ(17u, p.seed);
    EXPECT_EQ(500., p.model_size);
    EXPECT_EQ(0.25, p.sparseness);
    EXPECT_TRUE(p.toroidal);
    EXPECT_EQ(1.5, p.min_delay);
    EXPECT_EQ(250., p.velocity);
    EXPECT_EQ(0., p.threshold);
    EXPECT_EQ(3., p.scale_conn_prob[1][0]);
    EXPECT_EQ(150., p.conn_falloff[1]);
    EXPECT_EQ(0.5, p.receptor_weight[1]);

    // Round trip through write_json.
    auto q = load_parameters(write_json(p));
    EXPECT_EQ(write_json(p), write_json(q));
}

TEST(jsonio, parameter_errors) {
    EXPECT_THROW(load_parameters(json{{"seeed", 3}}), jsonio_unused_input);
    EXPECT_THROW(load_parameters(json{{"velocity", "fast"}}), jsonio_type_error);
    EXPECT_THROW(load_parameters(json{{"velocity", -1}}), lam::bad_parameter);
    EXPECT_THROW(load_parameters(json{{"scale", 0}}), lam::bad_parameter);
    EXPECT_THROW(load_parameters(json::array()), jsonio_type_error);
}

TEST(jsonio, populations) {
    auto j = R"([
        {"ei": "E", "top-class": "IT", "depth": [0.1, 0.26], "density": {"linear": 2000}},
        {"ei": "I", "top-class": "Sst", "sub-class": "Marti", "depth": [0.1, 0.31],
         "density": {"constant": 500}, "cell-model": "HH"},
        {"id": 2, "ei": "E", "top-class": "CT", "depth": [0.77, 1.0], "density": {"linear": [-100, 300]}}
    ])"_json;

    auto pops = load_populations(j);
    ASSERT_EQ(3u, pops.size());

    EXPECT_EQ(0u, pops[0].id);
    EXPECT_EQ(lam::excitability::E, pops[0].ei);
    EXPECT_EQ(lam::top_class::IT, pops[0].top);
    EXPECT_EQ(lam::sub_class::other, pops[0].sub);
    EXPECT_EQ(lam::cell_model::izhi2007, pops[0].model);
    EXPECT_DOUBLE_EQ(0.1, pops[0].depth.lo);
    EXPECT_DOUBLE_EQ(0.26, pops[0].depth.hi);
    EXPECT_DOUBLE_EQ(400., pops[0].density(0.2));

    EXPECT_EQ(1u, pops[1].id);
    EXPECT_EQ(lam::top_class::Sst, pops[1].top);
    EXPECT_EQ(lam::sub_class::Marti, pops[1].sub);
    EXPECT_EQ(lam::cell_model::hh, pops[1].model);
    EXPECT_EQ(500., pops[1].density(0.3));

    EXPECT_EQ(2u, pops[2].id);
    EXPECT_DOUBLE_EQ(210., pops[2].density(0.9));
}

TEST(jsonio, population_errors) {
    auto base = R"({"ei": "E", "top-class": "IT", "depth": [0.1, 0.26], "density": {"linear": 2000}})"_json;

    auto with = [&](const char* key, json value) {
        auto j = base;
        j[key] = std::move(value);
        return json::array({j});
    };
    auto without = [&](const char* key) {
        auto j = base;
        j.erase(key);
        return json::array({j});
    };

    EXPECT_NO_THROW(load_populations(json::array({base})));

    EXPECT_THROW(load_populations(with("top-class", "ITT")), jsonio_bad_label);
    EXPECT_THROW(load_populations(with("ei", "X")), jsonio_bad_label);
    EXPECT_THROW(load_populations(with("cell-model", "LIF")), jsonio_bad_label);
    EXPECT_THROW(load_populations(with("colour", "red")), jsonio_unused_input);
    EXPECT_THROW(load_populations(with("density", json{{"cubic", 1}})), jsonio_bad_density);
    EXPECT_THROW(load_populations(with("density", json{{"constant", 1}, {"linear", 2}})), jsonio_bad_density);
    EXPECT_THROW(load_populations(with("density", 5)), jsonio_bad_density);
    EXPECT_THROW(load_populations(with("depth", json::array({0.3, 0.1}))), lam::bad_depth_range);
    EXPECT_THROW(load_populations(with("depth", "deep")), jsonio_type_error);

    EXPECT_THROW(load_populations(without("ei")), jsonio_missing_field);
    EXPECT_THROW(load_populations(without("top-class")), jsonio_missing_field);
    EXPECT_THROW(load_populations(without("depth")), jsonio_missing_field);
    EXPECT_THROW(load_populations(without("density")), jsonio_missing_field);

    EXPECT_THROW(load_populations(base), jsonio_type_error);
}

TEST(jsonio, network_description) {
    std::stringstream in(R"({
        "parameters": {"seed": 5},
        "populations": [
            {"ei": "I", "top-class": "Pva", "depth": [0.1, 0.31], "density": {"constant": 500}}
        ]
    })");

    auto desc = load_network_description(in);
    EXPECT_EQ(5u, desc.parameters.seed);
    ASSERT_EQ(1u, desc.populations.size());
    EXPECT_EQ(lam::top_class::Pva, desc.populations[0].top);

    // Missing parts take the reference model.
    auto defaults = load_network_description(json::object());
    EXPECT_EQ(12u, defaults.populations.size());
    EXPECT_EQ(1u, defaults.parameters.seed);

    std::stringstream bad("{\"parameters\": ");
    EXPECT_THROW(load_network_description(bad), jsonio_error);

    EXPECT_THROW(load_network_description(json{{"cells", 3}}), jsonio_unused_input);
}

TEST(jsonio, reference_description) {
    std::ifstream in(DATADIR "/m1.json");
    ASSERT_TRUE(in) << "unable to open " DATADIR "/m1.json";

    auto desc = load_network_description(in);
    EXPECT_EQ(write_json(lam::default_parameters()), write_json(desc.parameters));

    auto expected = lam::default_populations();
    ASSERT_EQ(expected.size(), desc.populations.size());
    for (std::size_t i = 0; i<expected.size(); ++i) {
        const auto& e = expected[i];
        const auto& p = desc.populations[i];
        SCOPED_TRACE(i);

        EXPECT_EQ(e.id, p.id);
        EXPECT_EQ(e.ei, p.ei);
        EXPECT_EQ(e.top, p.top);
        EXPECT_EQ(e.sub, p.sub);
        EXPECT_EQ(e.model, p.model);
        EXPECT_DOUBLE_EQ(e.depth.lo, p.depth.lo);
        EXPECT_DOUBLE_EQ(e.depth.hi, p.depth.hi);
        for (double y: {e.depth.lo, 0.5*(e.depth.lo+e.depth.hi), e.depth.hi}) {
            EXPECT_DOUBLE_EQ(e.density(y), p.density(y));
        }
    }
}
