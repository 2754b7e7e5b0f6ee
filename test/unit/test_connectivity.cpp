#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <random>
#include <vector>

#include <laminar/cell.hpp>
#include <laminar/connectivity.hpp>
#include <laminar/parameters.hpp>
#include <laminar/population.hpp>
#include <laminar/population_manager.hpp>

using namespace lam;

namespace {
cell_description make_cell(cell_gid_type gid, top_class top, depth_type depth, double x, double z) {
    cell_description c;
    c.gid = gid;
    c.top = top;
    c.ei = (top==top_class::Pva || top==top_class::Sst)? excitability::I: excitability::E;
    c.depth = depth;
    c.location = {x, z};
    return c;
}

// A tenth of the reference network, with probabilities low enough that
// the random draws decide most connections.
network_parameters sparse_parameters() {
    network_parameters p;
    p.sparseness = 0.1;
    for (auto& row: p.scale_conn_prob) row.fill(0.5);
    return p;
}

// All cells of the reference network.
std::vector<cell_description> reference_cells(const network_parameters& params) {
    population_manager m(default_populations(), params);
    m.generate();
    return m.cells();
}

std::vector<connection> sorted_by_source(std::vector<connection> v) {
    std::sort(v.begin(), v.end(), [](const auto& a, const auto& b) { return a.source<b.source; });
    return v;
}
}

TEST(connectivity, default_probability_rules) {
    auto rules = default_connectivity_rules();
    using T = top_class;

    EXPECT_DOUBLE_EQ(0.1*0.2 + 0.1/0.5, rules.probability(T::IT, T::IT)(0.2, 0.5));
    EXPECT_DOUBLE_EQ(0.2*0.6, rules.probability(T::IT, T::PT)(0.6, 0.5));
    EXPECT_EQ(0., rules.probability(T::IT, T::PT)(0.3, 0.5));
    EXPECT_EQ(0., rules.probability(T::IT, T::PT)(0.9, 0.5));
    EXPECT_EQ(1., rules.probability(T::IT, T::Sst)(0.2, 0.5));

    EXPECT_EQ(0., rules.probability(T::PT, T::IT)(0.6, 0.2));
    EXPECT_EQ(0., rules.probability(T::PT, T::CT)(0.6, 0.9));
    EXPECT_EQ(1., rules.probability(T::PT, T::PT)(0.6, 0.6));
    EXPECT_EQ(0., rules.probability(T::CT, T::PT)(0.9, 0.6));
    EXPECT_EQ(1., rules.probability(T::CT, T::IT)(0.9, 0.6));

    for (auto post: {T::IT, T::PT, T::CT, T::Pva, T::Sst}) {
        EXPECT_EQ(1., rules.probability(T::Pva, post)(0.3, 0.3));
        EXPECT_EQ(1., rules.probability(T::Sst, post)(0.3, 0.3));
    }

    // HTR is not part of the reference model.
    for (std::size_t i = 0; i<num_top_classes; ++i) {
        EXPECT_EQ(0., rules.probability(T::HTR, T(i))(0.5, 0.5));
        EXPECT_EQ(0., rules.probability(T(i), T::HTR)(0.5, 0.5));
    }
}

TEST(connectivity, default_weight_rules) {
    auto rules = default_connectivity_rules();
    using T = top_class;
    using R = receptor;

    EXPECT_EQ(1., rules.weight(T::IT, T::Pva, R::AMPA)(0.2, 0.2));
    EXPECT_EQ(0., rules.weight(T::IT, T::Pva, R::NMDA)(0.2, 0.2));
    EXPECT_EQ(0., rules.weight(T::PT, T::IT, R::AMPA)(0.6, 0.2));
    EXPECT_EQ(1., rules.weight(T::PT, T::Sst, R::AMPA)(0.6, 0.2));
    EXPECT_EQ(0., rules.weight(T::CT, T::PT, R::AMPA)(0.9, 0.6));
    EXPECT_EQ(1., rules.weight(T::CT, T::CT, R::AMPA)(0.9, 0.9));

    EXPECT_EQ(1., rules.weight(T::Pva, T::IT, R::GABAA)(0.2, 0.2));
    EXPECT_EQ(0., rules.weight(T::Pva, T::IT, R::GABAB)(0.2, 0.2));
    EXPECT_EQ(0., rules.weight(T::Pva, T::IT, R::AMPA)(0.2, 0.2));
    EXPECT_EQ(1., rules.weight(T::Sst, T::PT, R::GABAB)(0.2, 0.6));
    EXPECT_EQ(0., rules.weight(T::Sst, T::PT, R::GABAA)(0.2, 0.6));

    for (std::size_t r = 0; r<num_receptors; ++r) {
        EXPECT_EQ(0., rules.weight(T::IT, T::IT, R::opsin)(0.2, 0.2));
        EXPECT_EQ(0., rules.weight(T::HTR, T::IT, R(r))(0.2, 0.2));
    }
}

TEST(connectivity, unset_rules_are_zero) {
    connectivity_rules rules;
    EXPECT_EQ(0., rules.probability(top_class::IT, top_class::IT)(0.3, 0.4));
    EXPECT_EQ(0., rules.weight(top_class::Sst, top_class::CT, receptor::GABAB)(0.3, 0.4));

    rules.set_probability(top_class::IT, top_class::PT, [](depth_type x, depth_type y) { return x*y; });
    EXPECT_DOUBLE_EQ(0.12, rules.probability(top_class::IT, top_class::PT)(0.3, 0.4));

    // An empty function resets the entry.
    rules.set_probability(top_class::IT, top_class::PT, nullptr);
    EXPECT_EQ(0., rules.probability(top_class::IT, top_class::PT)(0.3, 0.4));

    network_parameters params;
    auto a = make_cell(0, top_class::IT, 0.2, 500, 500);
    auto b = make_cell(1, top_class::IT, 0.2, 500, 500);
    EXPECT_TRUE(connect({a}, b, rules, params).empty());
}

TEST(connectivity, distance) {
    network_parameters params;
    auto a = make_cell(0, top_class::IT, 0.2, 10, 100);
    auto b = make_cell(1, top_class::IT, 0.3, 990, 100);

    auto d = distance(a, b, params);
    EXPECT_DOUBLE_EQ(980., d.planar);
    EXPECT_NEAR(std::sqrt(980.*980. + 174.*174.), d.spatial, 1e-9);

    params.toroidal = true;
    d = distance(a, b, params);
    EXPECT_DOUBLE_EQ(20., d.planar);
    EXPECT_NEAR(std::sqrt(20.*20. + 174.*174.), d.spatial, 1e-9);

    // Wrapping applies to each axis separately.
    auto c = make_cell(2, top_class::IT, 0.2, 40, 970);
    d = distance(a, c, params);
    EXPECT_DOUBLE_EQ(std::hypot(30., 130.), d.planar);

    // Symmetric, and zero for coincident cells.
    EXPECT_DOUBLE_EQ(distance(a, b, params).planar, distance(b, a, params).planar);
    EXPECT_EQ(0., distance(a, a, params).spatial);
}

TEST(connectivity, probability) {
    auto rules = default_connectivity_rules();
    network_parameters params;

    auto pre = make_cell(3, top_class::Pva, 0.2, 100, 100);
    auto post = make_cell(8, top_class::IT, 0.3, 100, 250);

    // I->E: scale 200, rule 1, falloff 300.
    double p = connection_probability(pre, post, 150., rules, params);
    EXPECT_DOUBLE_EQ(200.*std::exp(-150./300.), p);

    // A cell never connects to itself.
    EXPECT_EQ(0., connection_probability(post, post, 0., rules, params));
}

TEST(connectivity, zero_distance_scenario) {
    connectivity_rules rules;
    rules.set_probability(top_class::IT, top_class::IT, [](depth_type, depth_type) { return 1.; });

    network_parameters params;
    params.scale_conn_prob[0][0] = 1;
    params.conn_falloff[0] = 200;

    auto post = make_cell(0, top_class::IT, 0.3, 250, 250);
    std::vector<cell_description> candidates;
    for (cell_gid_type gid = 1; gid<=100; ++gid) {
        candidates.push_back(make_cell(gid, top_class::IT, 0.3, 250, 250));
    }

    EXPECT_EQ(1., connection_probability(candidates[0], post, 0., rules, params));

    for (seed_type seed: {1u, 2u, 3u}) {
        params.seed = seed;
        auto conns = connect(candidates, post, rules, params);
        EXPECT_EQ(candidates.size(), conns.size());
    }

    // Barring the cell itself.
    candidates.push_back(post);
    EXPECT_EQ(100u, connect(candidates, post, rules, params).size());
}

TEST(connectivity, weights) {
    auto rules = default_connectivity_rules();
    network_parameters params;
    params.receptor_weight = {1, 1, 1, 0.5, 1};

    auto it = make_cell(0, top_class::IT, 0.2, 0, 0);
    auto pva = make_cell(1, top_class::Pva, 0.2, 0, 0);
    auto sst = make_cell(2, top_class::Sst, 0.2, 0, 0);

    weight_vector ei = {4, 0, 0, 0, 0};
    EXPECT_EQ(ei, connection_weights(it, pva, rules, params));

    weight_vector ie = {0, 0, 8, 0, 0};
    EXPECT_EQ(ie, connection_weights(pva, it, rules, params));

    weight_vector ii = {0, 0, 0, 0.2, 0};
    EXPECT_EQ(ii, connection_weights(sst, pva, rules, params));
}

TEST(connectivity, network_properties) {
    network_parameters params;
    params.sparseness = 0.1;
    auto rules = default_connectivity_rules();
    auto cells = reference_cells(params);
    ASSERT_GT(cells.size(), 100u);

    std::size_t total = 0;
    for (std::size_t i = 0; i<cells.size(); i += 7) {
        const auto& post = cells[i];
        for (const auto& c: connect(cells, post, rules, params)) {
            ++total;
            EXPECT_EQ(post.gid, c.target);
            EXPECT_NE(c.source, c.target);
            EXPECT_GE(c.delay, params.min_delay);
            EXPECT_EQ(num_receptors, c.weights.size());
            for (auto w: c.weights) EXPECT_GE(w, 0.);

            const auto& pre = cells[c.source];
            auto d = distance(pre, post, params);
            EXPECT_DOUBLE_EQ(params.min_delay + d.planar/params.velocity, c.delay);
            EXPECT_EQ(connection_weights(pre, post, rules, params), c.weights);
        }
    }
    EXPECT_GT(total, 0u);
}

TEST(connectivity, decision_matches_draw) {
    auto params = sparse_parameters();
    auto rules = default_connectivity_rules();
    auto cells = reference_cells(params);
    const auto& post = cells[cells.size()/2];

    auto conns = connect(cells, post, rules, params);
    std::size_t k = 0;
    for (const auto& pre: cells) {
        double p = connection_probability(pre, post, distance(pre, post, params).planar, rules, params);
        bool made = p>connection_draw(params.seed, pre.gid, post.gid);
        if (made) {
            ASSERT_LT(k, conns.size());
            EXPECT_EQ(pre.gid, conns[k++].source);
        }
    }
    EXPECT_EQ(conns.size(), k);
    EXPECT_GT(k, 0u);
}

TEST(connectivity, candidate_order_independence) {
    auto params = sparse_parameters();
    auto rules = default_connectivity_rules();
    auto cells = reference_cells(params);

    std::mt19937 gen(42);
    for (std::size_t i = 0; i<cells.size(); i += 11) {
        const auto& post = cells[i];
        auto expected = connect(cells, post, rules, params);

        auto reversed = cells;
        std::reverse(reversed.begin(), reversed.end());
        EXPECT_EQ(expected, sorted_by_source(connect(reversed, post, rules, params)));

        auto shuffled = cells;
        std::shuffle(shuffled.begin(), shuffled.end(), gen);
        EXPECT_EQ(expected, sorted_by_source(connect(shuffled, post, rules, params)));
    }
}

TEST(connectivity, empty_candidates) {
    network_parameters params;
    auto post = make_cell(0, top_class::IT, 0.3, 250, 250);
    EXPECT_TRUE(connect({}, post, default_connectivity_rules(), params).empty());
}
