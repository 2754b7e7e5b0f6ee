#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>
#include <vector>

#include <fmt/ranges.h>

#include <laminar/connectivity.hpp>
#include <laminar/util/hash_def.hpp>

#include "util/cbrng.hpp"
#include "util/strprintf.hpp"

namespace lam {

using util::rand_stream;
using util::uniform_rand;

bool operator==(const connection& a, const connection& b) {
    return a.source==b.source && a.target==b.target && a.delay==b.delay && a.weights==b.weights;
}

std::ostream& operator<<(std::ostream& o, const connection& c) {
    return o << util::pprintf("(connection {} {} (delay {}) (weights {}))",
                              c.source, c.target, c.delay, fmt::join(c.weights, " "));
}

namespace {
double zero_function(depth_type, depth_type) { return 0; }

depth_pair_function constant(double value) {
    return [value](depth_type, depth_type) { return value; };
}
} // namespace

connectivity_rules::connectivity_rules() {
    for (auto& row: prob_) row.fill(zero_function);
    for (auto& row: weight_) {
        for (auto& receptors: row) receptors.fill(zero_function);
    }
}

void connectivity_rules::set_probability(top_class pre, top_class post, depth_pair_function f) {
    prob_[index(pre)][index(post)] = f? std::move(f): depth_pair_function(zero_function);
}

void connectivity_rules::set_weight(top_class pre, top_class post, receptor r, depth_pair_function f) {
    weight_[index(pre)][index(post)][index(r)] = f? std::move(f): depth_pair_function(zero_function);
}

connectivity_rules default_connectivity_rules() {
    using T = top_class;
    using R = receptor;

    connectivity_rules rules;

    // Probabilities: x is the presynaptic depth, y the postsynaptic depth.
    rules.set_probability(T::IT, T::IT,  [](depth_type x, depth_type y) { return 0.1*x + 0.1/y; });
    rules.set_probability(T::IT, T::PT,  [](depth_type x, depth_type) { return x>0.5 && x<0.8? 0.2*x: 0.; });
    rules.set_probability(T::IT, T::CT,  constant(1));
    rules.set_probability(T::IT, T::Pva, constant(1));
    rules.set_probability(T::IT, T::Sst, constant(1));
    rules.set_probability(T::PT, T::PT,  constant(1));
    rules.set_probability(T::PT, T::Pva, constant(1));
    rules.set_probability(T::PT, T::Sst, constant(1));
    rules.set_probability(T::CT, T::IT,  constant(1));
    rules.set_probability(T::CT, T::CT,  constant(1));
    rules.set_probability(T::CT, T::Pva, constant(1));
    rules.set_probability(T::CT, T::Sst, constant(1));
    for (auto post: {T::IT, T::PT, T::CT, T::Pva, T::Sst}) {
        rules.set_probability(T::Pva, post, constant(1));
        rules.set_probability(T::Sst, post, constant(1));
    }

    // Weights: excitatory classes act through AMPA, Pva through GABAA and
    // Sst through GABAB. PT and CT do not project to IT or to each other.
    for (auto post: {T::IT, T::PT, T::CT, T::Pva, T::Sst}) {
        rules.set_weight(T::IT, post, R::AMPA, constant(1));
        rules.set_weight(T::Pva, post, R::GABAA, constant(1));
        rules.set_weight(T::Sst, post, R::GABAB, constant(1));
    }
    for (auto post: {T::PT, T::Pva, T::Sst}) {
        rules.set_weight(T::PT, post, R::AMPA, constant(1));
    }
    for (auto post: {T::IT, T::CT, T::Pva, T::Sst}) {
        rules.set_weight(T::CT, post, R::AMPA, constant(1));
    }

    return rules;
}

cell_distance distance(const cell_description& a, const cell_description& b,
                       const network_parameters& params)
{
    auto axis = [&params](double u, double v) {
        double d = std::abs(u-v);
        if (params.toroidal) d = std::min(d, params.model_size-d);
        return d;
    };

    const double dx = axis(a.location.x, b.location.x);
    const double dz = axis(a.location.z, b.location.z);
    const double dy = (a.depth-b.depth)*params.cortical_thickness;

    return {std::sqrt(dx*dx + dz*dz), std::sqrt(dx*dx + dy*dy + dz*dz)};
}

double connection_probability(const cell_description& pre, const cell_description& post,
                              double planar_distance,
                              const connectivity_rules& rules,
                              const network_parameters& params)
{
    if (pre.gid==post.gid) return 0;

    const auto ei_pre = index(pre.ei);
    const auto ei_post = index(post.ei);
    const auto& f = rules.probability(pre.top, post.top);

    return params.scale_conn_prob[ei_pre][ei_post]
         * f(pre.depth, post.depth)
         * std::exp(-planar_distance/params.conn_falloff[ei_pre]);
}

weight_vector connection_weights(const cell_description& pre, const cell_description& post,
                                 const connectivity_rules& rules,
                                 const network_parameters& params)
{
    const double pair_scale = params.scale_conn_weight[index(pre.ei)][index(post.ei)];

    weight_vector w;
    for (std::size_t r = 0; r<num_receptors; ++r) {
        const auto& f = rules.weight(pre.top, post.top, receptor(r));
        w[r] = pair_scale*f(pre.depth, post.depth)*params.receptor_weight[r];
    }
    return w;
}

double connection_draw(seed_type seed, cell_gid_type pre, cell_gid_type post) {
    return uniform_rand(hash_value(seed, post), rand_stream::connection_selection, pre);
}

std::vector<connection> connect(const std::vector<cell_description>& candidates,
                                const cell_description& post,
                                const connectivity_rules& rules,
                                const network_parameters& params)
{
    std::vector<connection> connections;

    // One key per postsynaptic cell; the candidate gid selects the draw.
    const auto key = hash_value(params.seed, post.gid);

    for (const auto& pre: candidates) {
        const auto d = distance(pre, post, params);
        const double p = connection_probability(pre, post, d.planar, rules, params);
        if (p>uniform_rand(key, rand_stream::connection_selection, pre.gid)) {
            connections.push_back({pre.gid, post.gid,
                                   params.min_delay + d.planar/params.velocity,
                                   connection_weights(pre, post, rules, params)});
        }
    }

    return connections;
}

} // namespace lam
