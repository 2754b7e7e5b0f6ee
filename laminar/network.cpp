#include <array>
#include <cstdint>
#include <unordered_map>
#include <utility>
#include <vector>

#include <laminar/connectivity.hpp>
#include <laminar/engine.hpp>
#include <laminar/lamexcept.hpp>
#include <laminar/network.hpp>
#include <laminar/population_manager.hpp>

#include "execution_context.hpp"

namespace lam {

network build_network(std::vector<population> pops,
                      const connectivity_rules& rules,
                      const network_parameters& params,
                      const context& ctx,
                      engine& eng,
                      const warning_callback& on_warning)
{
    validate(params);

    const auto& dist = ctx->distributed;
    const partition_id_type partition = dist->id();

    network net;
    auto report = [&](generation_warning w) {
        if (on_warning) on_warning(w);
        net.warnings.push_back(std::move(w));
    };

    population_manager manager(std::move(pops), params, partition, dist->size());

    // Units are instantiated and registered as soon as each cell exists.
    std::unordered_map<cell_gid_type, unit*> units;
    auto generation_warnings = manager.generate(
        [&](const cell_description& c) {
            unit& u = eng.make_unit(c, params.threshold);
            eng.add_source(c.gid, partition, u, params.threshold);
            units[c.gid] = &u;
        });
    for (auto& w: generation_warnings) {
        report(std::move(w));
    }

    net.num_cells = manager.num_cells();
    for (population_id_type id = 0; id<manager.populations().size(); ++id) {
        net.population_sizes.push_back(manager.last_gid(id)-manager.first_gid(id));
    }
    net.cells = manager.local_cells();

    // Every cell in the network is a candidate presynaptic cell.
    const auto& candidates = manager.cells();
    for (const auto& post: net.cells) {
        unit& target = *units.at(post.gid);
        for (auto& c: connect(candidates, post, rules, params)) {
            eng.add_connection(c.source, target, c.delay, c.weights);
            const auto pre_top = manager.cell(c.source).top;
            ++net.class_connections[index(pre_top)][index(post.top)];
            net.connections.push_back(std::move(c));
        }
    }

    // Class pairs with cells on both sides that were never connected on
    // any partition. Every partition sees the same cells, so all of them
    // take part in the same sequence of reductions.
    std::array<bool, num_top_classes> present = {};
    for (const auto& c: candidates) {
        present[index(c.top)] = true;
    }
    for (std::size_t pre = 0; pre<num_top_classes; ++pre) {
        if (!present[pre]) continue;
        for (std::size_t post = 0; post<num_top_classes; ++post) {
            if (!present[post]) continue;
            const std::uint64_t total = dist->sum(net.class_connections[pre][post]);
            if (total==0) {
                report(unconnected_class_pair_warning(top_class(pre), top_class(post)));
            }
        }
    }

    return net;
}

} // namespace lam
