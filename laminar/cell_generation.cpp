#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

#include <laminar/cell_generation.hpp>
#include <laminar/lamexcept.hpp>
#include <laminar/util/hash_def.hpp>

#include "util/cbrng.hpp"
#include "util/strprintf.hpp"

namespace lam {

using util::rand_stream;
using util::uniform_rand;

generated_cells generate_cells(const population& pop,
                               const network_parameters& params,
                               cell_gid_type first_gid,
                               partition_id_type partition,
                               unsigned num_partitions)
{
    if (num_partitions==0 || partition>=num_partitions) {
        throw bad_partition(partition, num_partitions);
    }
    validate(pop);

    const auto& range = pop.depth;

    auto density_at = [&](depth_type y) {
        const double d = pop.density(y);
        if (!(d>=0)) throw bad_density(pop.id, y, d);
        return d;
    };

    generated_cells result;
    result.first_gid = first_gid;

    const double footprint = params.model_size/1e3;
    result.volume = params.scale*params.sparseness*footprint*footprint
                  * (range.thickness()*params.cortical_thickness/1e3);

    // Upper bound on the density from a fine sampling of the depth range.
    for (std::size_t k = 0; ; ++k) {
        const depth_type y = range.lo + k*params.depth_interval;
        if (y>=range.hi) break;
        result.max_density = std::max(result.max_density, density_at(y));
    }

    // Each population draws from its own streams; the population id is
    // known to every partition.
    const auto key = hash_value(params.seed, pop.id);

    // Rejection sampling: keep candidate i with probability density/max_density.
    std::vector<depth_type> depths;
    if (result.max_density>0) {
        // Candidate count and every gid must fit in cell_gid_type.
        const double candidates = std::floor(result.volume*result.max_density);
        const double gid_limit = std::numeric_limits<cell_gid_type>::max();
        if (!(candidates<=gid_limit-first_gid)) {
            throw bad_parameter("scale", util::pprintf(
                "population {} would need {} candidate cells from gid {}, more than the gid type can index",
                pop.id, candidates, first_gid));
        }
        result.max_cells = static_cast<cell_size_type>(candidates);
        for (cell_size_type i = 0; i<result.max_cells; ++i) {
            const depth_type y = range.lo + range.thickness()*uniform_rand(key, rand_stream::cell_depth, i);
            const double accept = density_at(y)/result.max_density;
            if (uniform_rand(key, rand_stream::cell_acceptance, i)<accept) {
                depths.push_back(y);
            }
        }
    }

    const cell_size_type n = depths.size();
    result.next_gid = first_gid + n;
    result.cells.reserve(n);
    result.local.reserve(n/num_partitions + 1);

    for (cell_size_type i = 0; i<n; ++i) {
        cell_description c;
        c.gid = first_gid + i;
        c.pop = pop.id;
        c.ei = pop.ei;
        c.top = pop.top;
        c.sub = pop.sub;
        c.depth = depths[i];
        c.location.x = params.model_size*uniform_rand(key, rand_stream::cell_location, 2*std::uint64_t(i));
        c.location.z = params.model_size*uniform_rand(key, rand_stream::cell_location, 2*std::uint64_t(i)+1);
        c.model = pop.model;

        if (cell_partition(i, num_partitions)==partition) {
            result.local.push_back(c);
        }
        result.cells.push_back(c);
    }

    return result;
}

} // namespace lam
