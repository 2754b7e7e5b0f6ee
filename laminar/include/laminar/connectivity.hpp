#pragma once

#include <array>
#include <functional>
#include <iosfwd>
#include <vector>

#include <laminar/cell.hpp>
#include <laminar/common_types.hpp>
#include <laminar/labels.hpp>
#include <laminar/parameters.hpp>

namespace lam {

// A function of (presynaptic depth, postsynaptic depth).
using depth_pair_function = std::function<double(depth_type, depth_type)>;

// Synaptic weight for each receptor kind.
using weight_vector = std::array<double, num_receptors>;

// A realized synapse onto a cell owned by the local partition.
struct connection {
    cell_gid_type source = 0;
    cell_gid_type target = 0;
    time_type delay = 0;
    weight_vector weights = {};
};

bool operator==(const connection&, const connection&);

std::ostream& operator<<(std::ostream&, const connection&);

// Class-pair tables of connection probability and weight functions.
//
// Dense tables indexed by (pre top class, post top class) for probabilities
// and (pre top class, post top class, receptor) for weights. Entries that
// are not set evaluate to zero, so that pair never connects.
class connectivity_rules {
public:
    connectivity_rules();

    void set_probability(top_class pre, top_class post, depth_pair_function f);
    void set_weight(top_class pre, top_class post, receptor r, depth_pair_function f);

    const depth_pair_function& probability(top_class pre, top_class post) const {
        return prob_[index(pre)][index(post)];
    }

    const depth_pair_function& weight(top_class pre, top_class post, receptor r) const {
        return weight_[index(pre)][index(post)][index(r)];
    }

private:
    using pair_row = std::array<depth_pair_function, num_top_classes>;
    using receptor_row = std::array<depth_pair_function, num_receptors>;

    std::array<pair_row, num_top_classes> prob_;
    std::array<std::array<receptor_row, num_top_classes>, num_top_classes> weight_;
};

// Connection rules of the reference M1 model.
connectivity_rules default_connectivity_rules();

// Distances between two cells [µm].
struct cell_distance {
    // Distance in the plane of the footprint, periodic if the model is toroidal.
    double planar = 0;

    // Distance including the depth difference scaled by the cortical thickness.
    double spatial = 0;
};

cell_distance distance(const cell_description& a, const cell_description& b,
                       const network_parameters& params);

// Probability that pre connects to post; zero if they are the same cell.
// Values above one are possible and mean the connection is always made.
double connection_probability(const cell_description& pre, const cell_description& post,
                              double planar_distance,
                              const connectivity_rules& rules,
                              const network_parameters& params);

weight_vector connection_weights(const cell_description& pre, const cell_description& post,
                                 const connectivity_rules& rules,
                                 const network_parameters& params);

// Uniform [0, 1) value used to decide whether pre connects to post.
// Depends only on the global seed and the two gids.
double connection_draw(seed_type seed, cell_gid_type pre, cell_gid_type post);

// Generate the connections from a set of candidate presynaptic cells onto
// the locally owned cell post. Connections are returned in candidate order.
//
// The decision for each candidate depends only on the global seed, the
// postsynaptic gid and the candidate's gid, so the realized set does not
// depend on candidate order or on how cells are distributed.
std::vector<connection> connect(const std::vector<cell_description>& candidates,
                                const cell_description& post,
                                const connectivity_rules& rules,
                                const network_parameters& params);

} // namespace lam
