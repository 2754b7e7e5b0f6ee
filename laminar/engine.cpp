#include <memory>

#include <laminar/engine.hpp>
#include <laminar/lamexcept.hpp>

#include "util/strprintf.hpp"

namespace lam {

unit& recording_engine::make_unit(const cell_description& cell, double threshold) {
    units_.push_back(lam::make_unit(cell, threshold));
    return *units_.back();
}

void recording_engine::add_source(cell_gid_type gid, partition_id_type partition, unit& u, double threshold) {
    if (u.gid()!=gid) {
        throw laminar_internal_error(util::pprintf("source gid {} registered with the unit of cell {}", gid, u.gid()));
    }
    if (!source_units_.emplace(gid, &u).second) {
        throw laminar_internal_error(util::pprintf("source gid {} registered twice", gid));
    }
    sources_.push_back({gid, partition, threshold});
}

void recording_engine::add_connection(cell_gid_type pre_gid, unit& post, time_type delay, const weight_vector& weights) {
    if (!find_unit(post.gid())) {
        throw unit_not_local(post.gid());
    }
    connections_.push_back({pre_gid, post.gid(), delay, weights});
}

const unit* recording_engine::find_unit(cell_gid_type gid) const {
    auto it = source_units_.find(gid);
    return it==source_units_.end()? nullptr: it->second;
}

} // namespace lam
