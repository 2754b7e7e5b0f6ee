#pragma once

#include <memory>
#include <unordered_map>
#include <vector>

#include <laminar/cell.hpp>
#include <laminar/common_types.hpp>
#include <laminar/connectivity.hpp>
#include <laminar/unit.hpp>

namespace lam {

// The capabilities a simulation engine offers to the network generator.
//
// The generator instantiates one unit per locally owned cell, registers it
// as a spike source, and then registers every connection that targets it.
// Units are owned by the engine; references returned by make_unit remain
// valid for the lifetime of the engine.
class engine {
public:
    virtual ~engine() = default;

    virtual unit& make_unit(const cell_description& cell, double threshold) = 0;

    // Associate gid with this partition, with spikes detected on u at threshold.
    virtual void add_source(cell_gid_type gid, partition_id_type partition, unit& u, double threshold) = 0;

    // Deliver spikes from the cell pre_gid, which may live on any partition,
    // to the local unit post.
    virtual void add_connection(cell_gid_type pre_gid, unit& post, time_type delay, const weight_vector& weights) = 0;
};

// An engine that records what it is asked to do.
class recording_engine: public engine {
public:
    struct source {
        cell_gid_type gid;
        partition_id_type partition;
        double threshold;
    };

    unit& make_unit(const cell_description& cell, double threshold) override;
    void add_source(cell_gid_type gid, partition_id_type partition, unit& u, double threshold) override;
    void add_connection(cell_gid_type pre_gid, unit& post, time_type delay, const weight_vector& weights) override;

    std::size_t num_units() const { return units_.size(); }
    const std::vector<source>& sources() const { return sources_; }
    const std::vector<connection>& connections() const { return connections_; }

    // Returns nullptr if no source has been registered for gid.
    const unit* find_unit(cell_gid_type gid) const;

private:
    std::vector<std::unique_ptr<unit>> units_;
    std::vector<source> sources_;
    std::vector<connection> connections_;
    std::unordered_map<cell_gid_type, const unit*> source_units_;
};

} // namespace lam
