#pragma once

#include <iosfwd>
#include <memory>

#include <laminar/cell.hpp>
#include <laminar/common_types.hpp>
#include <laminar/labels.hpp>

namespace lam {

// Parameters of the Izhikevich (2007) simple model:
//
//   C dv/dt = k (v - vr)(v - vt) - u + I
//     du/dt = a (b (v - vr) - u)
//
// with reset v <- c, u <- u + d when v >= vpeak.
struct izhikevich_parameters {
    double C;     // Membrane capacitance [pF].
    double k;     // Scale of the quadratic term [nS/mV].
    double vr;    // Resting potential [mV].
    double vt;    // Instantaneous threshold potential [mV].
    double vpeak; // Spike cutoff [mV].
    double a;     // Recovery time constant [1/ms].
    double b;     // Recovery sensitivity [nS].
    double c;     // Voltage reset [mV].
    double d;     // Recovery increment [pA].
};

bool operator==(const izhikevich_parameters&, const izhikevich_parameters&);

// Regular spiking (layer 5 pyramidal), fast spiking and low-threshold
// spiking interneuron parameter sets.
izhikevich_parameters izhikevich_rs();
izhikevich_parameters izhikevich_fs();
izhikevich_parameters izhikevich_lts();

// Parameter set used for a point-process cell of the given top class.
izhikevich_parameters izhikevich_for(top_class c);

// Geometry of the single compartment of a section-based unit [µm].
struct soma_section {
    double length = 20;
    double diameter = 20;
};

// A simulatable unit: the object a simulation engine integrates for a
// single cell. Only its spike output is visible to the network generator.
class unit {
public:
    virtual ~unit() = default;

    cell_gid_type gid() const { return gid_; }
    cell_model model() const { return model_; }
    double threshold() const { return threshold_; }

    // True if the unit's state is a membrane voltage on a section, false
    // for a point process.
    virtual bool has_section() const = 0;

    // An event is emitted when the state crosses the threshold from below.
    bool crossed(double previous_state, double state) const {
        return previous_state<threshold_ && state>=threshold_;
    }

protected:
    unit(cell_gid_type gid, cell_model model, double threshold):
        gid_(gid), model_(model), threshold_(threshold)
    {}

private:
    cell_gid_type gid_;
    cell_model model_;
    double threshold_;
};

class point_unit: public unit {
public:
    point_unit(cell_gid_type gid, double threshold, izhikevich_parameters params):
        unit(gid, cell_model::izhi2007, threshold), params_(params)
    {}

    bool has_section() const override { return false; }
    const izhikevich_parameters& parameters() const { return params_; }

private:
    izhikevich_parameters params_;
};

class section_unit: public unit {
public:
    section_unit(cell_gid_type gid, cell_model model, double threshold, soma_section soma = {}):
        unit(gid, model, threshold), soma_(soma)
    {}

    bool has_section() const override { return true; }
    const soma_section& soma() const { return soma_; }

private:
    soma_section soma_;
};

// Instantiate the unit for a cell according to its cell model.
// Throws bad_cell_model if the model is not one of the known kinds.
std::unique_ptr<unit> make_unit(const cell_description& cell, double threshold);

std::ostream& operator<<(std::ostream&, const unit&);

} // namespace lam
