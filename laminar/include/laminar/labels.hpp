#pragma once

// Symbolic names for the label axes used to classify cells and synapses.
//
// Every axis is a dense enumeration starting at zero; the values are used
// directly to index the class-pair connectivity tables, so each axis also
// exports its size.

#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string_view>

namespace lam {

// Synaptic receptor kinds; each carries its own weight component.
enum class receptor: unsigned char {
    AMPA, NMDA, GABAA, GABAB, opsin
};

enum class excitability: unsigned char {
    E, I
};

// Top-level class of a cell or population.
enum class top_class: unsigned char {
    IT, PT, CT, HTR, Pva, Sst
};

enum class sub_class: unsigned char {
    L4, other, Vip, Nglia, Basket, Chand, Marti, L4Sst
};

// Model used to instantiate the simulatable unit of a cell.
enum class cell_model: unsigned char {
    izhi2007, friesen, hh
};

constexpr std::size_t num_receptors = 5;
constexpr std::size_t num_excitabilities = 2;
constexpr std::size_t num_top_classes = 6;
constexpr std::size_t num_sub_classes = 8;
constexpr std::size_t num_cell_models = 3;

template <typename E>
constexpr std::size_t index(E e) {
    return static_cast<std::size_t>(e);
}

// Range checks for values that arrive as integers, e.g. from a
// configuration file or a cast.
constexpr bool valid(receptor r)     { return index(r)<num_receptors; }
constexpr bool valid(excitability e) { return index(e)<num_excitabilities; }
constexpr bool valid(top_class c)    { return index(c)<num_top_classes; }
constexpr bool valid(sub_class c)    { return index(c)<num_sub_classes; }
constexpr bool valid(cell_model m)   { return index(m)<num_cell_models; }

std::ostream& operator<<(std::ostream&, receptor);
std::ostream& operator<<(std::ostream&, excitability);
std::ostream& operator<<(std::ostream&, top_class);
std::ostream& operator<<(std::ostream&, sub_class);
std::ostream& operator<<(std::ostream&, cell_model);

// Look up a label by name, e.g. "GABAA", "Pva" or "Izhi2007".
// Returns an empty optional if the name is not known on that axis.
std::optional<receptor>     parse_receptor(std::string_view);
std::optional<excitability> parse_excitability(std::string_view);
std::optional<top_class>    parse_top_class(std::string_view);
std::optional<sub_class>    parse_sub_class(std::string_view);
std::optional<cell_model>   parse_cell_model(std::string_view);

} // namespace lam
