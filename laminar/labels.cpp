#include <iostream>
#include <optional>
#include <string_view>

#include <laminar/common_types.hpp>
#include <laminar/labels.hpp>

namespace lam {

namespace {
constexpr std::string_view receptor_names[num_receptors] = {
    "AMPA", "NMDA", "GABAA", "GABAB", "opsin"
};

constexpr std::string_view excitability_names[num_excitabilities] = {
    "E", "I"
};

constexpr std::string_view top_class_names[num_top_classes] = {
    "IT", "PT", "CT", "HTR", "Pva", "Sst"
};

constexpr std::string_view sub_class_names[num_sub_classes] = {
    "L4", "other", "Vip", "Nglia", "Basket", "Chand", "Marti", "L4Sst"
};

constexpr std::string_view cell_model_names[num_cell_models] = {
    "Izhi2007", "Friesen", "HH"
};

template <typename E, std::size_t N>
std::ostream& print_label(std::ostream& o, E e, const std::string_view (&names)[N]) {
    if (valid(e)) return o << names[index(e)];
    return o << "<invalid:" << index(e) << '>';
}

template <typename E, std::size_t N>
std::optional<E> find_label(std::string_view name, const std::string_view (&names)[N]) {
    for (std::size_t i = 0; i<N; ++i) {
        if (names[i]==name) return static_cast<E>(i);
    }
    return std::nullopt;
}
} // namespace

std::ostream& operator<<(std::ostream& o, receptor r) {
    return print_label(o, r, receptor_names);
}

std::ostream& operator<<(std::ostream& o, excitability e) {
    return print_label(o, e, excitability_names);
}

std::ostream& operator<<(std::ostream& o, top_class c) {
    return print_label(o, c, top_class_names);
}

std::ostream& operator<<(std::ostream& o, sub_class c) {
    return print_label(o, c, sub_class_names);
}

std::ostream& operator<<(std::ostream& o, cell_model m) {
    return print_label(o, m, cell_model_names);
}

std::optional<receptor> parse_receptor(std::string_view s) {
    return find_label<receptor>(s, receptor_names);
}

std::optional<excitability> parse_excitability(std::string_view s) {
    return find_label<excitability>(s, excitability_names);
}

std::optional<top_class> parse_top_class(std::string_view s) {
    return find_label<top_class>(s, top_class_names);
}

std::optional<sub_class> parse_sub_class(std::string_view s) {
    return find_label<sub_class>(s, sub_class_names);
}

std::optional<cell_model> parse_cell_model(std::string_view s) {
    return find_label<cell_model>(s, cell_model_names);
}

std::ostream& operator<<(std::ostream& o, const planar_point& p) {
    return o << '(' << p.x << ", " << p.z << ')';
}

} // namespace lam
