#pragma once

// printf-like routines that return std::string.
//
// Placeholders follow the fmt syntax ("{}", "{:.2f}", ...). Label enums and
// other types with only a stream operator are formatted via operator<<.

#include <string>
#include <utility>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <laminar/common_types.hpp>
#include <laminar/labels.hpp>

#define LAM_FMT_VIA_OSTREAM(T) \
template <> struct fmt::formatter<T>: fmt::ostream_formatter {};

LAM_FMT_VIA_OSTREAM(lam::receptor)
LAM_FMT_VIA_OSTREAM(lam::excitability)
LAM_FMT_VIA_OSTREAM(lam::top_class)
LAM_FMT_VIA_OSTREAM(lam::sub_class)
LAM_FMT_VIA_OSTREAM(lam::cell_model)
LAM_FMT_VIA_OSTREAM(lam::planar_point)

namespace lam {
namespace util {

template <typename... Args>
std::string pprintf(const char* s, Args&&... args) {
    return fmt::format(fmt::runtime(s), std::forward<Args>(args)...);
}

} // namespace util
} // namespace lam
