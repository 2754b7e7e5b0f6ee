#pragma once

/*
 * Common definitions for index types etc. across the network generator.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <limits>
#include <type_traits>

namespace lam {

// For identifying cells globally.

using cell_gid_type = std::uint32_t;

// For sizes of collections of cells.

using cell_size_type = std::make_unsigned_t<cell_gid_type>;

// For identifying populations in the population table.

using population_id_type = std::uint32_t;

// For identifying the compute partition (rank) that owns a cell.

using partition_id_type = unsigned;

// For storing time values [ms]

using time_type = double;
constexpr time_type terminal_time = std::numeric_limits<time_type>::max();

// Normalized cortical depth in [0, 1]: 0 is the pial surface, 1 the white matter.

using depth_type = double;

// Planar location of a cell in the model footprint [µm].
// The cortical depth axis is y, so the plane is spanned by x and z.

struct planar_point {
    double x = 0;
    double z = 0;
};

// Seed used by the counter-based random number generators.

using seed_type = std::uint64_t;

std::ostream& operator<<(std::ostream& o, const planar_point& p);

} // namespace lam
