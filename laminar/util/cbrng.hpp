#pragma once

// Counter-based random numbers.
//
// A value is a pure function of (key, stream, index): there is no generator
// state to advance, so the n-th draw of a stream can be computed on any
// partition, in any order, and always gives the same result.

#include <cstdint>

#include <Random123/threefry.h>
#include <Random123/uniform.hpp>

namespace lam {
namespace util {

// Partial keys for the independent random streams.
// Different values for each use to avoid unintentional correlation.
enum class rand_stream: std::uint64_t {
    cell_depth = 5930471,
    cell_acceptance = 240513,
    cell_location = 8861027,
    connection_selection = 1173659,
};

// Uniformly distributed value in [0, 1).
inline double uniform_rand(std::uint64_t key, rand_stream stream, std::uint64_t index) {
    using rand_type = r123::Threefry2x64;
    const rand_type::ctr_type ctr = {{index, 0}};
    const rand_type::key_type k = {{key, static_cast<std::uint64_t>(stream)}};
    rand_type gen;
    // u01 maps to (0, 1].
    return 1.0 - r123::u01<double>(gen(ctr, k)[0]);
}

} // namespace util
} // namespace lam
