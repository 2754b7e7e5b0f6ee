#include <memory>
#include <string>
#include <vector>

#include <laminar/lamexcept.hpp>

#include "distributed_context.hpp"

namespace lam {

// Emulates one rank of a distributed run. Every partition computes the
// same cell descriptions, so only the collectives are missing: they see
// this partition's contribution alone.
struct partition_context_impl {
    explicit partition_context_impl(partition_id_type index, unsigned count):
        index_(index), count_(count) {}

    template <typename T>
    std::vector<T> gather(T value, int) const {
        return {std::move(value)};
    }

    int id() const { return index_; }

    int size() const { return count_; }

    template <typename T>
    T min(T value) const { return value; }

    template <typename T>
    T max(T value) const { return value; }

    template <typename T>
    T sum(T value) const { return value; }

    void barrier() const {}

    std::string name() const { return "partition"; }

    partition_id_type index_;
    unsigned count_;
};

distributed_context_handle make_partition_context(partition_id_type index, unsigned count) {
    if (count==0 || index>=count) {
        throw bad_partition(index, count);
    }
    return std::make_shared<distributed_context>(partition_context_impl(index, count));
}

} // namespace lam
