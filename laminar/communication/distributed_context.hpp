#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <laminar/common_types.hpp>

#include "local_context.hpp"

namespace lam {

#define LAM_PUBLIC_COLLECTIVES_(T) \
    T min(T value) const { return impl_->min(value); }\
    T max(T value) const { return impl_->max(value); }\
    T sum(T value) const { return impl_->sum(value); }\
    std::vector<T> gather(T value, int root) const { return impl_->gather(value, root); }

#define LAM_INTERFACE_COLLECTIVES_(T) \
    virtual T min(T value) const = 0;\
    virtual T max(T value) const = 0;\
    virtual T sum(T value) const = 0;\
    virtual std::vector<T> gather(T value, int root) const = 0;

#define LAM_WRAP_COLLECTIVES_(T) \
    T min(T value) const override { return wrapped.min(value); }\
    T max(T value) const override { return wrapped.max(value); }\
    T sum(T value) const override { return wrapped.sum(value); }\
    std::vector<T> gather(T value, int root) const override { return wrapped.gather(value, root); }

// distributed_context
//
// Defines the concept/interface for a distributed communication context.
//
// Uses value-semantic type erasure to define the interface, so that
// types that implement the interface can use duck-typing, without having
// to inherit from distributed_context.
//
// For the simplest example of a distributed_context implementation,
// see local_context, which is the default context.

class distributed_context {
public:
    // default constructor uses a local context
    distributed_context(): distributed_context(local_context()) {}

    template <typename Impl>
    distributed_context(Impl&& impl):
        impl_(new wrap<Impl>(std::forward<Impl>(impl)))
    {}

    distributed_context(distributed_context&& other) = default;
    distributed_context& operator=(distributed_context&& other) = default;

    int id() const {
        return impl_->id();
    }

    int size() const {
        return impl_->size();
    }

    void barrier() const {
        impl_->barrier();
    }

    std::string name() const {
        return impl_->name();
    }

    LAM_PUBLIC_COLLECTIVES_(double)
    LAM_PUBLIC_COLLECTIVES_(std::uint32_t)
    LAM_PUBLIC_COLLECTIVES_(std::uint64_t)

private:
    struct interface {
        virtual int id() const = 0;
        virtual int size() const = 0;
        virtual void barrier() const = 0;
        virtual std::string name() const = 0;

        LAM_INTERFACE_COLLECTIVES_(double)
        LAM_INTERFACE_COLLECTIVES_(std::uint32_t)
        LAM_INTERFACE_COLLECTIVES_(std::uint64_t)

        virtual ~interface() {}
    };

    template <typename Impl>
    struct wrap: interface {
        explicit wrap(const Impl& impl): wrapped(impl) {}
        explicit wrap(Impl&& impl): wrapped(std::move(impl)) {}

        int id() const override {
            return wrapped.id();
        }
        int size() const override {
            return wrapped.size();
        }
        void barrier() const override {
            wrapped.barrier();
        }
        std::string name() const override {
            return wrapped.name();
        }

        LAM_WRAP_COLLECTIVES_(double)
        LAM_WRAP_COLLECTIVES_(std::uint32_t)
        LAM_WRAP_COLLECTIVES_(std::uint64_t)

        Impl wrapped;
    };

    std::unique_ptr<interface> impl_;
};

using distributed_context_handle = std::shared_ptr<distributed_context>;

inline distributed_context_handle make_local_context() {
    return std::make_shared<distributed_context>();
}

// One partition of count, with no communication: collectives return the
// local contribution only.
distributed_context_handle make_partition_context(partition_id_type index, unsigned count);

template <typename MPICommType>
distributed_context_handle make_mpi_context(MPICommType);

} // namespace lam
