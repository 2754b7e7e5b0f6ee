#pragma once

#include <string>
#include <utility>
#include <vector>

namespace lam {

struct local_context {
    int id() const {
        return 0;
    }

    int size() const {
        return 1;
    }

    template <typename T>
    T min(T value) const {
        return value;
    }

    template <typename T>
    T max(T value) const {
        return value;
    }

    template <typename T>
    T sum(T value) const {
        return value;
    }

    template <typename T>
    std::vector<T> gather(T value, int) const {
        return {std::move(value)};
    }

    void barrier() const {}

    std::string name() const {
        return "local";
    }
};

} // namespace lam
