#pragma once

#include <string>
#include <system_error>

#include <mpi.h>

namespace lam {

class mpi_error_category_impl;
const mpi_error_category_impl& mpi_error_category();

class mpi_error_category_impl: public std::error_category {
    const char* name() const noexcept override;
    std::string message(int) const override;
    std::error_condition default_error_condition(int) const noexcept override;
};

// Raised with the MPI error code when an MPI call fails.
struct mpi_error: std::system_error {
    explicit mpi_error(int mpi_err):
        std::system_error(mpi_err, mpi_error_category()) {}

    mpi_error(int mpi_err, const std::string& what_arg):
        std::system_error(mpi_err, mpi_error_category(), what_arg) {}
};

} // namespace lam
